/**
 * @file cluster_config.hpp
 * @brief Typed cluster configuration built on top of the flat ConfigStore.
 *
 * Document shape (YAML shown, JSON/INI flatten to the same sections):
 * @code
 *   spec:
 *     api:      {address: 192.168.1.10, port: 6443, sans: [node1.lan]}
 *     storage:  {type: etcd, etcd: {peerAddress: 192.168.1.10}}
 *     network:  {podCIDR: 10.244.0.0/16, serviceCIDR: 10.96.0.0/12,
 *                provider: calico}
 *   telemetry:
 *     enabled: true
 * @endcode
 *
 * A ClusterConfig is immutable once loaded and must pass Validate() before
 * anything consumes it.
 */

#ifndef KCORE_CLUSTER_CONFIG_HPP_
#define KCORE_CLUSTER_CONFIG_HPP_

#include "kcore/config.hpp"
#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace kcore {

inline constexpr const char* kKineStorageType = "kine";
inline constexpr const char* kEtcdStorageType = "etcd";
inline constexpr const char* kCalicoProvider = "calico";

enum class ClusterConfigError : uint8_t {
  kParseError = 0,
  kInvalidCidr,
  kCidrTooSmall,
  kValidationFailed,
};

// ============================================================================
// IPv4 helpers
// ============================================================================

inline bool ParseIpv4(const std::string& s, uint32_t& out) noexcept {
  struct in_addr addr;
  if (::inet_pton(AF_INET, s.c_str(), &addr) != 1) return false;
  out = ntohl(addr.s_addr);
  return true;
}

inline std::string FormatIpv4(uint32_t host_order) {
  struct in_addr addr;
  addr.s_addr = htonl(host_order);
  char buf[INET_ADDRSTRLEN];
  if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) return std::string();
  return buf;
}

/// Parse "a.b.c.d/n" into the masked network base and prefix length.
inline bool ParseCidr(const std::string& s, uint32_t& base,
                      uint32_t& prefix) noexcept {
  size_t slash = s.find('/');
  if (slash == std::string::npos || slash + 1 >= s.size()) return false;
  uint32_t ip = 0;
  if (!ParseIpv4(s.substr(0, slash), ip)) return false;
  uint32_t n = 0;
  for (size_t i = slash + 1; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    n = n * 10U + static_cast<uint32_t>(s[i] - '0');
    if (n > 32U) return false;
  }
  uint32_t mask = (n == 0U) ? 0U : (0xFFFFFFFFU << (32U - n));
  base = ip & mask;
  prefix = n;
  return true;
}

/**
 * @brief First non-loopback IPv4 address of an interface that is up.
 * @return "127.0.0.1" when the host has none.
 */
inline std::string FirstPublicAddress() {
  struct ifaddrs* ifs = nullptr;
  if (::getifaddrs(&ifs) != 0) return "127.0.0.1";
  std::string result = "127.0.0.1";
  for (struct ifaddrs* it = ifs; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) continue;
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
    result = FormatIpv4(ntohl(sin->sin_addr.s_addr));
    break;
  }
  ::freeifaddrs(ifs);
  return result;
}

/// Split "a,b , c" into trimmed, non-empty items.
inline std::vector<std::string> SplitList(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t comma = s.find(',', start);
    if (comma == std::string::npos) comma = s.size();
    size_t b = start;
    size_t e = comma;
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    if (e > b) out.push_back(s.substr(b, e - b));
    start = comma + 1;
  }
  return out;
}

// ============================================================================
// Spec sections
// ============================================================================

struct ApiSpec {
  std::string address;
  uint16_t port = 6443;
  std::vector<std::string> sans;

  std::string Url() const { return "https://" + address + ":" + std::to_string(port); }
};

struct KineConfig {
  std::string data_source;
};

struct EtcdConfig {
  std::string peer_address;
};

struct StorageSpec {
  std::string type;  ///< "" and "kine" select kine, "etcd" selects etcd.
  KineConfig kine;
  EtcdConfig etcd;
};

struct NetworkSpec {
  std::string pod_cidr = "10.244.0.0/16";
  std::string service_cidr = "10.96.0.0/12";
  std::string provider = kCalicoProvider;

  /// Cluster DNS service address: the 10th address of the service CIDR.
  expected<std::string, ClusterConfigError> DNSAddress() const {
    return NthServiceAddress(10U);
  }

  /// In-cluster address of the "kubernetes" service (first of the CIDR).
  expected<std::string, ClusterConfigError> InternalApiAddress() const {
    return NthServiceAddress(1U);
  }

 private:
  expected<std::string, ClusterConfigError> NthServiceAddress(uint32_t n) const {
    uint32_t base = 0;
    uint32_t prefix = 0;
    if (!ParseCidr(service_cidr, base, prefix)) {
      return expected<std::string, ClusterConfigError>::error(
          ClusterConfigError::kInvalidCidr);
    }
    uint64_t host_count = 1ULL << (32U - prefix);
    if (static_cast<uint64_t>(n) + 1U >= host_count) {
      return expected<std::string, ClusterConfigError>::error(
          ClusterConfigError::kCidrTooSmall);
    }
    return expected<std::string, ClusterConfigError>::success(
        FormatIpv4(base + n));
  }
};

struct ClusterSpec {
  ApiSpec api;
  StorageSpec storage;
  NetworkSpec network;
};

struct TelemetrySpec {
  bool enabled = true;
};

// ============================================================================
// ClusterConfig
// ============================================================================

struct ClusterConfig {
  ClusterSpec spec;
  TelemetrySpec telemetry;

  /// Defaults for a node rooted at @p paths.
  static ClusterConfig Default(const Paths& paths) {
    ClusterConfig c;
    c.spec.api.address = FirstPublicAddress();
    c.spec.api.sans.push_back(c.spec.api.address);
    c.spec.storage.kine.data_source =
        "sqlite://" + paths.StateDir("kine") + "/state.db?mode=rwc&_journal=WAL";
    c.spec.storage.etcd.peer_address = c.spec.api.address;
    return c;
  }

  /// Overlay every key present in @p store on top of the defaults.
  static ClusterConfig FromStore(const ConfigStore& store, const Paths& paths) {
    ClusterConfig c = Default(paths);

    const char* address = store.GetString("spec.api", "address", "");
    if (address[0] != '\0') {
      c.spec.api.address = address;
      c.spec.storage.etcd.peer_address = address;
    }
    c.spec.api.port = store.GetPort("spec.api", "port", c.spec.api.port);
    c.spec.api.sans = SplitList(store.GetString("spec.api", "sans", ""));
    bool has_address = false;
    for (const auto& san : c.spec.api.sans) {
      if (san == c.spec.api.address) has_address = true;
    }
    if (!has_address) c.spec.api.sans.insert(c.spec.api.sans.begin(), c.spec.api.address);

    c.spec.storage.type = store.GetString("spec.storage", "type", "");
    c.spec.storage.kine.data_source = store.GetString(
        "spec.storage.kine", "dataSource", c.spec.storage.kine.data_source.c_str());
    c.spec.storage.etcd.peer_address = store.GetString(
        "spec.storage.etcd", "peerAddress", c.spec.storage.etcd.peer_address.c_str());

    c.spec.network.pod_cidr = store.GetString(
        "spec.network", "podCIDR", c.spec.network.pod_cidr.c_str());
    c.spec.network.service_cidr = store.GetString(
        "spec.network", "serviceCIDR", c.spec.network.service_cidr.c_str());
    c.spec.network.provider = store.GetString(
        "spec.network", "provider", c.spec.network.provider.c_str());

    c.telemetry.enabled = store.GetBool("telemetry", "enabled", c.telemetry.enabled);
    return c;
  }

  /**
   * @brief Check every field; returns one message per problem (empty = valid).
   */
  std::vector<std::string> Validate() const {
    std::vector<std::string> errors;
    uint32_t ip = 0;
    uint32_t base = 0;
    uint32_t prefix = 0;
    if (!ParseIpv4(spec.api.address, ip)) {
      errors.push_back("spec.api.address: '" + spec.api.address +
                       "' is not a valid IPv4 address");
    }
    if (spec.api.port == 0) {
      errors.push_back("spec.api.port: must be in 1..65535");
    }
    if (!ParseCidr(spec.network.pod_cidr, base, prefix)) {
      errors.push_back("spec.network.podCIDR: '" + spec.network.pod_cidr +
                       "' is not a valid CIDR");
    }
    if (!ParseCidr(spec.network.service_cidr, base, prefix)) {
      errors.push_back("spec.network.serviceCIDR: '" + spec.network.service_cidr +
                       "' is not a valid CIDR");
    }
    if (spec.network.provider.empty()) {
      errors.push_back("spec.network.provider: must not be empty");
    }
    if (spec.storage.type == kEtcdStorageType &&
        !ParseIpv4(spec.storage.etcd.peer_address, ip)) {
      errors.push_back("spec.storage.etcd.peerAddress: '" +
                       spec.storage.etcd.peer_address +
                       "' is not a valid IPv4 address");
    }
    return errors;
  }
};

/**
 * @brief Load, overlay and validate the cluster configuration at @p path.
 *
 * A missing file yields the defaults. Parse failures and validation
 * failures are configuration errors; every validation message is logged.
 */
inline expected<ClusterConfig, ClusterConfigError> LoadClusterConfig(
    const std::string& path, const Paths& paths) {
  ClusterConfig cfg;
  if (!FileExists(path)) {
    KCORE_LOG_INFO("Config", "%s not found, using default configuration",
                   path.c_str());
    cfg = ClusterConfig::Default(paths);
  } else {
    MultiConfig store;
    auto r = store.LoadFile(path.c_str());
    if (!r.has_value()) {
      KCORE_LOG_ERROR("Config", "failed to parse %s (error %u)", path.c_str(),
                      static_cast<unsigned>(r.get_error()));
      return expected<ClusterConfig, ClusterConfigError>::error(
          ClusterConfigError::kParseError);
    }
    cfg = ClusterConfig::FromStore(store, paths);
  }

  auto errors = cfg.Validate();
  if (!errors.empty()) {
    KCORE_LOG_ERROR("Config",
                    "config does not pass validation, following errors found:");
    for (const auto& e : errors) KCORE_LOG_ERROR("Config", "  %s", e.c_str());
    return expected<ClusterConfig, ClusterConfigError>::error(
        ClusterConfigError::kValidationFailed);
  }
  return expected<ClusterConfig, ClusterConfigError>::success(
      std::move(cfg));
}

}  // namespace kcore

#endif  // KCORE_CLUSTER_CONFIG_HPP_
