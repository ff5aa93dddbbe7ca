/**
 * @file join_client.hpp
 * @brief Join token codec and client for fetching trust material from a peer.
 *
 * A join token is the base64 encoding of a JSON kubeconfig document:
 * @code
 *   {"apiVersion": "v1", "kind": "Config",
 *    "clusters": [{"name": "kcore", "cluster": {
 *        "server": "https://10.0.0.1:9443",
 *        "certificate-authority-data": "<base64 PEM>"}}],
 *    "users": [{"name": "controller-bootstrap", "user": {"token": "<bearer>"}}]}
 * @endcode
 *
 * The server, CA and bearer token are taken from the first cluster and the
 * first user. Requests go through a JoinTransport so tests can replace the
 * network.
 */

#ifndef KCORE_JOIN_CLIENT_HPP_
#define KCORE_JOIN_CLIENT_HPP_

#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/supervisor.hpp"
#include "kcore/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcore {

enum class JoinError : uint8_t {
  kMalformedToken = 0,
  kInvalidServer,
  kRequestFailed,
  kBadResponse,
};

inline const char* JoinErrorToString(JoinError e) noexcept {
  switch (e) {
    case JoinError::kMalformedToken: return "malformed join token";
    case JoinError::kInvalidServer:  return "invalid join server address";
    case JoinError::kRequestFailed:  return "join request failed";
    case JoinError::kBadResponse:    return "unexpected join response";
    default:                         return "unknown";
  }
}

// ============================================================================
// Base64 (RFC 4648, standard alphabet, padded)
// ============================================================================

inline std::string Base64Encode(const std::string& in) {
  static constexpr char kTable[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((in.size() + 2U) / 3U) * 4U);
  size_t i = 0;
  while (i + 2U < in.size()) {
    uint32_t v = (static_cast<uint8_t>(in[i]) << 16) |
                 (static_cast<uint8_t>(in[i + 1U]) << 8) |
                 static_cast<uint8_t>(in[i + 2U]);
    out += kTable[(v >> 18) & 0x3FU];
    out += kTable[(v >> 12) & 0x3FU];
    out += kTable[(v >> 6) & 0x3FU];
    out += kTable[v & 0x3FU];
    i += 3U;
  }
  size_t rest = in.size() - i;
  if (rest == 1U) {
    uint32_t v = static_cast<uint32_t>(static_cast<uint8_t>(in[i])) << 16;
    out += kTable[(v >> 18) & 0x3FU];
    out += kTable[(v >> 12) & 0x3FU];
    out += "==";
  } else if (rest == 2U) {
    uint32_t v = (static_cast<uint32_t>(static_cast<uint8_t>(in[i])) << 16) |
                 (static_cast<uint32_t>(static_cast<uint8_t>(in[i + 1U])) << 8);
    out += kTable[(v >> 18) & 0x3FU];
    out += kTable[(v >> 12) & 0x3FU];
    out += kTable[(v >> 6) & 0x3FU];
    out += '=';
  }
  return out;
}

/**
 * @brief Decode base64; whitespace is skipped, padding is optional.
 * @return false on any character outside the alphabet or a dangling bit group.
 */
inline bool Base64Decode(const std::string& in, std::string& out) {
  out.clear();
  uint32_t acc = 0;
  uint32_t bits = 0;
  size_t pad = 0;
  for (char c : in) {
    int v;
    if (c >= 'A' && c <= 'Z') {
      v = c - 'A';
    } else if (c >= 'a' && c <= 'z') {
      v = c - 'a' + 26;
    } else if (c >= '0' && c <= '9') {
      v = c - '0' + 52;
    } else if (c == '+') {
      v = 62;
    } else if (c == '/') {
      v = 63;
    } else if (c == '=') {
      ++pad;
      continue;
    } else if (c == '\n' || c == '\r' || c == ' ' || c == '\t') {
      continue;
    } else {
      return false;
    }
    if (pad != 0U) return false;  // data after padding
    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6U;
    if (bits >= 8U) {
      bits -= 8U;
      out += static_cast<char>((acc >> bits) & 0xFFU);
    }
  }
  return bits < 6U && pad <= 2U;
}

// ============================================================================
// JoinTransport
// ============================================================================

struct JoinRequest {
  std::string method;  ///< "GET" / "POST"
  std::string url;
  std::string body;    ///< JSON, empty for GET
  std::string bearer_token;
  std::string ca_pem;  ///< Trust anchor for the peer's serving certificate
};

struct JoinResponse {
  int status = 0;
  std::string body;
};

/// @brief Abstract HTTPS round-trip used by JoinClient.
class JoinTransport {
 public:
  virtual ~JoinTransport() = default;
  virtual expected<JoinResponse, JoinError> Do(const JoinRequest& req) = 0;
};

/**
 * @brief JoinTransport that shells out to curl(1).
 *
 * The CA is written to @p scratch_dir so curl can verify the peer.
 */
class CurlTransport final : public JoinTransport {
 public:
  CurlTransport(std::string scratch_dir, CommandRunner runner)
      : scratch_dir_(std::move(scratch_dir)), runner_(std::move(runner)) {}

  expected<JoinResponse, JoinError> Do(const JoinRequest& req) override {
    const std::string ca_path = scratch_dir_ + "/join-ca.crt";
    if (!InitDirectory(scratch_dir_, kCertRootDirMode) ||
        !WriteFileAtomic(ca_path, req.ca_pem, 0600)) {
      KCORE_LOG_ERROR("Join", "cannot write join CA to %s", ca_path.c_str());
      return expected<JoinResponse, JoinError>::error(JoinError::kRequestFailed);
    }
    // The bearer token is read by curl from a private file, never from argv.
    const std::string header_path = HeaderPath();
    if (!WriteFileAtomic(header_path, "Authorization: Bearer " + req.bearer_token + "\n",
                         0600)) {
      KCORE_LOG_ERROR("Join", "cannot write %s", header_path.c_str());
      return expected<JoinResponse, JoinError>::error(JoinError::kRequestFailed);
    }

    std::vector<std::string> argv = {
        "curl", "-sS", "--max-time", "30", "--cacert", ca_path,
        "-H", "@" + header_path,
        "-X", req.method, "-w", "\n%{http_code}"};
    if (!req.body.empty()) {
      argv.push_back("-H");
      argv.push_back("Content-Type: application/json");
      argv.push_back("--data");
      argv.push_back(req.body);
    }
    argv.push_back(req.url);

    std::string out;
    int code = -1;
    ProcessResult ran = runner_(argv, out, code);
    if (std::remove(header_path.c_str()) != 0) {
      KCORE_LOG_WARN("Join", "cannot remove %s", header_path.c_str());
    }
    if (ran != ProcessResult::kSuccess || code != 0) {
      KCORE_LOG_ERROR("Join", "%s %s failed (curl exit %d): %s", req.method.c_str(),
                      req.url.c_str(), code, out.c_str());
      return expected<JoinResponse, JoinError>::error(JoinError::kRequestFailed);
    }

    // Body, then "\n<status>" appended by -w.
    size_t nl = out.rfind('\n');
    if (nl == std::string::npos) {
      return expected<JoinResponse, JoinError>::error(JoinError::kBadResponse);
    }
    JoinResponse resp;
    resp.status = std::atoi(out.c_str() + nl + 1U);
    resp.body = out.substr(0, nl);
    return expected<JoinResponse, JoinError>::success(std::move(resp));
  }

 /// Header file handed to curl with "-H @file"; exists only during a request.
  std::string HeaderPath() const { return scratch_dir_ + "/join-auth.header"; }

 private:
  std::string scratch_dir_;
  CommandRunner runner_;
};

// ============================================================================
// JoinClient
// ============================================================================

struct CaBundle {
  std::string cert;  ///< PEM
  std::string key;   ///< PEM
};

/// Server must look like "https://host:port" (optional trailing '/').
inline bool IsValidJoinServer(const std::string& server) {
  static constexpr const char kScheme[] = "https://";
  const size_t scheme_len = sizeof(kScheme) - 1U;
  if (server.compare(0, scheme_len, kScheme) != 0) return false;
  std::string rest = server.substr(scheme_len);
  if (!rest.empty() && rest.back() == '/') rest.pop_back();
  size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0U || colon + 1U >= rest.size()) return false;
  if (rest.find('/') != std::string::npos) return false;
  uint32_t port = 0;
  for (size_t i = colon + 1U; i < rest.size(); ++i) {
    if (rest[i] < '0' || rest[i] > '9') return false;
    port = port * 10U + static_cast<uint32_t>(rest[i] - '0');
    if (port > 65535U) return false;
  }
  return port != 0U;
}

/**
 * @brief Client of the cluster's join API, built from a join token.
 *
 * Copies share the transport.
 */
class JoinClient {
 public:
  /**
   * @brief Parse @p token.
   * @return kMalformedToken for base64/JSON/field errors, kInvalidServer when
   *         the server is not an https://host:port URL.
   */
  static expected<JoinClient, JoinError> FromToken(
      const std::string& token, std::shared_ptr<JoinTransport> transport) {
    std::string doc;
    if (token.empty() || !Base64Decode(token, doc)) {
      return expected<JoinClient, JoinError>::error(JoinError::kMalformedToken);
    }
    auto j = nlohmann::json::parse(doc, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<JoinClient, JoinError>::error(JoinError::kMalformedToken);
    }

    const nlohmann::json* cluster = FirstEntry(j, "clusters", "cluster");
    const nlohmann::json* user = FirstEntry(j, "users", "user");
    if (cluster == nullptr || user == nullptr) {
      return expected<JoinClient, JoinError>::error(JoinError::kMalformedToken);
    }

    JoinClient c;
    std::string ca_b64;
    if (!StringField(*cluster, "server", c.server_) ||
        !StringField(*cluster, "certificate-authority-data", ca_b64) ||
        !StringField(*user, "token", c.bearer_token_) ||
        !Base64Decode(ca_b64, c.ca_pem_) || c.ca_pem_.empty() ||
        c.bearer_token_.empty()) {
      return expected<JoinClient, JoinError>::error(JoinError::kMalformedToken);
    }
    if (!IsValidJoinServer(c.server_)) {
      KCORE_LOG_ERROR("Join", "join token server '%s' is not https://host:port",
                      c.server_.c_str());
      return expected<JoinClient, JoinError>::error(JoinError::kInvalidServer);
    }
    if (c.server_.back() == '/') c.server_.pop_back();
    c.transport_ = std::move(transport);
    return expected<JoinClient, JoinError>::success(std::move(c));
  }

  const std::string& Server() const noexcept { return server_; }
  const std::string& CaPem() const noexcept { return ca_pem_; }
  const std::string& BearerToken() const noexcept { return bearer_token_; }

  /// @brief Fetch the cluster CA certificate and key from the peer.
  expected<CaBundle, JoinError> GetCA() const {
    auto resp = Call("GET", "/v1beta1/ca", std::string());
    if (!resp.has_value()) return expected<CaBundle, JoinError>::error(resp.get_error());

    auto j = nlohmann::json::parse(resp.value().body, nullptr, false);
    CaBundle ca;
    std::string cert_b64;
    std::string key_b64;
    if (j.is_discarded() || !j.is_object() || !StringField(j, "cert", cert_b64) ||
        !StringField(j, "key", key_b64) || !Base64Decode(cert_b64, ca.cert) ||
        !Base64Decode(key_b64, ca.key)) {
      KCORE_LOG_ERROR("Join", "CA response from %s is not usable", server_.c_str());
      return expected<CaBundle, JoinError>::error(JoinError::kBadResponse);
    }
    return expected<CaBundle, JoinError>::success(std::move(ca));
  }

  /**
   * @brief Ask the peer to add this node as an etcd member.
   * @return The initial-cluster string ("name=url,name=url").
   */
  expected<std::string, JoinError> JoinEtcd(const std::string& node_name,
                                            const std::string& peer_address) const {
    nlohmann::json req;
    req["node"] = node_name;
    req["peerAddress"] = peer_address;
    auto resp = Call("POST", "/v1beta1/etcd/members", req.dump());
    if (!resp.has_value()) {
      return expected<std::string, JoinError>::error(resp.get_error());
    }

    auto j = nlohmann::json::parse(resp.value().body, nullptr, false);
    auto it = j.is_object() ? j.find("initialCluster") : j.end();
    if (j.is_discarded() || !j.is_object() || it == j.end() || !it->is_array() ||
        it->empty()) {
      return expected<std::string, JoinError>::error(JoinError::kBadResponse);
    }
    std::string initial;
    for (const auto& member : *it) {
      if (!member.is_string()) {
        return expected<std::string, JoinError>::error(JoinError::kBadResponse);
      }
      if (!initial.empty()) initial += ',';
      initial += member.get<std::string>();
    }
    return expected<std::string, JoinError>::success(std::move(initial));
  }

 private:
  JoinClient() = default;

  expected<JoinResponse, JoinError> Call(const char* method, const char* path,
                                         const std::string& body) const {
    if (transport_ == nullptr) {
      return expected<JoinResponse, JoinError>::error(JoinError::kRequestFailed);
    }
    JoinRequest req;
    req.method = method;
    req.url = server_ + path;
    req.body = body;
    req.bearer_token = bearer_token_;
    req.ca_pem = ca_pem_;
    KCORE_LOG_DEBUG("Join", "%s %s", method, req.url.c_str());
    auto resp = transport_->Do(req);
    if (!resp.has_value()) return resp;
    if (resp.value().status != 200) {
      KCORE_LOG_ERROR("Join", "%s %s returned HTTP %d", method, req.url.c_str(),
                      resp.value().status);
      return expected<JoinResponse, JoinError>::error(JoinError::kRequestFailed);
    }
    return resp;
  }

  /// obj[list][0][field] if it is an object.
  static const nlohmann::json* FirstEntry(const nlohmann::json& obj, const char* list,
                                          const char* field) {
    auto it = obj.find(list);
    if (it == obj.end() || !it->is_array() || it->empty()) return nullptr;
    const nlohmann::json& first = (*it)[0];
    if (!first.is_object()) return nullptr;
    auto f = first.find(field);
    if (f == first.end() || !f->is_object()) return nullptr;
    return &(*f);
  }

  static bool StringField(const nlohmann::json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
  }

  std::string server_;
  std::string ca_pem_;
  std::string bearer_token_;
  std::shared_ptr<JoinTransport> transport_;
};

/**
 * @brief Build a join token (the inverse of JoinClient::FromToken).
 */
inline std::string EncodeToken(const std::string& server, const std::string& ca_pem,
                               const std::string& bearer_token) {
  nlohmann::json cluster;
  cluster["server"] = server;
  cluster["certificate-authority-data"] = Base64Encode(ca_pem);
  nlohmann::json user;
  user["token"] = bearer_token;

  nlohmann::json doc;
  doc["apiVersion"] = "v1";
  doc["kind"] = "Config";
  doc["clusters"] = nlohmann::json::array({{{"name", kAppId}, {"cluster", cluster}}});
  doc["users"] = nlohmann::json::array({{{"name", "controller-bootstrap"}, {"user", user}}});
  doc["current-context"] = kAppId;
  return Base64Encode(doc.dump());
}

}  // namespace kcore

#endif  // KCORE_JOIN_CLIENT_HPP_
