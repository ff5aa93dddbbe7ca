/**
 * @file storage.hpp
 * @brief Storage backends for the API server and their selection.
 *
 *   ""/"kine" : KineBackend, embedded KV proxy on a local unix socket
 *   "etcd"    : EtcdBackend, consensus store, joins peers in join mode
 *
 * Any other type is a configuration error raised before anything is
 * registered.
 */

#ifndef KCORE_STORAGE_HPP_
#define KCORE_STORAGE_HPP_

#include "kcore/certificates.hpp"
#include "kcore/cluster_config.hpp"
#include "kcore/join_client.hpp"
#include "kcore/log.hpp"
#include "kcore/supervisor.hpp"
#include "kcore/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace kcore {

enum class StorageError : uint8_t {
  kUnknownStorageType = 0,
};

/// @brief Supervised storage process the API server connects to.
class StorageBackend : public SupervisedComponent {
 public:
  /// Connection string handed to the API server (--etcd-servers).
  virtual std::string Endpoint() const = 0;

 protected:
  using SupervisedComponent::SupervisedComponent;
};

// ============================================================================
// KineBackend
// ============================================================================

class KineBackend final : public StorageBackend {
 public:
  KineBackend(const KineConfig& config, const Paths& paths)
      : StorageBackend("kine", paths, "kine", "kine"), config_(config) {}

  std::string SocketPath() const { return paths_.run_dir + "/kine.sock"; }
  std::string Endpoint() const override { return "unix://" + SocketPath(); }

  std::vector<std::string> Args() const override {
    return {"--endpoint=" + config_.data_source,
            "--listen-address=unix://" + SocketPath()};
  }

 protected:
  ComponentResult Prepare() override {
    if (!InitDirectory(paths_.run_dir, kDataDirMode)) {
      KCORE_LOG_ERROR("Storage", "cannot create %s", paths_.run_dir.c_str());
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    return ComponentResult::success();
  }

 private:
  KineConfig config_;
};

// ============================================================================
// EtcdBackend
// ============================================================================

/**
 * @brief etcd member of the cluster.
 *
 * A founder starts a new single-member cluster. A joining node asks a peer
 * to add it first and starts with --initial-cluster-state=existing; a node
 * that already has member data restarts without asking.
 */
class EtcdBackend final : public StorageBackend {
 public:
  EtcdBackend(const EtcdConfig& config, bool join, CertificateManager certs,
              optional<JoinClient> client, const Paths& paths)
      : StorageBackend("etcd", paths, "etcd", "etcd", kCertRootDirMode),
        config_(config),
        join_(join),
        certs_(std::move(certs)),
        client_(std::move(client)) {}

  std::string Endpoint() const override { return "https://127.0.0.1:2379"; }
  std::string PeerUrl() const { return "https://" + config_.peer_address + ":2380"; }

  std::vector<std::string> Args() const override {
    const std::string crt = certs_.CertPath("etcd");
    const std::string key = certs_.KeyPath("etcd");
    const std::string ca = certs_.CaCertPath();
    return {"--data-dir=" + StateDir(),
            "--name=" + NodeName(),
            "--listen-client-urls=" + Endpoint(),
            "--advertise-client-urls=" + Endpoint(),
            "--listen-peer-urls=" + PeerUrl(),
            "--initial-advertise-peer-urls=" + PeerUrl(),
            "--initial-cluster=" + initial_cluster_,
            "--initial-cluster-state=" + cluster_state_,
            "--cert-file=" + crt,
            "--key-file=" + key,
            "--trusted-ca-file=" + ca,
            "--client-cert-auth=true",
            "--peer-cert-file=" + crt,
            "--peer-key-file=" + key,
            "--peer-trusted-ca-file=" + ca,
            "--peer-client-cert-auth=true"};
  }

  bool IsJoin() const noexcept { return join_; }

 protected:
  ComponentResult Prepare() override {
    initial_cluster_ = NodeName() + "=" + PeerUrl();
    cluster_state_ = "new";
    if (!join_ || FileExists(StateDir() + "/member")) return ComponentResult::success();

    if (!client_.has_value()) {
      KCORE_LOG_ERROR("Storage", "etcd join requested without a join client");
      return ComponentResult::error(ComponentError::kJoinFailed);
    }
    auto members = client_.value().JoinEtcd(NodeName(), config_.peer_address);
    if (!members) {
      KCORE_LOG_ERROR("Storage", "failed to join etcd cluster via %s: %s",
                      client_.value().Server().c_str(),
                      JoinErrorToString(members.get_error()));
      return ComponentResult::error(ComponentError::kJoinFailed);
    }
    initial_cluster_ = members.value();
    cluster_state_ = "existing";
    KCORE_LOG_INFO("Storage", "joining etcd cluster: %s", initial_cluster_.c_str());
    return ComponentResult::success();
  }

 private:
  static std::string NodeName() {
    char host[256];
    if (::gethostname(host, sizeof(host)) != 0) return "localhost";
    host[sizeof(host) - 1U] = '\0';
    return host;
  }

  EtcdConfig config_;
  bool join_;
  CertificateManager certs_;
  optional<JoinClient> client_;
  std::string initial_cluster_;
  std::string cluster_state_ = "new";
};

// ============================================================================
// Selection
// ============================================================================

/**
 * @brief Build the storage backend named by spec.storage.type.
 * @return kUnknownStorageType for anything but "", "kine" and "etcd".
 */
inline expected<std::unique_ptr<StorageBackend>, StorageError> SelectStorageBackend(
    const ClusterConfig& config, bool join, const CertificateManager& certs,
    const optional<JoinClient>& client, const Paths& paths) {
  using Result = expected<std::unique_ptr<StorageBackend>, StorageError>;
  const std::string& type = config.spec.storage.type;
  if (type.empty() || type == kKineStorageType) {
    return Result::success(std::make_unique<KineBackend>(config.spec.storage.kine, paths));
  }
  if (type == kEtcdStorageType) {
    return Result::success(std::make_unique<EtcdBackend>(
        config.spec.storage.etcd, join, certs, client, paths));
  }
  KCORE_LOG_ERROR("Storage", "invalid storage type: %s", type.c_str());
  return Result::error(StorageError::kUnknownStorageType);
}

}  // namespace kcore

#endif  // KCORE_STORAGE_HPP_
