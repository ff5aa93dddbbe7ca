/**
 * @file control_plane.hpp
 * @brief Control-plane components registered after the storage backend.
 *
 * Registration order: ApiServer, Konnectivity, Scheduler, ControllerManager,
 * ManifestApplier, ControlApi, TelemetryReporter (only when enabled).
 */

#ifndef KCORE_CONTROL_PLANE_HPP_
#define KCORE_CONTROL_PLANE_HPP_

#include "kcore/certificates.hpp"
#include "kcore/cluster_config.hpp"
#include "kcore/component.hpp"
#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/supervisor.hpp"
#include "kcore/ticker.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>

namespace kcore {

// ============================================================================
// Supervised control-plane processes
// ============================================================================

class ApiServer final : public SupervisedComponent {
 public:
  ApiServer(const ClusterConfig& config, std::string storage_endpoint,
            CertificateManager certs, const Paths& paths)
      : SupervisedComponent("kube-apiserver", paths, "kube-apiserver", "kube-apiserver"),
        config_(config),
        storage_endpoint_(std::move(storage_endpoint)),
        certs_(std::move(certs)) {}

  std::vector<std::string> Args() const override {
    const auto& api = config_.spec.api;
    std::vector<std::string> args = {
        "--advertise-address=" + api.address,
        "--secure-port=" + std::to_string(api.port),
        "--etcd-servers=" + storage_endpoint_,
        "--tls-cert-file=" + certs_.CertPath("server"),
        "--tls-private-key-file=" + certs_.KeyPath("server"),
        "--client-ca-file=" + certs_.CaCertPath(),
        "--service-cluster-ip-range=" + config_.spec.network.service_cidr,
        "--service-account-key-file=" + paths_.cert_dir + "/sa.pub",
        "--service-account-signing-key-file=" + certs_.KeyPath("sa"),
        "--service-account-issuer=https://kubernetes.default.svc",
        "--authorization-mode=Node,RBAC",
        "--enable-bootstrap-token-auth=true",
        "--allow-privileged=true",
    };
    if (config_.spec.storage.type == kEtcdStorageType) {
      args.push_back("--etcd-cafile=" + certs_.CaCertPath());
      args.push_back("--etcd-certfile=" + certs_.CertPath("etcd"));
      args.push_back("--etcd-keyfile=" + certs_.KeyPath("etcd"));
    }
    return args;
  }

 private:
  ClusterConfig config_;
  std::string storage_endpoint_;
  CertificateManager certs_;
};

/// Reverse-tunnel gateway between the control plane and worker nodes.
class Konnectivity final : public SupervisedComponent {
 public:
  Konnectivity(CertificateManager certs, const Paths& paths)
      : SupervisedComponent("konnectivity-server", paths, "konnectivity-server",
                            "konnectivity"),
        certs_(std::move(certs)) {}

  std::vector<std::string> Args() const override {
    return {"--uds-name=" + paths_.run_dir + "/konnectivity-server.sock",
            "--cluster-cert=" + certs_.CertPath("server"),
            "--cluster-key=" + certs_.KeyPath("server"),
            "--kubeconfig=" + paths_.admin_kubeconfig,
            "--mode=grpc",
            "--server-port=0",
            "--agent-port=8132",
            "--admin-port=8133",
            "--health-port=8092",
            "--agent-namespace=kube-system",
            "--agent-service-account=konnectivity-agent",
            "--authentication-audience=system:konnectivity-server"};
  }

 protected:
  ComponentResult Prepare() override {
    if (!InitDirectory(paths_.run_dir, kDataDirMode)) {
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    return ComponentResult::success();
  }

 private:
  CertificateManager certs_;
};

class Scheduler final : public SupervisedComponent {
 public:
  explicit Scheduler(const Paths& paths)
      : SupervisedComponent("kube-scheduler", paths, "kube-scheduler", "kube-scheduler") {}

  std::vector<std::string> Args() const override {
    const std::string conf = paths_.cert_dir + "/scheduler.conf";
    return {"--kubeconfig=" + conf, "--authentication-kubeconfig=" + conf,
            "--authorization-kubeconfig=" + conf, "--bind-address=127.0.0.1",
            "--leader-elect=false"};
  }
};

class ControllerManager final : public SupervisedComponent {
 public:
  ControllerManager(const ClusterConfig& config, CertificateManager certs,
                    const Paths& paths)
      : SupervisedComponent("kube-controller-manager", paths, "kube-controller-manager",
                            "kube-controller-manager"),
        config_(config),
        certs_(std::move(certs)) {}

  std::vector<std::string> Args() const override {
    const std::string conf = paths_.cert_dir + "/controller-manager.conf";
    return {"--kubeconfig=" + conf,
            "--authentication-kubeconfig=" + conf,
            "--authorization-kubeconfig=" + conf,
            "--service-account-private-key-file=" + certs_.KeyPath("sa"),
            "--root-ca-file=" + certs_.CaCertPath(),
            "--cluster-signing-cert-file=" + certs_.CaCertPath(),
            "--cluster-signing-key-file=" + certs_.CaKeyPath(),
            "--cluster-cidr=" + config_.spec.network.pod_cidr,
            "--service-cluster-ip-range=" + config_.spec.network.service_cidr,
            "--allocate-node-cidrs=true",
            "--use-service-account-credentials=true",
            "--controllers=*,bootstrapsigner,tokencleaner",
            "--bind-address=127.0.0.1",
            "--leader-elect=false"};
  }

 private:
  ClusterConfig config_;
  CertificateManager certs_;
};

/// Local control API (serves CA and etcd membership to joining nodes).
class ControlApi final : public SupervisedComponent {
 public:
  ControlApi(std::string config_path, const Paths& paths)
      : SupervisedComponent("kcore-api", paths, "kcore-api", "api"),
        config_path_(std::move(config_path)) {}

  std::vector<std::string> Args() const override {
    return {"--config=" + config_path_, "--data-dir=" + paths_.data_dir};
  }

 private:
  std::string config_path_;
};

// ============================================================================
// ManifestApplier
// ============================================================================

namespace detail {

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_ != nullptr) ::closedir(dir_);
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

/// Sorted names of the entries of @p dir accepted by @p want(st).
template <typename Pred>
std::vector<std::string> ListDir(const std::string& dir, Pred want) {
  std::vector<std::string> out;
  DirGuard d(::opendir(dir.c_str()));
  if (d.get() == nullptr) return out;
  struct dirent* entry;
  while ((entry = ::readdir(d.get())) != nullptr) {
    if (entry->d_name[0] == '.') continue;
    struct stat st;
    if (::stat((dir + "/" + entry->d_name).c_str(), &st) != 0) continue;
    if (want(st, entry->d_name)) out.emplace_back(entry->d_name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

inline bool HasManifestExtension(const char* name) {
  const char* dot = std::strrchr(name, '.');
  return dot != nullptr && (std::strcmp(dot, ".yaml") == 0 ||
                            std::strcmp(dot, ".yml") == 0 ||
                            std::strcmp(dot, ".json") == 0);
}

}  // namespace detail

/**
 * @brief Applies every manifests/<stack>/ directory with kubectl when its
 *        contents change.
 *
 * A stack whose apply fails is retried on the next tick.
 */
class ManifestApplier final : public Component {
 public:
  ManifestApplier(const Paths& paths, CommandRunner runner, uint32_t interval_ms = 10000)
      : paths_(paths), runner_(std::move(runner)), interval_ms_(interval_ms) {}

  const char* Name() const noexcept override { return "manifest-applier"; }

  ComponentResult Init() override {
    if (!InitDirectory(paths_.manifests_dir, kManifestsDirMode)) {
      KCORE_LOG_ERROR("Applier", "cannot create %s", paths_.manifests_dir.c_str());
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    return ComponentResult::success();
  }

  ComponentResult Run() override {
    if (!ticker_.Start(interval_ms_, [this] { (void)ApplyChanged(); })) {
      return ComponentResult::error(ComponentError::kRunFailed);
    }
    return ComponentResult::success();
  }

  ComponentResult Stop() override {
    ticker_.Stop();
    return ComponentResult::success();
  }

  /**
   * @brief Apply every stack whose fingerprint changed since its last
   *        successful apply.
   * @return Number of stacks applied successfully.
   */
  uint32_t ApplyChanged() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t applied = 0;
    auto stacks = detail::ListDir(paths_.manifests_dir, [](const struct stat& st, const char*) {
      return S_ISDIR(st.st_mode);
    });
    for (const auto& stack : stacks) {
      const std::string dir = paths_.manifests_dir + "/" + stack;
      std::string fp = Fingerprint(dir);
      if (fp.empty()) continue;
      auto it = applied_.find(stack);
      if (it != applied_.end() && it->second == fp) continue;

      KCORE_LOG_INFO("Applier", "applying stack %s", stack.c_str());
      if (!RunChecked(runner_, "Applier",
                      {"kubectl", "--kubeconfig", paths_.admin_kubeconfig,
                       kKubectlRequestTimeout, "apply", "-f", dir})) {
        KCORE_LOG_WARN("Applier", "stack %s not applied, will retry", stack.c_str());
        continue;
      }
      applied_[stack] = fp;
      ++applied;
    }
    return applied;
  }

 private:
  /// Names, sizes and mtimes of the manifest files ("" if there are none).
  static std::string Fingerprint(const std::string& dir) {
    std::string fp;
    auto files = detail::ListDir(dir, [](const struct stat& st, const char* name) {
      return S_ISREG(st.st_mode) && detail::HasManifestExtension(name);
    });
    for (const auto& f : files) {
      struct stat st;
      if (::stat((dir + "/" + f).c_str(), &st) != 0) continue;
      fp += f + ":" + std::to_string(st.st_size) + ":" +
            std::to_string(st.st_mtim.tv_sec) + "." + std::to_string(st.st_mtim.tv_nsec) +
            ";";
    }
    return fp;
  }

  Paths paths_;
  CommandRunner runner_;
  uint32_t interval_ms_;
  std::map<std::string, std::string> applied_;
  std::mutex mutex_;
  Ticker ticker_;
};

// ============================================================================
// Telemetry
// ============================================================================

/**
 * @brief Anonymized machine identifier: HMAC-SHA256 of the machine id,
 *        keyed by the application id.
 */
inline expected<std::string, ComponentError> MachineId(
    const CommandRunner& runner, const std::string& id_file = "/etc/machine-id") {
  std::string out;
  if (!RunChecked(runner, "Telemetry",
                  {"openssl", "dgst", "-sha256", "-hmac", kAppId, id_file}, &out)) {
    return expected<std::string, ComponentError>::error(ComponentError::kInitFailed);
  }
  // "HMAC-SHA2-256(/etc/machine-id)= <hex>"
  size_t eq = out.rfind("= ");
  if (eq == std::string::npos) {
    return expected<std::string, ComponentError>::error(ComponentError::kInitFailed);
  }
  std::string id = out.substr(eq + 2U);
  while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) {
    id.pop_back();
  }
  if (id.empty()) {
    return expected<std::string, ComponentError>::error(ComponentError::kInitFailed);
  }
  return expected<std::string, ComponentError>::success(std::move(id));
}

/**
 * @brief Periodically writes a local usage report to data_dir/telemetry.json.
 */
class TelemetryReporter final : public Component {
 public:
  TelemetryReporter(const ClusterConfig& config, const Paths& paths, CommandRunner runner,
                    uint32_t interval_ms = 10U * 60U * 1000U)
      : config_(config), paths_(paths), runner_(std::move(runner)), interval_ms_(interval_ms) {}

  const char* Name() const noexcept override { return "telemetry"; }

  ComponentResult Init() override {
    auto id = MachineId(runner_);
    if (id.has_value()) {
      machine_id_ = id.value();
    } else {
      KCORE_LOG_WARN("Telemetry", "cannot compute machine id, reporting as unknown");
      machine_id_ = "unknown";
    }
    return ComponentResult::success();
  }

  ComponentResult Run() override {
    if (!ticker_.Start(interval_ms_, [this] { (void)Report(); })) {
      return ComponentResult::error(ComponentError::kRunFailed);
    }
    return ComponentResult::success();
  }

  ComponentResult Stop() override {
    ticker_.Stop();
    return ComponentResult::success();
  }

  std::string ReportPath() const { return paths_.data_dir + "/telemetry.json"; }

  /// @brief Write one report now.
  bool Report() {
    nlohmann::json doc;
    doc["machineId"] = machine_id_;
    doc["version"] = kVersion;
    doc["storageType"] =
        config_.spec.storage.type.empty() ? kKineStorageType : config_.spec.storage.type;
    doc["networkProvider"] = config_.spec.network.provider;
    doc["timestamp"] = static_cast<int64_t>(std::time(nullptr));
    if (!WriteFileAtomic(ReportPath(), doc.dump(2) + "\n", 0644)) {
      KCORE_LOG_WARN("Telemetry", "cannot write %s", ReportPath().c_str());
      return false;
    }
    KCORE_LOG_DEBUG("Telemetry", "usage report written");
    return true;
  }

 private:
  ClusterConfig config_;
  Paths paths_;
  CommandRunner runner_;
  uint32_t interval_ms_;
  std::string machine_id_ = "unknown";
  Ticker ticker_;
};

}  // namespace kcore

#endif  // KCORE_CONTROL_PLANE_HPP_
