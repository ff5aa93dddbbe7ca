/**
 * @file worker.hpp
 * @brief Promotes a control-plane node to also run workloads.
 *
 * WorkerEnabler waits for the admin kubeconfig (written once the control
 * plane issued its credentials), creates and saves a kubelet bootstrap
 * kubeconfig, prepares the kernel, then starts the container runtime and
 * the node agent and hands both to the ComponentManager for teardown.
 *
 * The bootstrap steps are skipped when the node already holds kubelet
 * credentials (Paths::kubelet_auth_config).
 */

#ifndef KCORE_WORKER_HPP_
#define KCORE_WORKER_HPP_

#include "kcore/cluster_config.hpp"
#include "kcore/component.hpp"
#include "kcore/component_manager.hpp"
#include "kcore/constants.hpp"
#include "kcore/join_client.hpp"
#include "kcore/log.hpp"
#include "kcore/reconcilers.hpp"
#include "kcore/supervisor.hpp"
#include "kcore/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcore {

enum class WorkerError : uint8_t {
  kAdminConfigMissing = 0,
  kBootstrapFailed,
  kSaveFailed,
  kRuntimeFailed,
  kAgentFailed,
};

inline const char* WorkerErrorToString(WorkerError e) noexcept {
  switch (e) {
    case WorkerError::kAdminConfigMissing: return "admin kubeconfig missing";
    case WorkerError::kBootstrapFailed:    return "bootstrap config failed";
    case WorkerError::kSaveFailed:         return "save bootstrap config failed";
    case WorkerError::kRuntimeFailed:      return "container runtime failed";
    case WorkerError::kAgentFailed:        return "node agent failed";
  }
  return "unknown";
}

// ============================================================================
// Retry
// ============================================================================

/**
 * @brief Bounded retry with exponential backoff.
 *
 * Delays: delay_ms, delay_ms * multiplier, ... capped at max_delay_ms.
 */
struct RetryPolicy {
  uint32_t attempts = 10;
  uint32_t delay_ms = 100;
  uint32_t multiplier = 2;
  uint32_t max_delay_ms = 10000;
};

/**
 * @brief Call @p fn until it returns true or the attempts are exhausted.
 * @return true if some attempt succeeded.
 */
template <typename F>
bool Retry(const RetryPolicy& policy, F&& fn, const char* what) {
  uint32_t delay = policy.delay_ms;
  for (uint32_t attempt = 1; attempt <= policy.attempts; ++attempt) {
    if (fn()) return true;
    if (attempt == policy.attempts) break;
    KCORE_LOG_DEBUG("Worker", "%s: attempt %u/%u failed, retrying in %u ms", what, attempt,
                    policy.attempts, delay);
    detail::SleepMs(delay);
    uint64_t next = static_cast<uint64_t>(delay) * policy.multiplier;
    delay = (next > policy.max_delay_ms) ? policy.max_delay_ms : static_cast<uint32_t>(next);
  }
  KCORE_LOG_ERROR("Worker", "%s: giving up after %u attempts", what, policy.attempts);
  return false;
}

// ============================================================================
// Worker components
// ============================================================================

class Containerd final : public SupervisedComponent {
 public:
  explicit Containerd(const Paths& paths)
      : SupervisedComponent("containerd", paths, "containerd", "containerd") {}

  std::string SocketPath() const { return paths_.run_dir + "/containerd.sock"; }

  std::vector<std::string> Args() const override {
    return {"--root=" + StateDir() + "/root",
            "--state=" + paths_.run_dir + "/containerd",
            "--address=" + SocketPath()};
  }

 protected:
  ComponentResult Prepare() override {
    if (!InitDirectory(paths_.run_dir, kDataDirMode)) {
      KCORE_LOG_ERROR("Worker", "cannot create %s", paths_.run_dir.c_str());
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    return ComponentResult::success();
  }
};

/**
 * @brief Node agent. Its configuration comes from the kubelet-config-<profile>
 *        ConfigMap; when that cannot be read yet the default configuration
 *        is used.
 */
class Kubelet final : public SupervisedComponent {
 public:
  Kubelet(const ClusterConfig& config, const Paths& paths, CommandRunner runner,
          std::string profile)
      : SupervisedComponent("kubelet", paths, "kubelet", "kubelet"),
        config_(config),
        runner_(std::move(runner)),
        profile_(std::move(profile)) {}

  const std::string& Profile() const noexcept { return profile_; }
  std::string ConfigPath() const { return StateDir() + "/config.yaml"; }

  std::vector<std::string> Args() const override {
    return {"--root-dir=" + StateDir(),
            "--config=" + ConfigPath(),
            "--bootstrap-kubeconfig=" + paths_.kubelet_bootstrap_config,
            "--kubeconfig=" + paths_.kubelet_auth_config,
            "--cert-dir=" + StateDir() + "/pki",
            "--container-runtime=remote",
            "--container-runtime-endpoint=unix://" + paths_.run_dir + "/containerd.sock"};
  }

 protected:
  ComponentResult Prepare() override {
    std::string doc;
    if (!RunChecked(runner_, "Worker",
                    {"kubectl", "--kubeconfig", paths_.admin_kubeconfig, kKubectlRequestTimeout,
                     "-n", "kube-system", "get", "configmap", "kubelet-config-" + profile_, "-o",
                     "jsonpath={.data.kubelet}"},
                    &doc) ||
        doc.empty()) {
      auto dns = config_.spec.network.DNSAddress();
      if (!dns) {
        KCORE_LOG_ERROR("Worker", "no kubelet config for profile %s", profile_.c_str());
        return ComponentResult::error(ComponentError::kInitFailed);
      }
      KCORE_LOG_WARN("Worker", "kubelet config for profile %s not available, using defaults",
                     profile_.c_str());
      doc = manifests::KubeletConfiguration(dns.value());
    }
    if (!WriteFileAtomic(ConfigPath(), doc, 0644)) {
      KCORE_LOG_ERROR("Worker", "cannot write %s", ConfigPath().c_str());
      return ComponentResult::error(ComponentError::kWriteFailed);
    }
    return ComponentResult::success();
  }

 private:
  ClusterConfig config_;
  CommandRunner runner_;
  std::string profile_;
};

namespace detail {

/**
 * @brief Map random bytes onto [a-z0-9] until @p out holds @p want chars.
 *
 * Bytes >= 252 (7 * 36) are skipped so every character is equally likely.
 */
inline void AppendTokenChars(const unsigned char* bytes, size_t n, size_t want,
                             std::string& out) {
  static const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  constexpr unsigned kUnbiasedLimit = 252U;
  for (size_t i = 0; i < n && out.size() < want; ++i) {
    if (bytes[i] >= kUnbiasedLimit) continue;
    out.push_back(kAlphabet[bytes[i] % 36U]);
  }
}

}  // namespace detail

// ============================================================================
// WorkerBackend
// ============================================================================

/// @brief Node-side operations needed to enable the worker role.
class WorkerBackend {
 public:
  virtual ~WorkerBackend() = default;

  /// Bootstrap kubeconfig content for a freshly created token.
  virtual expected<std::string, WorkerError> CreateBootstrapConfig(uint32_t timeout_ms) = 0;
  virtual expected<void, WorkerError> SaveBootstrapConfig(const std::string& content) = 0;
  /// Best effort; failures are logged.
  virtual void KernelSetup() = 0;
  virtual ComponentPtr MakeContainerRuntime() = 0;
  virtual ComponentPtr MakeNodeAgent(const std::string& profile) = 0;
};

/**
 * @brief WorkerBackend acting on this host with kubectl, modprobe and the
 *        supervised containerd/kubelet binaries.
 */
class SystemWorkerBackend final : public WorkerBackend {
 public:
  SystemWorkerBackend(const ClusterConfig& config, const Paths& paths, CommandRunner runner)
      : config_(config), paths_(paths), runner_(std::move(runner)) {}

  expected<std::string, WorkerError> CreateBootstrapConfig(uint32_t timeout_ms) override {
    using Result = expected<std::string, WorkerError>;
    std::string id;
    std::string secret;
    if (!RandomToken(6U, id) || !RandomToken(16U, secret)) {
      KCORE_LOG_ERROR("Worker", "cannot read /dev/urandom");
      return Result::error(WorkerError::kBootstrapFailed);
    }
    auto ca = ReadFile(paths_.cert_dir + "/ca.crt");
    if (!ca) {
      KCORE_LOG_ERROR("Worker", "cannot read %s/ca.crt", paths_.cert_dir.c_str());
      return Result::error(WorkerError::kBootstrapFailed);
    }

    const std::string secret_file = paths_.run_dir + "/bootstrap-token.yaml";
    if (!InitDirectory(paths_.run_dir, kDataDirMode) ||
        !WriteFileAtomic(secret_file, TokenSecret(id, secret), 0600)) {
      KCORE_LOG_ERROR("Worker", "cannot write %s", secret_file.c_str());
      return Result::error(WorkerError::kBootstrapFailed);
    }
    const uint32_t timeout_s = (timeout_ms + 999U) / 1000U;
    bool ok = RunChecked(runner_, "Worker",
                         {"kubectl", "--kubeconfig", paths_.admin_kubeconfig,
                          "--request-timeout=" + std::to_string(timeout_s) + "s", "apply",
                          "-f", secret_file});
    if (std::remove(secret_file.c_str()) != 0) {
      KCORE_LOG_WARN("Worker", "cannot remove %s", secret_file.c_str());
    }
    if (!ok) return Result::error(WorkerError::kBootstrapFailed);

    return Result::success(BootstrapKubeconfig(ca.value(), id + "." + secret));
  }

  expected<void, WorkerError> SaveBootstrapConfig(const std::string& content) override {
    if (!WriteFileAtomic(paths_.kubelet_bootstrap_config, content, 0600)) {
      KCORE_LOG_ERROR("Worker", "cannot write %s", paths_.kubelet_bootstrap_config.c_str());
      return expected<void, WorkerError>::error(WorkerError::kSaveFailed);
    }
    return expected<void, WorkerError>::success();
  }

  void KernelSetup() override {
    static const char* const kModules[] = {"overlay", "nf_conntrack", "br_netfilter"};
    for (const char* m : kModules) {
      if (!RunChecked(runner_, "Worker", {"modprobe", m})) {
        KCORE_LOG_WARN("Worker", "failed to load kernel module %s", m);
      }
    }
    static const char* const kSysctls[] = {
        "/proc/sys/net/ipv4/ip_forward",
        "/proc/sys/net/bridge/bridge-nf-call-iptables",
    };
    for (const char* path : kSysctls) {
      FILE* f = std::fopen(path, "w");
      if (f == nullptr || std::fputs("1", f) < 0) {
        KCORE_LOG_WARN("Worker", "failed to enable %s", path);
      }
      if (f != nullptr) std::fclose(f);
    }
  }

  ComponentPtr MakeContainerRuntime() override { return std::make_unique<Containerd>(paths_); }

  ComponentPtr MakeNodeAgent(const std::string& profile) override {
    return std::make_unique<Kubelet>(config_, paths_, runner_, profile);
  }

 private:
  static bool RandomToken(size_t len, std::string& out) {
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f == nullptr) return false;
    out.clear();
    unsigned char buf[32];
    // Each byte is rejected with probability 4/256; 8 reads is plenty.
    for (int round = 0; round < 8 && out.size() < len; ++round) {
      size_t n = std::fread(buf, 1, sizeof(buf), f);
      if (n == 0) break;
      detail::AppendTokenChars(buf, n, len, out);
    }
    std::fclose(f);
    return out.size() == len;
  }

  static std::string TokenSecret(const std::string& id, const std::string& secret) {
    return "apiVersion: v1\n"
           "kind: Secret\n"
           "metadata:\n"
           "  name: bootstrap-token-" + id + "\n"
           "  namespace: kube-system\n"
           "type: bootstrap.kubernetes.io/token\n"
           "stringData:\n"
           "  description: \"Worker bootstrap token generated by kcore\"\n"
           "  token-id: " + id + "\n"
           "  token-secret: " + secret + "\n"
           "  usage-bootstrap-authentication: \"true\"\n"
           "  usage-bootstrap-signing: \"true\"\n"
           "  auth-extra-groups: system:bootstrappers:kcore-worker\n";
  }

  std::string BootstrapKubeconfig(const std::string& ca_pem, const std::string& token) const {
    return "apiVersion: v1\n"
           "kind: Config\n"
           "clusters:\n"
           "- name: kcore\n"
           "  cluster:\n"
           "    server: " + config_.spec.api.Url() + "\n"
           "    certificate-authority-data: " + Base64Encode(ca_pem) + "\n"
           "contexts:\n"
           "- name: kcore\n"
           "  context:\n"
           "    cluster: kcore\n"
           "    user: kubelet-bootstrap\n"
           "current-context: kcore\n"
           "users:\n"
           "- name: kubelet-bootstrap\n"
           "  user:\n"
           "    token: " + token + "\n";
  }

  ClusterConfig config_;
  Paths paths_;
  CommandRunner runner_;
};

// ============================================================================
// WorkerEnabler
// ============================================================================

inline constexpr uint32_t kBootstrapRequestTimeoutMs = 60000;

class WorkerEnabler final {
 public:
  WorkerEnabler(const Paths& paths, WorkerBackend& backend, RetryPolicy policy = RetryPolicy())
      : paths_(paths), backend_(backend), policy_(policy) {}

  /**
   * @brief Bootstrap credentials if needed, then start the container runtime
   *        and node agent.
   *
   * Whatever was started is registered with @p manager (AddRunning), also
   * on failure, so ComponentManager::Stop tears it down.
   */
  expected<void, WorkerError> Enable(ComponentManager& manager, const std::string& profile) {
    using Result = expected<void, WorkerError>;
    if (!FileExists(paths_.kubelet_auth_config)) {
      if (!Retry(policy_, [this] { return FileExists(paths_.admin_kubeconfig); },
                 "wait for admin kubeconfig")) {
        return Result::error(WorkerError::kAdminConfigMissing);
      }
      std::string bootstrap;
      bool created = Retry(
          policy_,
          [this, &bootstrap] {
            auto r = backend_.CreateBootstrapConfig(kBootstrapRequestTimeoutMs);
            if (!r) return false;
            bootstrap = std::move(r.value());
            return true;
          },
          "create kubelet bootstrap config");
      if (!created) return Result::error(WorkerError::kBootstrapFailed);
      auto saved = backend_.SaveBootstrapConfig(bootstrap);
      if (!saved) return saved;
      KCORE_LOG_INFO("Worker", "kubelet bootstrap config saved");
    } else {
      KCORE_LOG_INFO("Worker", "kubelet credentials present, skipping bootstrap");
    }

    backend_.KernelSetup();

    ComponentPtr runtime = backend_.MakeContainerRuntime();
    ComponentPtr agent = backend_.MakeNodeAgent(profile);
    if (!runtime->Init()) {
      KCORE_LOG_ERROR("Worker", "failed to init %s", runtime->Name());
      return Result::error(WorkerError::kRuntimeFailed);
    }
    if (!agent->Init()) {
      KCORE_LOG_ERROR("Worker", "failed to init %s", agent->Name());
      return Result::error(WorkerError::kAgentFailed);
    }
    if (!runtime->Run()) {
      KCORE_LOG_ERROR("Worker", "failed to run %s", runtime->Name());
      manager.AddRunning(std::move(runtime));
      return Result::error(WorkerError::kRuntimeFailed);
    }
    auto ran = agent->Run();
    manager.AddRunning(std::move(runtime));
    manager.AddRunning(std::move(agent));
    if (!ran) {
      KCORE_LOG_ERROR("Worker", "failed to run node agent");
      return Result::error(WorkerError::kAgentFailed);
    }
    KCORE_LOG_INFO("Worker", "worker components running (profile %s)", profile.c_str());
    return Result::success();
  }

 private:
  Paths paths_;
  WorkerBackend& backend_;
  RetryPolicy policy_;
};

}  // namespace kcore

#endif  // KCORE_WORKER_HPP_
