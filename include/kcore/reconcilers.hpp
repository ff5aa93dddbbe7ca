/**
 * @file reconcilers.hpp
 * @brief Best-effort add-on reconcilers driven after the control plane starts.
 *
 * Every reconciler renders one manifest from the ClusterConfig into
 * manifests/<name>/<name>.yaml, where the ManifestApplier picks it up. The
 * set is built once: a reconciler whose construction fails is logged and
 * left out, the others are unaffected.
 *
 * Usage:
 * @code
 *   kcore::ReconcilerSet reconcilers;
 *   kcore::BuildClusterReconcilers(config, paths, reconcilers);
 *   reconcilers.RunAll();
 *   ...
 *   reconcilers.StopAll();
 * @endcode
 */

#ifndef KCORE_RECONCILERS_HPP_
#define KCORE_RECONCILERS_HPP_

#include "kcore/cluster_config.hpp"
#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/ticker.hpp"
#include "kcore/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kcore {

enum class ReconcilerError : uint8_t {
  kConstructFailed = 0,
  kRenderFailed,
  kWriteFailed,
  kRunFailed,
  kDuplicate,
};

inline const char* ReconcilerErrorToString(ReconcilerError e) noexcept {
  switch (e) {
    case ReconcilerError::kConstructFailed: return "construct failed";
    case ReconcilerError::kRenderFailed:    return "render failed";
    case ReconcilerError::kWriteFailed:     return "write failed";
    case ReconcilerError::kRunFailed:       return "run failed";
    case ReconcilerError::kDuplicate:       return "duplicate name";
  }
  return "unknown";
}

using ReconcilerResult = expected<void, ReconcilerError>;

class Reconciler {
 public:
  virtual ~Reconciler() = default;
  virtual ReconcilerResult Run() = 0;
  virtual ReconcilerResult Stop() = 0;
};

using ReconcilerPtr = std::unique_ptr<Reconciler>;
using ReconcilerFactory = std::function<expected<ReconcilerPtr, ReconcilerError>()>;

// ============================================================================
// ReconcilerSet
// ============================================================================

/**
 * @brief Named reconcilers in insertion order.
 *
 * Owned by the top-level flow only; not thread-safe.
 */
class ReconcilerSet final {
 public:
  ReconcilerSet() = default;
  ReconcilerSet(const ReconcilerSet&) = delete;
  ReconcilerSet& operator=(const ReconcilerSet&) = delete;

  /**
   * @brief Construct a reconciler and add it under @p name.
   * @return false (with a warning) if the factory failed or the name is taken.
   */
  bool TryAdd(const std::string& name, const ReconcilerFactory& factory) {
    if (Contains(name)) {
      KCORE_LOG_WARN("Reconciler", "reconciler %s already registered", name.c_str());
      return false;
    }
    auto r = factory();
    if (!r) {
      KCORE_LOG_WARN("Reconciler", "failed to initialize %s reconciler: %s", name.c_str(),
                     ReconcilerErrorToString(r.get_error()));
      return false;
    }
    entries_.push_back(Entry{name, std::move(r.value())});
    return true;
  }

  /// @brief Run every reconciler. @return Number that started.
  uint32_t RunAll() {
    uint32_t started = 0;
    for (auto& e : entries_) {
      auto r = e.reconciler->Run();
      if (!r) {
        KCORE_LOG_WARN("Reconciler", "failed to start %s reconciler: %s", e.name.c_str(),
                       ReconcilerErrorToString(r.get_error()));
        continue;
      }
      ++started;
    }
    return started;
  }

  void StopAll() {
    for (auto& e : entries_) {
      auto r = e.reconciler->Stop();
      if (!r) {
        KCORE_LOG_WARN("Reconciler", "failed to stop %s reconciler: %s", e.name.c_str(),
                       ReconcilerErrorToString(r.get_error()));
      }
    }
  }

  bool Contains(const std::string& name) const {
    for (const auto& e : entries_) {
      if (e.name == name) return true;
    }
    return false;
  }

  Reconciler* Get(const std::string& name) const {
    for (const auto& e : entries_) {
      if (e.name == name) return e.reconciler.get();
    }
    return nullptr;
  }

  size_t Size() const noexcept { return entries_.size(); }

  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
  }

 private:
  struct Entry {
    std::string name;
    ReconcilerPtr reconciler;
  };

  std::vector<Entry> entries_;
};

// ============================================================================
// ManifestReconciler
// ============================================================================

using ManifestRenderer = std::function<expected<std::string, ReconcilerError>()>;

/**
 * @brief Keeps manifests/<dir>/<name>.yaml equal to the renderer's output.
 *
 * Run writes the manifest once and then re-renders every interval, touching
 * the file only when the content changed.
 */
class ManifestReconciler final : public Reconciler {
 public:
  ManifestReconciler(std::string name, std::string dir, ManifestRenderer renderer,
                     uint32_t interval_ms)
      : name_(std::move(name)),
        dir_(std::move(dir)),
        renderer_(std::move(renderer)),
        interval_ms_(interval_ms) {}

  ReconcilerResult Run() override {
    auto r = Reconcile();
    if (!r) return r;
    if (!ticker_.Start(interval_ms_, [this] { (void)Reconcile(); })) {
      return ReconcilerResult::error(ReconcilerError::kRunFailed);
    }
    return ReconcilerResult::success();
  }

  ReconcilerResult Stop() override {
    ticker_.Stop();
    return ReconcilerResult::success();
  }

  std::string ManifestPath() const { return dir_ + "/" + name_ + ".yaml"; }

  /// @brief Render and write if changed.
  ReconcilerResult Reconcile() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto content = renderer_();
    if (!content) {
      KCORE_LOG_WARN("Reconciler", "%s: cannot render manifest", name_.c_str());
      return ReconcilerResult::error(content.get_error());
    }
    if (content.value() == last_ && FileExists(ManifestPath())) {
      return ReconcilerResult::success();
    }
    if (!InitDirectory(dir_, kManifestsDirMode) ||
        !WriteFileAtomic(ManifestPath(), content.value(), 0644)) {
      KCORE_LOG_WARN("Reconciler", "%s: cannot write %s", name_.c_str(),
                     ManifestPath().c_str());
      return ReconcilerResult::error(ReconcilerError::kWriteFailed);
    }
    last_ = content.value();
    writes_.fetch_add(1U, std::memory_order_relaxed);
    KCORE_LOG_DEBUG("Reconciler", "%s: manifest updated", name_.c_str());
    return ReconcilerResult::success();
  }

  uint32_t WriteCount() const noexcept { return writes_.load(std::memory_order_relaxed); }

 private:
  std::string name_;
  std::string dir_;
  ManifestRenderer renderer_;
  uint32_t interval_ms_;
  std::string last_;
  std::atomic<uint32_t> writes_{0};
  std::mutex mutex_;
  Ticker ticker_;
};

// ============================================================================
// Add-on manifests
// ============================================================================

namespace manifests {

inline std::string DefaultPsp() {
  return "apiVersion: policy/v1beta1\n"
         "kind: PodSecurityPolicy\n"
         "metadata:\n"
         "  name: 00-kcore-privileged\n"
         "spec:\n"
         "  privileged: true\n"
         "  allowPrivilegeEscalation: true\n"
         "  allowedCapabilities: ['*']\n"
         "  volumes: ['*']\n"
         "  hostNetwork: true\n"
         "  hostPorts:\n"
         "  - min: 0\n"
         "    max: 65535\n"
         "  hostIPC: true\n"
         "  hostPID: true\n"
         "  runAsUser:\n"
         "    rule: RunAsAny\n"
         "  seLinux:\n"
         "    rule: RunAsAny\n"
         "  supplementalGroups:\n"
         "    rule: RunAsAny\n"
         "  fsGroup:\n"
         "    rule: RunAsAny\n";
}

inline std::string KubeProxy(const ClusterConfig& c) {
  return "apiVersion: v1\n"
         "kind: ConfigMap\n"
         "metadata:\n"
         "  name: kube-proxy\n"
         "  namespace: kube-system\n"
         "data:\n"
         "  config.conf: |\n"
         "    apiVersion: kubeproxy.config.k8s.io/v1alpha1\n"
         "    kind: KubeProxyConfiguration\n"
         "    clusterCIDR: " + c.spec.network.pod_cidr + "\n"
         "    mode: iptables\n"
         "  kubeconfig.conf: |\n"
         "    apiVersion: v1\n"
         "    kind: Config\n"
         "    clusters:\n"
         "    - name: default\n"
         "      cluster:\n"
         "        certificate-authority: /var/run/secrets/kubernetes.io/serviceaccount/ca.crt\n"
         "        server: " + c.spec.api.Url() + "\n";
}

inline std::string CoreDns(const std::string& dns_address) {
  return "apiVersion: v1\n"
         "kind: ConfigMap\n"
         "metadata:\n"
         "  name: coredns\n"
         "  namespace: kube-system\n"
         "data:\n"
         "  Corefile: |\n"
         "    .:53 {\n"
         "        errors\n"
         "        health\n"
         "        ready\n"
         "        kubernetes cluster.local in-addr.arpa ip6.arpa {\n"
         "          pods insecure\n"
         "          fallthrough in-addr.arpa ip6.arpa\n"
         "        }\n"
         "        forward . /etc/resolv.conf\n"
         "        cache 30\n"
         "        loop\n"
         "        reload\n"
         "    }\n"
         "---\n"
         "apiVersion: v1\n"
         "kind: Service\n"
         "metadata:\n"
         "  name: kube-dns\n"
         "  namespace: kube-system\n"
         "spec:\n"
         "  clusterIP: " + dns_address + "\n"
         "  selector:\n"
         "    k8s-app: kube-dns\n"
         "  ports:\n"
         "  - name: dns\n"
         "    port: 53\n"
         "    protocol: UDP\n"
         "  - name: dns-tcp\n"
         "    port: 53\n"
         "    protocol: TCP\n";
}

inline std::string Calico(const ClusterConfig& c) {
  return "apiVersion: v1\n"
         "kind: ConfigMap\n"
         "metadata:\n"
         "  name: calico-config\n"
         "  namespace: kube-system\n"
         "data:\n"
         "  calico_backend: bird\n"
         "  veth_mtu: \"1440\"\n"
         "  cni_network_config: |-\n"
         "    {\n"
         "      \"name\": \"k8s-pod-network\",\n"
         "      \"cniVersion\": \"0.3.1\",\n"
         "      \"plugins\": [{\"type\": \"calico\", \"ipam\": {\"type\": \"calico-ipam\"}}]\n"
         "    }\n"
         "---\n"
         "apiVersion: crd.projectcalico.org/v1\n"
         "kind: IPPool\n"
         "metadata:\n"
         "  name: default-ipv4-ippool\n"
         "spec:\n"
         "  cidr: " + c.spec.network.pod_cidr + "\n"
         "  ipipMode: Always\n"
         "  natOutgoing: true\n";
}

inline std::string MetricServer() {
  return "apiVersion: apiregistration.k8s.io/v1\n"
         "kind: APIService\n"
         "metadata:\n"
         "  name: v1beta1.metrics.k8s.io\n"
         "spec:\n"
         "  group: metrics.k8s.io\n"
         "  version: v1beta1\n"
         "  groupPriorityMinimum: 100\n"
         "  versionPriority: 100\n"
         "  insecureSkipTLSVerify: true\n"
         "  service:\n"
         "    name: metrics-server\n"
         "    namespace: kube-system\n";
}

/// KubeletConfiguration document shared by every worker profile.
inline std::string KubeletConfiguration(const std::string& dns_address) {
  return "apiVersion: kubelet.config.k8s.io/v1beta1\n"
         "kind: KubeletConfiguration\n"
         "authentication:\n"
         "  anonymous:\n"
         "    enabled: false\n"
         "  webhook:\n"
         "    enabled: true\n"
         "authorization:\n"
         "  mode: Webhook\n"
         "clusterDNS:\n"
         "- " + dns_address + "\n"
         "clusterDomain: cluster.local\n"
         "cgroupsPerQOS: true\n"
         "rotateCertificates: true\n";
}

inline std::string KubeletConfig(const std::string& profile, const std::string& dns_address) {
  std::string out = "apiVersion: v1\n"
                    "kind: ConfigMap\n"
                    "metadata:\n"
                    "  name: kubelet-config-" + profile + "\n"
                    "  namespace: kube-system\n"
                    "data:\n"
                    "  kubelet: |\n";
  const std::string doc = KubeletConfiguration(dns_address);
  size_t pos = 0;
  while (pos < doc.size()) {
    size_t nl = doc.find('\n', pos);
    if (nl == std::string::npos) nl = doc.size();
    out += "    " + doc.substr(pos, nl - pos) + "\n";
    pos = nl + 1U;
  }
  return out;
}

inline std::string SystemRbac() {
  return "apiVersion: rbac.authorization.k8s.io/v1\n"
         "kind: ClusterRoleBinding\n"
         "metadata:\n"
         "  name: kcore:kubelet-bootstrap\n"
         "roleRef:\n"
         "  apiGroup: rbac.authorization.k8s.io\n"
         "  kind: ClusterRole\n"
         "  name: system:node-bootstrapper\n"
         "subjects:\n"
         "- apiGroup: rbac.authorization.k8s.io\n"
         "  kind: Group\n"
         "  name: system:bootstrappers\n"
         "---\n"
         "apiVersion: rbac.authorization.k8s.io/v1\n"
         "kind: ClusterRoleBinding\n"
         "metadata:\n"
         "  name: kcore:node-autoapprove-bootstrap\n"
         "roleRef:\n"
         "  apiGroup: rbac.authorization.k8s.io\n"
         "  kind: ClusterRole\n"
         "  name: system:certificates.k8s.io:certificatesigningrequests:nodeclient\n"
         "subjects:\n"
         "- apiGroup: rbac.authorization.k8s.io\n"
         "  kind: Group\n"
         "  name: system:bootstrappers\n";
}

}  // namespace manifests

// ============================================================================
// Construction
// ============================================================================

inline constexpr uint32_t kReconcileIntervalMs = 10000;

/// @brief Factory for a reconciler writing manifests/<name>/<name>.yaml.
inline ReconcilerFactory ManifestFactory(const std::string& name, const Paths& paths,
                                         ManifestRenderer renderer,
                                         uint32_t interval_ms = kReconcileIntervalMs) {
  const std::string dir = paths.manifests_dir + "/" + name;
  return [name, dir, renderer, interval_ms]() -> expected<ReconcilerPtr, ReconcilerError> {
    return expected<ReconcilerPtr, ReconcilerError>::success(
        std::make_unique<ManifestReconciler>(name, dir, renderer, interval_ms));
  };
}

/**
 * @brief Fill @p set with the cluster add-on reconcilers.
 *
 * Order: default-psp, kube-proxy, coredns, calico, metricServer,
 * kubeletConfig, systemRBAC. calico is only managed when it is the
 * configured provider.
 *
 * @return Number of reconcilers added.
 */
inline size_t BuildClusterReconcilers(const ClusterConfig& config, const Paths& paths,
                                      ReconcilerSet& set,
                                      uint32_t interval_ms = kReconcileIntervalMs) {
  using Rendered = expected<std::string, ReconcilerError>;
  const size_t before = set.Size();

  set.TryAdd("default-psp", ManifestFactory("default-psp", paths,
                                            [] { return Rendered::success(manifests::DefaultPsp()); },
                                            interval_ms));

  set.TryAdd("kube-proxy",
             ManifestFactory("kube-proxy", paths,
                             [config] { return Rendered::success(manifests::KubeProxy(config)); },
                             interval_ms));

  set.TryAdd("coredns", [&]() -> expected<ReconcilerPtr, ReconcilerError> {
    auto dns = config.spec.network.DNSAddress();
    if (!dns) {
      KCORE_LOG_WARN("Reconciler", "no DNS address in service CIDR %s",
                     config.spec.network.service_cidr.c_str());
      return expected<ReconcilerPtr, ReconcilerError>::error(ReconcilerError::kConstructFailed);
    }
    const std::string address = dns.value();
    return ManifestFactory("coredns", paths,
                           [address] { return Rendered::success(manifests::CoreDns(address)); },
                           interval_ms)();
  });

  if (config.spec.network.provider != kCalicoProvider) {
    KCORE_LOG_WARN("Reconciler", "network provider set to custom, kcore will not manage it");
  } else {
    set.TryAdd("calico", [&]() -> expected<ReconcilerPtr, ReconcilerError> {
      const std::string dir = paths.manifests_dir + "/calico";
      if (!InitDirectory(dir, kManifestsDirMode)) {
        KCORE_LOG_WARN("Reconciler", "cannot create calico manifests dir %s", dir.c_str());
        return expected<ReconcilerPtr, ReconcilerError>::error(
            ReconcilerError::kConstructFailed);
      }
      return ManifestFactory("calico", paths,
                             [config] { return Rendered::success(manifests::Calico(config)); },
                             interval_ms)();
    });
  }

  set.TryAdd("metricServer",
             ManifestFactory("metricServer", paths,
                             [] { return Rendered::success(manifests::MetricServer()); },
                             interval_ms));

  set.TryAdd("kubeletConfig", [&]() -> expected<ReconcilerPtr, ReconcilerError> {
    auto dns = config.spec.network.DNSAddress();
    if (!dns) {
      return expected<ReconcilerPtr, ReconcilerError>::error(ReconcilerError::kConstructFailed);
    }
    const std::string address = dns.value();
    return ManifestFactory("kubeletConfig", paths,
                           [address] {
                             return Rendered::success(
                                 manifests::KubeletConfig(kDefaultWorkerProfile, address));
                           },
                           interval_ms)();
  });

  set.TryAdd("systemRBAC",
             ManifestFactory("systemRBAC", paths,
                             [] { return Rendered::success(manifests::SystemRbac()); },
                             interval_ms));

  return set.Size() - before;
}

}  // namespace kcore

#endif  // KCORE_RECONCILERS_HPP_
