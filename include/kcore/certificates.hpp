/**
 * @file certificates.hpp
 * @brief Cluster CA, leaf certificates and kubeconfigs, generated with openssl.
 *
 * Layout under Paths::cert_dir (mode 0700):
 *   ca.crt / ca.key                  cluster CA (generated or synced from a peer)
 *   <name>.crt / <name>.key          leaf certificates signed by the CA
 *   sa.key / sa.pub                  service-account signing key pair
 *   <user>.conf                      kubeconfigs (admin.conf is written last)
 *
 * Every operation is idempotent: existing files are kept untouched.
 */

#ifndef KCORE_CERTIFICATES_HPP_
#define KCORE_CERTIFICATES_HPP_

#include "kcore/cluster_config.hpp"
#include "kcore/component.hpp"
#include "kcore/constants.hpp"
#include "kcore/join_client.hpp"
#include "kcore/log.hpp"
#include "kcore/supervisor.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace kcore {

enum class CertError : uint8_t {
  kCommandFailed = 0,
  kWriteFailed,
  kDirectoryFailed,
};

struct CertRequest {
  std::string name;                    ///< File stem under cert_dir
  std::string cn;
  std::string o;                       ///< Organization, may be empty
  std::vector<std::string> hostnames;  ///< SANs: IPv4 literals or DNS names
};

struct Certificate {
  std::string cert_path;
  std::string key_path;
};

// ============================================================================
// CertificateManager
// ============================================================================

/**
 * @brief Value handle over the PKI directory and a command runner.
 *
 * Copied into every component that needs certificates.
 */
class CertificateManager {
 public:
  CertificateManager(const Paths& paths, CommandRunner runner)
      : paths_(paths), runner_(std::move(runner)) {}

  std::string CaCertPath() const { return paths_.cert_dir + "/ca.crt"; }
  std::string CaKeyPath() const { return paths_.cert_dir + "/ca.key"; }
  std::string CertPath(const std::string& name) const {
    return paths_.cert_dir + "/" + name + ".crt";
  }
  std::string KeyPath(const std::string& name) const {
    return paths_.cert_dir + "/" + name + ".key";
  }
  const Paths& paths() const noexcept { return paths_; }

  /// @brief Generate the cluster CA unless both CA files exist.
  expected<void, CertError> EnsureCA() const {
    if (FileExists(CaCertPath()) && FileExists(CaKeyPath())) {
      KCORE_LOG_DEBUG("Certs", "CA already present at %s", CaCertPath().c_str());
      return expected<void, CertError>::success();
    }
    if (!InitDirectory(paths_.cert_dir, kCertRootDirMode)) {
      return expected<void, CertError>::error(CertError::kDirectoryFailed);
    }
    KCORE_LOG_INFO("Certs", "generating cluster CA");
    if (!Run({"openssl", "req", "-x509", "-new", "-nodes", "-newkey", "rsa:2048",
              "-sha256", "-days", "3650", "-subj", "/CN=kubernetes-ca",
              "-keyout", CaKeyPath(), "-out", CaCertPath()})) {
      return expected<void, CertError>::error(CertError::kCommandFailed);
    }
    return Restrict(CaKeyPath());
  }

  /**
   * @brief Issue a CA-signed certificate for @p req unless it exists.
   */
  expected<Certificate, CertError> EnsureCertificate(const CertRequest& req) const {
    Certificate cert;
    cert.cert_path = CertPath(req.name);
    cert.key_path = KeyPath(req.name);
    if (FileExists(cert.cert_path) && FileExists(cert.key_path)) {
      return expected<Certificate, CertError>::success(std::move(cert));
    }
    KCORE_LOG_INFO("Certs", "issuing certificate %s (CN=%s)", req.name.c_str(),
                   req.cn.c_str());

    const std::string csr = paths_.cert_dir + "/" + req.name + ".csr";
    const std::string ext = paths_.cert_dir + "/" + req.name + ".ext";
    std::string subject = "/CN=" + req.cn;
    if (!req.o.empty()) subject += "/O=" + req.o;

    if (!WriteFileAtomic(ext, ExtensionFile(req.hostnames), 0600)) {
      return expected<Certificate, CertError>::error(CertError::kWriteFailed);
    }
    bool ok = Run({"openssl", "genrsa", "-out", cert.key_path, "2048"}) &&
              Run({"openssl", "req", "-new", "-key", cert.key_path, "-subj", subject,
                   "-out", csr}) &&
              Run({"openssl", "x509", "-req", "-in", csr, "-CA", CaCertPath(),
                   "-CAkey", CaKeyPath(), "-CAcreateserial", "-sha256", "-days", "365",
                   "-extfile", ext, "-out", cert.cert_path});
    (void)::unlink(csr.c_str());
    (void)::unlink(ext.c_str());
    if (!ok) return expected<Certificate, CertError>::error(CertError::kCommandFailed);

    auto r = Restrict(cert.key_path);
    if (!r) return expected<Certificate, CertError>::error(r.get_error());
    return expected<Certificate, CertError>::success(std::move(cert));
  }

  /// @brief Generate <name>.key / <name>.pub unless the private key exists.
  expected<void, CertError> EnsureKeyPair(const std::string& name) const {
    const std::string key = KeyPath(name);
    const std::string pub = paths_.cert_dir + "/" + name + ".pub";
    if (FileExists(key) && FileExists(pub)) return expected<void, CertError>::success();
    if (!Run({"openssl", "genrsa", "-out", key, "2048"}) ||
        !Run({"openssl", "rsa", "-in", key, "-pubout", "-out", pub})) {
      return expected<void, CertError>::error(CertError::kCommandFailed);
    }
    return Restrict(key);
  }

  /**
   * @brief Write a client kubeconfig for @p user authenticating with @p cert.
   */
  expected<void, CertError> WriteKubeconfig(const std::string& path,
                                            const std::string& server,
                                            const std::string& user,
                                            const Certificate& cert) const {
    std::string doc;
    doc += "apiVersion: v1\n";
    doc += "kind: Config\n";
    doc += "clusters:\n";
    doc += "- name: local\n";
    doc += "  cluster:\n";
    doc += "    server: " + server + "\n";
    doc += "    certificate-authority: " + CaCertPath() + "\n";
    doc += "contexts:\n";
    doc += "- name: " + user + "@local\n";
    doc += "  context:\n";
    doc += "    cluster: local\n";
    doc += "    user: " + user + "\n";
    doc += "current-context: " + user + "@local\n";
    doc += "users:\n";
    doc += "- name: " + user + "\n";
    doc += "  user:\n";
    doc += "    client-certificate: " + cert.cert_path + "\n";
    doc += "    client-key: " + cert.key_path + "\n";
    if (!WriteFileAtomic(path, doc, 0600)) {
      KCORE_LOG_ERROR("Certs", "cannot write %s", path.c_str());
      return expected<void, CertError>::error(CertError::kWriteFailed);
    }
    return expected<void, CertError>::success();
  }

 private:
  bool Run(const std::vector<std::string>& argv) const {
    return RunChecked(runner_, "Certs", argv);
  }

  static expected<void, CertError> Restrict(const std::string& key_path) {
    if (::chmod(key_path.c_str(), 0600) != 0) {
      KCORE_LOG_ERROR("Certs", "cannot chmod %s", key_path.c_str());
      return expected<void, CertError>::error(CertError::kWriteFailed);
    }
    return expected<void, CertError>::success();
  }

  static std::string ExtensionFile(const std::vector<std::string>& hostnames) {
    std::string ext =
        "basicConstraints=CA:FALSE\n"
        "keyUsage=critical,digitalSignature,keyEncipherment\n"
        "extendedKeyUsage=serverAuth,clientAuth\n";
    std::string san;
    for (const auto& h : hostnames) {
      uint32_t ip = 0;
      if (!san.empty()) san += ',';
      san += (ParseIpv4(h, ip) ? "IP:" : "DNS:") + h;
    }
    if (!san.empty()) ext += "subjectAltName=" + san + "\n";
    return ext;
  }

  Paths paths_;
  CommandRunner runner_;
};

// ============================================================================
// CertificateIssuer
// ============================================================================

/**
 * @brief Sync component: CA, control-plane certificates and kubeconfigs.
 *
 * admin.conf is written only after everything else exists, so its presence
 * means the PKI is complete.
 */
class CertificateIssuer final : public Component {
 public:
  CertificateIssuer(const ClusterConfig& config, CertificateManager certs)
      : config_(config), certs_(std::move(certs)) {}

  const char* Name() const noexcept override { return "certificates"; }

  ComponentResult Init() override {
    const Paths& paths = certs_.paths();
    if (!InitDirectory(paths.cert_dir, kCertRootDirMode)) {
      KCORE_LOG_ERROR("Certs", "cannot create %s", paths.cert_dir.c_str());
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    if (!certs_.EnsureCA()) return Failed("ca");

    const ApiSpec& api = config_.spec.api;
    const std::string local_url = "https://localhost:" + std::to_string(api.port);

    CertRequest server{"server", "kube-apiserver", "", api.sans};
    auto internal = config_.spec.network.InternalApiAddress();
    if (internal.has_value()) server.hostnames.push_back(internal.value());
    for (const char* h : {"kubernetes", "kubernetes.default", "kubernetes.default.svc",
                          "kubernetes.default.svc.cluster.local", "localhost",
                          "127.0.0.1"}) {
      server.hostnames.emplace_back(h);
    }
    if (!certs_.EnsureCertificate(server)) return Failed("server");

    CertRequest etcd{"etcd", "etcd", "", {api.address, "127.0.0.1", "localhost"}};
    if (!certs_.EnsureCertificate(etcd)) return Failed("etcd");

    CertRequest konnectivity{"konnectivity", "kubernetes-konnectivity", "", {}};
    if (!certs_.EnsureCertificate(konnectivity)) return Failed("konnectivity");

    if (!certs_.EnsureKeyPair("sa")) return Failed("sa");

    struct Client {
      const char* name;
      const char* cn;
      const char* o;
    };
    const Client clients[] = {
        {"scheduler", "system:kube-scheduler", ""},
        {"controller-manager", "system:kube-controller-manager", ""},
        {"admin", "kubernetes-admin", "system:masters"},
    };
    for (const auto& c : clients) {
      auto cert = certs_.EnsureCertificate(CertRequest{c.name, c.cn, c.o, {}});
      if (!cert) return Failed(c.name);
      const std::string conf = (std::string(c.name) == "admin")
                                   ? paths.admin_kubeconfig
                                   : paths.cert_dir + "/" + c.name + ".conf";
      if (!certs_.WriteKubeconfig(conf, local_url, c.name, cert.value())) {
        return ComponentResult::error(ComponentError::kWriteFailed);
      }
    }
    KCORE_LOG_INFO("Certs", "certificates ready in %s", paths.cert_dir.c_str());
    return ComponentResult::success();
  }

  ComponentResult Run() override { return ComponentResult::success(); }
  ComponentResult Stop() override { return ComponentResult::success(); }

  const CertificateManager& Manager() const noexcept { return certs_; }

 private:
  static ComponentResult Failed(const char* what) {
    KCORE_LOG_ERROR("Certs", "failed to generate %s certificate", what);
    return ComponentResult::error(ComponentError::kCertificateFailed);
  }

  ClusterConfig config_;
  CertificateManager certs_;
};

// ============================================================================
// CertificateAuthoritySyncer
// ============================================================================

/**
 * @brief Sync component (join mode): fetch the cluster CA from a peer.
 *
 * Skipped when the CA files already exist, so a restarted joined node does
 * not need a fresh token round-trip.
 */
class CertificateAuthoritySyncer final : public Component {
 public:
  CertificateAuthoritySyncer(JoinClient client, const Paths& paths)
      : client_(std::move(client)), paths_(paths) {}

  const char* Name() const noexcept override { return "ca-syncer"; }

  ComponentResult Init() override {
    const std::string crt = paths_.cert_dir + "/ca.crt";
    const std::string key = paths_.cert_dir + "/ca.key";
    if (FileExists(crt) && FileExists(key)) {
      KCORE_LOG_INFO("Certs", "CA already synced, skipping");
      return ComponentResult::success();
    }

    auto ca = client_.GetCA();
    if (!ca) {
      KCORE_LOG_ERROR("Certs", "failed to fetch CA from %s: %s", client_.Server().c_str(),
                      JoinErrorToString(ca.get_error()));
      return ComponentResult::error(ComponentError::kJoinFailed);
    }
    if (!InitDirectory(paths_.cert_dir, kCertRootDirMode)) {
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    if (!WriteFileAtomic(key, ca.value().key, 0600) ||
        !WriteFileAtomic(crt, ca.value().cert, 0644)) {
      KCORE_LOG_ERROR("Certs", "cannot write CA into %s", paths_.cert_dir.c_str());
      return ComponentResult::error(ComponentError::kWriteFailed);
    }
    KCORE_LOG_INFO("Certs", "CA synced from %s", client_.Server().c_str());
    return ComponentResult::success();
  }

  ComponentResult Run() override { return ComponentResult::success(); }
  ComponentResult Stop() override { return ComponentResult::success(); }

 private:
  JoinClient client_;
  Paths paths_;
};

}  // namespace kcore

#endif  // KCORE_CERTIFICATES_HPP_
