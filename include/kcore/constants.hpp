/**
 * @file constants.hpp
 * @brief On-disk layout of a kcore node and directory/file helpers.
 */

#ifndef KCORE_CONSTANTS_HPP_
#define KCORE_CONSTANTS_HPP_

#include "kcore/platform.hpp"
#include "kcore/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace kcore {

inline constexpr const char* kVersion = "0.4.0";
inline constexpr const char* kAppId = "kcore";
inline constexpr const char* kDefaultDataDir = "/var/lib/kcore";
inline constexpr const char* kDefaultConfigPath = "k0s.yaml";
inline constexpr const char* kDefaultWorkerProfile = "default";
/// Bounds kubectl calls made from the driving flow and the applier ticker.
inline constexpr const char* kKubectlRequestTimeout = "--request-timeout=30s";

inline constexpr mode_t kDataDirMode = 0755;
inline constexpr mode_t kCertRootDirMode = 0700;
inline constexpr mode_t kManifestsDirMode = 0755;

enum class FsError : uint8_t {
  kCreateFailed = 0,
  kNotADirectory,
  kChmodFailed,
  kWriteFailed,
  kReadFailed,
};

// ============================================================================
// Paths
// ============================================================================

/**
 * @brief Every well-known location used by the node, derived from one root.
 *
 * admin_kubeconfig is written once the control plane has issued its admin
 * credentials; kubelet_auth_config exists once the node has joined as a
 * worker. Both are polled as readiness signals, never assumed.
 */
struct Paths {
  std::string data_dir;
  std::string bin_dir;
  std::string cert_dir;
  std::string run_dir;
  std::string manifests_dir;
  std::string admin_kubeconfig;
  std::string kubelet_auth_config;
  std::string kubelet_bootstrap_config;

  static Paths FromDataDir(const std::string& root) {
    Paths p;
    p.data_dir = root;
    p.bin_dir = root + "/bin";
    p.cert_dir = root + "/pki";
    p.run_dir = root + "/run";
    p.manifests_dir = root + "/manifests";
    p.admin_kubeconfig = p.cert_dir + "/admin.conf";
    p.kubelet_auth_config = root + "/kubelet.conf";
    p.kubelet_bootstrap_config = root + "/kubelet-bootstrap.conf";
    return p;
  }

  /// State directory of one component ("etcd", "kine", "kubelet", ...).
  std::string StateDir(const char* component) const {
    return data_dir + "/" + component;
  }
};

// ============================================================================
// Filesystem helpers
// ============================================================================

inline bool FileExists(const std::string& path) noexcept {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

inline bool IsExecutable(const std::string& path) noexcept {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

/**
 * @brief Create @p path (and missing parents) and force its mode.
 *
 * An existing directory is accepted; its permissions are reset to @p mode.
 */
inline expected<void, FsError> InitDirectory(const std::string& path,
                                             mode_t mode) {
  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i <= path.size(); ++i) {
    if (i == path.size() || (path[i] == '/' && i > 0)) {
      partial = path.substr(0, i);
      if (::mkdir(partial.c_str(), (i == path.size()) ? mode : 0755) != 0 &&
          errno != EEXIST) {
        return expected<void, FsError>::error(FsError::kCreateFailed);
      }
    }
  }
  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    return expected<void, FsError>::error(FsError::kNotADirectory);
  }
  if (::chmod(path.c_str(), mode) != 0) {
    return expected<void, FsError>::error(FsError::kChmodFailed);
  }
  return expected<void, FsError>::success();
}

/// @brief Atomically replace @p path with @p content (write temp + rename).
inline expected<void, FsError> WriteFileAtomic(const std::string& path,
                                               const std::string& content,
                                               mode_t mode) {
  std::string tmp = path + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0) return expected<void, FsError>::error(FsError::kWriteFailed);
  size_t off = 0;
  while (off < content.size()) {
    ssize_t n = ::write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      ::close(fd);
      ::unlink(tmp.c_str());
      return expected<void, FsError>::error(FsError::kWriteFailed);
    }
    off += static_cast<size_t>(n);
  }
  // open(2) honours the umask; the final mode must not.
  bool ok = (::fchmod(fd, mode) == 0);
  ok = (::close(fd) == 0) && ok;
  if (!ok || ::rename(tmp.c_str(), path.c_str()) != 0) {
    ::unlink(tmp.c_str());
    return expected<void, FsError>::error(FsError::kWriteFailed);
  }
  return expected<void, FsError>::success();
}

inline expected<std::string, FsError> ReadFile(const std::string& path) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) return expected<std::string, FsError>::error(FsError::kReadFailed);
  std::string out;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  bool failed = std::ferror(f) != 0;
  std::fclose(f);
  if (failed) return expected<std::string, FsError>::error(FsError::kReadFailed);
  return expected<std::string, FsError>::success(std::move(out));
}

}  // namespace kcore

#endif  // KCORE_CONSTANTS_HPP_
