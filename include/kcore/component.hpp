/**
 * @file component.hpp
 * @brief Lifecycle contract shared by every managed control-plane unit.
 *
 * A Component is driven through Init -> Run -> Stop by the ComponentManager
 * (or, for worker components added after startup, directly by its owner).
 * Every call blocks until the requested state is reached or has failed.
 *
 * Stop() must be safe to call on a component that was never initialized or
 * never started, and must be idempotent.
 */

#ifndef KCORE_COMPONENT_HPP_
#define KCORE_COMPONENT_HPP_

#include "kcore/platform.hpp"
#include "kcore/vocabulary.hpp"

#include <cstdint>
#include <memory>

namespace kcore {

enum class ComponentError : uint8_t {
  kInitFailed = 0,
  kRunFailed,
  kStopFailed,
  kBinaryMissing,
  kStateDirFailed,
  kCertificateFailed,
  kJoinFailed,
  kWriteFailed,
  kRegistryFrozen,
};

inline const char* ComponentErrorToString(ComponentError e) noexcept {
  switch (e) {
    case ComponentError::kInitFailed:        return "init failed";
    case ComponentError::kRunFailed:         return "run failed";
    case ComponentError::kStopFailed:        return "stop failed";
    case ComponentError::kBinaryMissing:     return "binary missing or not executable";
    case ComponentError::kStateDirFailed:    return "cannot create state directory";
    case ComponentError::kCertificateFailed: return "certificate generation failed";
    case ComponentError::kJoinFailed:        return "join request failed";
    case ComponentError::kWriteFailed:       return "write failed";
    case ComponentError::kRegistryFrozen:    return "registry frozen";
    default:                                 return "unknown";
  }
}

using ComponentResult = expected<void, ComponentError>;

/**
 * @brief Abstract managed unit (storage, API server, certificates, ...).
 */
class Component {
 public:
  virtual ~Component() = default;

  /// Stable name used in logs and registry queries.
  virtual const char* Name() const noexcept = 0;

  /// Prepare everything the unit needs to run (files, dirs, certs).
  virtual ComponentResult Init() = 0;

  /// Bring the unit up; returns once it is running (or failed).
  virtual ComponentResult Run() = 0;

  /// Bring the unit down. Idempotent; tolerated before Init/Run.
  virtual ComponentResult Stop() = 0;
};

using ComponentPtr = std::unique_ptr<Component>;

}  // namespace kcore

#endif  // KCORE_COMPONENT_HPP_
