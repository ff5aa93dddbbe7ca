/**
 * @file component_manager.hpp
 * @brief Ordered bring-up and teardown of the node's component set.
 *
 * Two registration groups:
 *   - sync  : Init completes for all of them, in order, before any other
 *             component's Init begins (CA sync, certificate issuance).
 *   - async : everything else, initialized after the sync group.
 *
 * Failure policy:
 *   - Init  : fail-fast. The first failure is returned and no later
 *             component observes Init.
 *   - Start : best-effort. Every initialized component is attempted; the
 *             first error encountered is returned after all attempts.
 *   - Stop  : always best-effort, reverse order, each component exactly once.
 *
 * The registry is frozen once Init() begins. The only later append is
 * AddRunning(), for components the caller has already driven through
 * Init/Run itself; they take part in Stop() only.
 *
 * Usage:
 * @code
 *   kcore::ComponentManager mgr;
 *   mgr.AddSync(std::make_unique<CertificateIssuer>(...));
 *   mgr.Add(std::move(storage));
 *   mgr.Add(std::make_unique<ApiServer>(...));
 *   if (!mgr.Init()) return 1;
 *   auto started = mgr.Start();
 *   ...
 *   (void)mgr.Stop();
 * @endcode
 */

#ifndef KCORE_COMPONENT_MANAGER_HPP_
#define KCORE_COMPONENT_MANAGER_HPP_

#include "kcore/component.hpp"
#include "kcore/log.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcore {

class ComponentManager final {
 public:
  ComponentManager() = default;
  ~ComponentManager() = default;

  ComponentManager(const ComponentManager&) = delete;
  ComponentManager& operator=(const ComponentManager&) = delete;

  // --------------------------------------------------------------------------
  // Registration
  // --------------------------------------------------------------------------

  /**
   * @brief Append @p c to the sync group.
   * @return kRegistryFrozen once Init() has been invoked.
   */
  ComponentResult AddSync(ComponentPtr c) {
    if (frozen_) return Rejected(c);
    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(sync_count_),
                    Entry(std::move(c), true, false));
    ++sync_count_;
    return ComponentResult::success();
  }

  /**
   * @brief Append @p c to the async group.
   * @return kRegistryFrozen once Init() has been invoked.
   */
  ComponentResult Add(ComponentPtr c) {
    if (frozen_) return Rejected(c);
    entries_.emplace_back(std::move(c), false, false);
    return ComponentResult::success();
  }

  /**
   * @brief Hand over a component the caller already initialized and ran.
   *
   * Allowed at any time. The component is skipped by Init/Start and is the
   * first to be stopped.
   */
  void AddRunning(ComponentPtr c) {
    KCORE_LOG_DEBUG("Manager", "adopting running component %s", c->Name());
    entries_.emplace_back(std::move(c), false, true);
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Init every sync component, then every async component.
   *
   * Sequential, registration order, fail-fast.
   */
  ComponentResult Init() {
    frozen_ = true;
    for (auto& e : entries_) {
      if (e.adopted) continue;
      KCORE_LOG_DEBUG("Manager", "initializing %s%s", e.component->Name(),
                      e.sync ? " (sync)" : "");
      auto r = e.component->Init();
      if (!r.has_value()) {
        KCORE_LOG_ERROR("Manager", "failed to initialize %s: %s",
                        e.component->Name(), ComponentErrorToString(r.get_error()));
        return r;
      }
      e.initialized = true;
    }
    return ComponentResult::success();
  }

  /**
   * @brief Run every successfully initialized component, in Init order.
   * @return The first error encountered, after all have been attempted.
   */
  ComponentResult Start() {
    bool failed = false;
    ComponentError first = ComponentError::kRunFailed;
    for (auto& e : entries_) {
      if (!e.initialized) continue;
      KCORE_LOG_DEBUG("Manager", "starting %s", e.component->Name());
      auto r = e.component->Run();
      if (!r.has_value()) {
        KCORE_LOG_ERROR("Manager", "failed to start %s: %s",
                        e.component->Name(), ComponentErrorToString(r.get_error()));
        if (!failed) first = r.get_error();
        failed = true;
      }
    }
    return failed ? ComponentResult::error(first) : ComponentResult::success();
  }

  /**
   * @brief Stop every component in reverse order, continuing past failures.
   *
   * A component is stopped at most once across repeated calls.
   * @return kStopFailed if at least one Stop() failed.
   */
  ComponentResult Stop() {
    bool failed = false;
    for (size_t i = entries_.size(); i > 0U; --i) {
      Entry& e = entries_[i - 1U];
      if (e.stopped) continue;
      e.stopped = true;
      KCORE_LOG_DEBUG("Manager", "stopping %s", e.component->Name());
      auto r = e.component->Stop();
      if (!r.has_value()) {
        KCORE_LOG_WARN("Manager", "failed to stop %s: %s", e.component->Name(),
                       ComponentErrorToString(r.get_error()));
        failed = true;
      }
    }
    return failed ? ComponentResult::error(ComponentError::kStopFailed)
                  : ComponentResult::success();
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  uint32_t Size() const noexcept { return static_cast<uint32_t>(entries_.size()); }
  uint32_t SyncCount() const noexcept { return sync_count_; }
  bool IsFrozen() const noexcept { return frozen_; }

  /// Component names in Init order (adopted components last).
  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.emplace_back(e.component->Name());
    return out;
  }

  /// Names of the sync group, in Init order.
  std::vector<std::string> SyncNames() const {
    std::vector<std::string> out;
    for (uint32_t i = 0; i < sync_count_; ++i) {
      out.emplace_back(entries_[i].component->Name());
    }
    return out;
  }

 private:
  struct Entry {
    Entry(ComponentPtr c, bool is_sync, bool is_adopted)
        : component(std::move(c)),
          sync(is_sync),
          adopted(is_adopted),
          initialized(false),
          stopped(false) {}

    ComponentPtr component;
    bool sync;
    bool adopted;
    bool initialized;
    bool stopped;
  };

  static ComponentResult Rejected(const ComponentPtr& c) {
    KCORE_LOG_ERROR("Manager", "cannot register %s after Init",
                    (c != nullptr) ? c->Name() : "<null>");
    return ComponentResult::error(ComponentError::kRegistryFrozen);
  }

  std::vector<Entry> entries_;
  uint32_t sync_count_ = 0;
  bool frozen_ = false;
};

}  // namespace kcore

#endif  // KCORE_COMPONENT_MANAGER_HPP_
