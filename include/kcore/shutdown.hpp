/**
 * @file shutdown.hpp
 * @brief Graceful shutdown sequencing for the server process.
 *
 * Uses a pipe for async-signal-safe wakeup and sigaction(2) for SIGINT and
 * SIGTERM. A request made before WaitForShutdown() starts (a signal or a
 * Quit() from a startup error) stays buffered in the pipe and is not lost.
 *
 * State machine: Running -> Stopping -> Stopped. On Stopping the
 * reconcilers are stopped first, then the component manager.
 */

#ifndef KCORE_SHUTDOWN_HPP_
#define KCORE_SHUTDOWN_HPP_

#include "kcore/component.hpp"
#include "kcore/component_manager.hpp"
#include "kcore/log.hpp"
#include "kcore/platform.hpp"
#include "kcore/reconcilers.hpp"
#include "kcore/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace kcore {

enum class ShutdownError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

enum class ShutdownState : uint8_t {
  kRunning = 0,
  kStopping,
  kStopped,
};

class ShutdownSequencer;

namespace detail {

/// Exactly one ShutdownSequencer receives signals per process.
inline ShutdownSequencer*& GetShutdownInstance() {
  static ShutdownSequencer* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Waits for a termination request and tears the node down once.
 *
 * Usage:
 * @code
 *   kcore::ShutdownSequencer shutdown;
 *   shutdown.InstallSignalHandlers();
 *   ...
 *   if (!manager.Start()) shutdown.Quit(SIGTERM);
 *   shutdown.WaitForShutdown(reconcilers, manager);
 * @endcode
 */
class ShutdownSequencer final {
 public:
  ShutdownSequencer() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) return;
    if (::pipe2(pipe_fd_, O_CLOEXEC) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownSequencer() {
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownSequencer(const ShutdownSequencer&) = delete;
  ShutdownSequencer& operator=(const ShutdownSequencer&) = delete;
  ShutdownSequencer(ShutdownSequencer&&) = delete;
  ShutdownSequencer& operator=(ShutdownSequencer&&) = delete;

  /// False if another instance already existed or the pipe failed.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownSequencer::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /**
   * @brief Request shutdown as if @p signo had been received.
   *
   * Only the first request is recorded.
   */
  void Quit(int signo = SIGTERM) noexcept { Request(signo); }

  bool IsShutdownRequested() const noexcept { return Signal() != 0; }

  /// Signal number of the first request (0 if none yet).
  int Signal() const noexcept { return signo_.load(); }

  ShutdownState State() const noexcept { return state_.load(std::memory_order_acquire); }

  /// @brief Block until a shutdown request arrives. @return Its signal number.
  int Wait() noexcept {
    if (pipe_fd_[0] >= 0 && Signal() == 0) {
      uint8_t buf = 0;
      while (::read(pipe_fd_[0], &buf, 1) < 0 && errno == EINTR) {
      }
    }
    return Signal();
  }

  /**
   * @brief Running -> Stopping -> Stopped: stop @p reconcilers, then
   *        @p manager. A second call does nothing.
   * @return The result of ComponentManager::Stop().
   */
  ComponentResult Shutdown(ReconcilerSet& reconcilers, ComponentManager& manager) {
    ShutdownState expected_state = ShutdownState::kRunning;
    if (!state_.compare_exchange_strong(expected_state, ShutdownState::kStopping)) {
      return ComponentResult::success();
    }
    KCORE_LOG_INFO("Shutdown", "shutting down (signal %d)", Signal());
    reconcilers.StopAll();
    auto r = manager.Stop();
    if (!r) {
      KCORE_LOG_WARN("Shutdown", "some components failed to stop");
    }
    state_.store(ShutdownState::kStopped, std::memory_order_release);
    KCORE_LOG_INFO("Shutdown", "shutdown complete");
    return r;
  }

  /// @brief Wait() followed by Shutdown().
  ComponentResult WaitForShutdown(ReconcilerSet& reconcilers, ComponentManager& manager) {
    (void)Wait();
    return Shutdown(reconcilers, manager);
  }

 private:
  /// The signal number is the request: a non-zero signo_ is never observed
  /// without its value.
  void Request(int signo) noexcept {
    if (signo <= 0) signo = SIGTERM;
    int none = 0;
    if (signo_.compare_exchange_strong(none, signo)) {
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        // write(2) is async-signal-safe; the pipe never fills with one byte.
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  static void SignalHandler(int signo) {
    ShutdownSequencer* self = detail::GetShutdownInstance();
    if (self != nullptr) self->Request(signo);
  }

  int pipe_fd_[2];
  bool valid_ = false;
  std::atomic<int> signo_{0};
  std::atomic<ShutdownState> state_{ShutdownState::kRunning};
};

}  // namespace kcore

#endif  // KCORE_SHUTDOWN_HPP_
