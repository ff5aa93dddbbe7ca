/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file supervisor.hpp
 * @brief Child process spawn, output capture and respawning supervision.
 *
 * Layers:
 *   - ChildProcess   : fork/exec one child in its own session, stdout and
 *                      stderr merged into a non-blocking pipe.
 *   - RunCommand     : one-shot helper (openssl, curl, kubectl, modprobe).
 *   - Supervisor     : keeps one binary running; a monitor thread forwards
 *                      its output to the log and respawns it after
 *                      respawn_timeout when it exits.
 *   - SupervisedComponent : Component whose Run/Stop drive a Supervisor.
 *
 * Stop sequence: stop respawning, SIGTERM, wait stop_timeout, SIGKILL, reap.
 */

#ifndef KCORE_SUPERVISOR_HPP_
#define KCORE_SUPERVISOR_HPP_

#include "kcore/component.hpp"
#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/platform.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kcore {

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,  ///< pipe/fork error or signal delivery failed
};

namespace detail {

inline void SleepMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

/// Owns one file descriptor; closes it on destruction. Move-only.
class FdHandle {
 public:
  FdHandle() noexcept = default;
  explicit FdHandle(int fd) noexcept : fd_(fd) {}
  ~FdHandle() { Close(); }

  FdHandle(FdHandle&& other) noexcept : fd_(other.Release()) {}
  FdHandle& operator=(FdHandle&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.Release();
    }
    return *this;
  }
  FdHandle(const FdHandle&) = delete;
  FdHandle& operator=(const FdHandle&) = delete;

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }

  int Release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

/// Child-side setup between fork and exec. Never returns.
[[noreturn]] inline void ExecChild(const std::vector<std::string>& argv,
                                   const std::string& working_dir, int output_fd) {
  // Own session so terminal signals aimed at kcore do not reach the child.
  ::setsid();

  // Ignored dispositions and the blocked mask survive exec.
  struct sigaction dfl;
  std::memset(&dfl, 0, sizeof(dfl));
  dfl.sa_handler = SIG_DFL;
  for (int sig = 1; sig < NSIG; ++sig) (void)::sigaction(sig, &dfl, nullptr);
  sigset_t empty;
  ::sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);

  if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) ::_exit(127);

  int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    ::dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  ::dup2(output_fd, STDOUT_FILENO);
  ::dup2(output_fd, STDERR_FILENO);

  std::vector<char*> ptrs;
  ptrs.reserve(argv.size() + 1U);
  for (const auto& a : argv) ptrs.push_back(const_cast<char*>(a.c_str()));
  ptrs.push_back(nullptr);
  ::execvp(ptrs[0], ptrs.data());
  ::_exit(127);
}

}  // namespace detail

/// How a reaped child ended.
struct ExitStatus {
  int code = -1;    ///< exit code, -1 when killed by a signal
  int signal = 0;   ///< terminating signal, 0 on normal exit

  static ExitStatus FromWaitStatus(int status) {
    ExitStatus s;
    if (WIFEXITED(status)) s.code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) s.signal = WTERMSIG(status);
    return s;
  }
};

// ============================================================================
// ChildProcess
// ============================================================================

/**
 * @brief One forked child with stdout and stderr merged into a pipe.
 *
 * The destructor SIGKILLs and reaps a child that was never waited for.
 * An exec failure shows up as exit code 127.
 */
class ChildProcess {
 public:
  ChildProcess() = default;
  ~ChildProcess() { Discard(); }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ProcessResult Spawn(const std::vector<std::string>& argv,
                      const std::string& working_dir = std::string()) {
    Discard();
    if (argv.empty() || argv[0].empty()) return ProcessResult::kFailed;

    int fds[2];
    // O_CLOEXEC keeps this pipe out of siblings spawned by other threads.
    if (::pipe2(fds, O_CLOEXEC) != 0) return ProcessResult::kFailed;
    detail::FdHandle read_end(fds[0]);
    detail::FdHandle write_end(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) return ProcessResult::kFailed;
    if (pid == 0) detail::ExecChild(argv, working_dir, write_end.get());

    pid_ = pid;
    output_ = std::move(read_end);
    int flags = ::fcntl(output_.get(), F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(output_.get(), F_SETFL, flags | O_NONBLOCK);
    return ProcessResult::kSuccess;
  }

  /// Append whatever output is available without blocking.
  void ReadAvailable(std::string& sink) {
    if (!output_.valid()) return;
    char buf[1024];
    for (;;) {
      ssize_t n = ::read(output_.get(), buf, sizeof(buf));
      if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n == 0) output_.Close();
      return;
    }
  }

  /// Block until the child closes its output.
  std::string ReadToEnd() {
    std::string all;
    if (!output_.valid()) return all;
    int flags = ::fcntl(output_.get(), F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(output_.get(), F_SETFL, flags & ~O_NONBLOCK);
    char buf[4096];
    ssize_t n;
    while ((n = ::read(output_.get(), buf, sizeof(buf))) != 0) {
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      all.append(buf, static_cast<size_t>(n));
    }
    output_.Close();
    return all;
  }

  /**
   * @brief Reap the child, polling for at most @p timeout_ms.
   * @return true and @p status filled once the child is gone.
   */
  bool WaitFor(uint32_t timeout_ms, ExitStatus& status) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
      if (TryReap(status)) return true;
      if (pid_ <= 0 || std::chrono::steady_clock::now() >= deadline) return false;
      detail::SleepMs(5);
    }
  }

  ExitStatus Wait() {
    ExitStatus status;
    if (pid_ <= 0) return status;
    int raw = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &raw, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) status = ExitStatus::FromWaitStatus(raw);
    pid_ = -1;
    return status;
  }

  bool Kill(int signo) { return pid_ > 0 && ::kill(pid_, signo) == 0; }

  pid_t pid() const noexcept { return pid_; }

 private:
  bool TryReap(ExitStatus& status) {
    if (pid_ <= 0) return false;
    int raw = 0;
    pid_t r = ::waitpid(pid_, &raw, WNOHANG);
    if (r == pid_) {
      status = ExitStatus::FromWaitStatus(raw);
      pid_ = -1;
      return true;
    }
    if (r < 0 && errno == ECHILD) {
      pid_ = -1;
      return true;
    }
    return false;
  }

  void Discard() {
    output_.Close();
    if (pid_ > 0) {
      (void)::kill(pid_, SIGKILL);
      (void)Wait();
    }
  }

  pid_t pid_ = -1;
  detail::FdHandle output_;
};

// ============================================================================
// RunCommand
// ============================================================================

/**
 * @brief Run @p argv to completion, capturing stdout and stderr.
 *
 * @param[out] output    Combined output.
 * @param[out] exit_code Child exit code (-1 if killed by a signal).
 * @return kSuccess if the child ran and was reaped, kFailed on spawn error.
 *
 * @code
 *   std::string out;
 *   int code;
 *   kcore::RunCommand({"openssl", "version"}, out, code);
 * @endcode
 */
inline ProcessResult RunCommand(const std::vector<std::string>& argv,
                                std::string& output, int& exit_code) {
  ChildProcess child;
  ProcessResult r = child.Spawn(argv);
  if (r != ProcessResult::kSuccess) return r;
  output = child.ReadToEnd();
  exit_code = child.Wait().code;
  return ProcessResult::kSuccess;
}

/// Injectable one-shot command execution (tests substitute a fake).
using CommandRunner = std::function<ProcessResult(
    const std::vector<std::string>& argv, std::string& output, int& exit_code)>;

inline CommandRunner SystemCommandRunner() {
  return [](const std::vector<std::string>& argv, std::string& output,
            int& exit_code) { return RunCommand(argv, output, exit_code); };
}

/**
 * @brief Run a command and require exit status 0.
 *
 * Logs the command output under @p category on failure.
 */
inline bool RunChecked(const CommandRunner& runner, const char* category,
                       const std::vector<std::string>& argv,
                       std::string* output = nullptr) {
  std::string out;
  int code = -1;
  if (runner(argv, out, code) != ProcessResult::kSuccess) {
    KCORE_LOG_ERROR(category, "failed to spawn %s", argv.empty() ? "?" : argv[0].c_str());
    return false;
  }
  if (code != 0) {
    KCORE_LOG_ERROR(category, "%s exited with code %d: %s",
                    argv.empty() ? "?" : argv[0].c_str(), code, out.c_str());
    return false;
  }
  if (output != nullptr) *output = std::move(out);
  return true;
}

// ============================================================================
// Supervisor
// ============================================================================

enum class SupervisorError : uint8_t {
  kAlreadyRunning = 0,
  kSpawnFailed,
};

struct SupervisorConfig {
  std::string name;                  ///< Log category of the child output
  std::string binary;                ///< Absolute path of the executable
  std::vector<std::string> args;     ///< Arguments (without argv[0])
  std::string working_dir;
  uint32_t respawn_timeout_ms = 5000;
  uint32_t stop_timeout_ms = 5000;
};

/**
 * @brief Keeps one binary running until Stop().
 *
 * Usage:
 * @code
 *   kcore::SupervisorConfig cfg;
 *   cfg.name = "kine";
 *   cfg.binary = "/var/lib/kcore/bin/kine";
 *   kcore::Supervisor sup(cfg);
 *   if (!sup.Supervise()) { ... }
 *   ...
 *   sup.Stop();
 * @endcode
 */
class Supervisor final {
 public:
  explicit Supervisor(SupervisorConfig cfg) : cfg_(std::move(cfg)) {}
  ~Supervisor() { Stop(); }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  /**
   * @brief Spawn the binary and start the monitor thread.
   * @return kSpawnFailed if the first spawn fails.
   */
  expected<void, SupervisorError> Supervise() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, SupervisorError>::error(SupervisorError::kAlreadyRunning);
    }
    argv_.clear();
    argv_.push_back(cfg_.binary);
    argv_.insert(argv_.end(), cfg_.args.begin(), cfg_.args.end());
    if (!Spawn()) {
      return expected<void, SupervisorError>::error(SupervisorError::kSpawnFailed);
    }
    running_.store(true, std::memory_order_release);
    monitor_ = std::thread(&Supervisor::MonitorLoop, this);
    return expected<void, SupervisorError>::success();
  }

  /// @brief Stop respawning and terminate the child. Idempotent.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();
    Terminate();
  }

  bool IsRunning() const noexcept { return pid_.load(std::memory_order_acquire) > 0; }
  pid_t Pid() const noexcept { return pid_.load(std::memory_order_acquire); }
  uint32_t RestartCount() const noexcept {
    return restarts_.load(std::memory_order_relaxed);
  }
  const SupervisorConfig& config() const noexcept { return cfg_; }

 private:
  static constexpr uint32_t kPollIntervalMs = 100;

  bool Spawn() {
    if (child_.Spawn(argv_, cfg_.working_dir) != ProcessResult::kSuccess) {
      KCORE_LOG_ERROR("Supervisor", "failed to spawn %s (%s)", cfg_.name.c_str(),
                      cfg_.binary.c_str());
      return false;
    }
    pid_.store(child_.pid(), std::memory_order_release);
    KCORE_LOG_INFO("Supervisor", "%s started, pid=%d", cfg_.name.c_str(),
                   static_cast<int>(child_.pid()));
    return true;
  }

  void MonitorLoop() {
    while (running_.load(std::memory_order_acquire)) {
      ExitStatus status;
      bool exited = child_.WaitFor(kPollIntervalMs, status);
      ForwardOutput();
      if (!exited) continue;

      pid_.store(-1, std::memory_order_release);
      FlushPartialLine();
      if (status.signal != 0) {
        KCORE_LOG_WARN("Supervisor", "%s killed by signal %d", cfg_.name.c_str(),
                       status.signal);
      } else {
        KCORE_LOG_WARN("Supervisor", "%s exited with code %d", cfg_.name.c_str(),
                       status.code);
      }

      std::unique_lock<std::mutex> lock(mtx_);
      if (cv_.wait_for(lock, std::chrono::milliseconds(cfg_.respawn_timeout_ms),
                       [this] { return !running_.load(std::memory_order_acquire); })) {
        break;
      }
      lock.unlock();
      uint32_t n = restarts_.fetch_add(1U, std::memory_order_relaxed) + 1U;
      KCORE_LOG_INFO("Supervisor", "respawning %s (#%u)", cfg_.name.c_str(), n);
      (void)Spawn();
    }
  }

  void Terminate() {
    if (child_.pid() > 0) {
      KCORE_LOG_INFO("Supervisor", "stopping %s, pid=%d", cfg_.name.c_str(),
                     static_cast<int>(child_.pid()));
      if (!child_.Kill(SIGTERM)) {
        KCORE_LOG_WARN("Supervisor", "failed to send SIGTERM to %s", cfg_.name.c_str());
      }
      ExitStatus status;
      if (!child_.WaitFor(cfg_.stop_timeout_ms, status)) {
        KCORE_LOG_WARN("Supervisor", "%s did not exit within %u ms, killing",
                       cfg_.name.c_str(), cfg_.stop_timeout_ms);
        if (!child_.Kill(SIGKILL)) {
          KCORE_LOG_WARN("Supervisor", "failed to send SIGKILL to %s", cfg_.name.c_str());
        }
        (void)child_.Wait();
      }
    }
    ForwardOutput();
    FlushPartialLine();
    pid_.store(-1, std::memory_order_release);
  }

  /// Log complete output lines under the component's name.
  void ForwardOutput() {
    child_.ReadAvailable(pending_);
    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
      if (nl > start) {
        KCORE_LOG_INFO(cfg_.name.c_str(), "%.*s", static_cast<int>(nl - start),
                       pending_.data() + start);
      }
      start = nl + 1U;
    }
    pending_.erase(0, start);
  }

  void FlushPartialLine() {
    if (!pending_.empty()) {
      KCORE_LOG_INFO(cfg_.name.c_str(), "%s", pending_.c_str());
      pending_.clear();
    }
  }

  SupervisorConfig cfg_;
  std::vector<std::string> argv_;
  ChildProcess child_;
  std::string pending_;
  std::atomic<bool> running_{false};
  std::atomic<pid_t> pid_{-1};
  std::atomic<uint32_t> restarts_{0};
  std::mutex mtx_;
  std::condition_variable cv_;
  std::thread monitor_;
};

// ============================================================================
// SupervisedComponent
// ============================================================================

/**
 * @brief Component backed by a supervised binary under Paths::bin_dir.
 *
 * Init checks the binary and creates the state directory, then calls
 * Prepare(). Run spawns the binary with Args(). Stop terminates it.
 */
class SupervisedComponent : public Component {
 public:
  const char* Name() const noexcept override { return name_.c_str(); }

  ComponentResult Init() override {
    const std::string bin = BinaryPath();
    if (!IsExecutable(bin)) {
      KCORE_LOG_ERROR(name_.c_str(), "%s does not exist or is not executable",
                      bin.c_str());
      return ComponentResult::error(ComponentError::kBinaryMissing);
    }
    if (!InitDirectory(StateDir(), state_dir_mode_)) {
      KCORE_LOG_ERROR(name_.c_str(), "cannot create %s", StateDir().c_str());
      return ComponentResult::error(ComponentError::kStateDirFailed);
    }
    return Prepare();
  }

  ComponentResult Run() override {
    if (supervisor_ != nullptr && supervisor_->IsRunning()) {
      return ComponentResult::success();
    }
    SupervisorConfig sc;
    sc.name = name_;
    sc.binary = BinaryPath();
    sc.args = Args();
    sc.working_dir = StateDir();
    sc.respawn_timeout_ms = respawn_timeout_ms_;
    sc.stop_timeout_ms = stop_timeout_ms_;
    supervisor_ = std::make_unique<Supervisor>(std::move(sc));
    if (!supervisor_->Supervise()) {
      return ComponentResult::error(ComponentError::kRunFailed);
    }
    return ComponentResult::success();
  }

  ComponentResult Stop() override {
    if (supervisor_ != nullptr) supervisor_->Stop();
    return ComponentResult::success();
  }

  bool IsRunning() const noexcept {
    return supervisor_ != nullptr && supervisor_->IsRunning();
  }

  void SetTimeouts(uint32_t respawn_ms, uint32_t stop_ms) noexcept {
    respawn_timeout_ms_ = respawn_ms;
    stop_timeout_ms_ = stop_ms;
  }

  std::string BinaryPath() const { return paths_.bin_dir + "/" + binary_; }
  std::string StateDir() const { return paths_.StateDir(state_.c_str()); }

  /// Command line the binary is (or would be) started with.
  virtual std::vector<std::string> Args() const = 0;

 protected:
  SupervisedComponent(std::string name, const Paths& paths, std::string binary,
                      std::string state_dir, mode_t state_dir_mode = kDataDirMode)
      : name_(std::move(name)),
        paths_(paths),
        binary_(std::move(binary)),
        state_(std::move(state_dir)),
        state_dir_mode_(state_dir_mode) {}

  /// Component-specific preparation after the common checks.
  virtual ComponentResult Prepare() { return ComponentResult::success(); }

  std::string name_;
  Paths paths_;
  std::string binary_;
  std::string state_;
  mode_t state_dir_mode_;
  uint32_t respawn_timeout_ms_ = 5000;
  uint32_t stop_timeout_ms_ = 5000;
  std::unique_ptr<Supervisor> supervisor_;
};

}  // namespace kcore

#endif  // KCORE_SUPERVISOR_HPP_
