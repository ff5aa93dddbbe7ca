/**
 * @file ticker.hpp
 * @brief Background thread that runs one callback at a fixed period.
 *
 * Used by the manifest applier, the telemetry reporter and the manifest
 * reconcilers. Stop() wakes the thread immediately instead of waiting for
 * the current period to elapse.
 *
 * Usage:
 * @code
 *   kcore::Ticker ticker;
 *   ticker.Start(10000, [this] { ApplyChanged(); });
 *   ...
 *   ticker.Stop();
 * @endcode
 */

#ifndef KCORE_TICKER_HPP_
#define KCORE_TICKER_HPP_

#include "kcore/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

namespace kcore {

enum class TickerError : uint8_t {
  kInvalidPeriod = 0,
  kAlreadyRunning,
};

class Ticker final {
 public:
  Ticker() = default;
  ~Ticker() { Stop(); }

  Ticker(const Ticker&) = delete;
  Ticker& operator=(const Ticker&) = delete;

  /**
   * @brief Start calling @p fn every @p period_ms (first call after one period).
   */
  expected<void, TickerError> Start(uint32_t period_ms, std::function<void()> fn) {
    if (period_ms == 0U) {
      return expected<void, TickerError>::error(TickerError::kInvalidPeriod);
    }
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TickerError>::error(TickerError::kAlreadyRunning);
    }
    period_ms_ = period_ms;
    fn_ = std::move(fn);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&Ticker::Loop, this);
    return expected<void, TickerError>::success();
  }

  /// @brief Stop and join. Safe to call when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint64_t TickCount() const noexcept { return ticks_.load(std::memory_order_relaxed); }

 private:
  void Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      if (cv_.wait_for(lock, std::chrono::milliseconds(period_ms_),
                       [this] { return !running_.load(std::memory_order_acquire); })) {
        break;
      }
      lock.unlock();
      fn_();
      ticks_.fetch_add(1U, std::memory_order_relaxed);
      lock.lock();
    }
  }

  uint32_t period_ms_ = 0;
  std::function<void()> fn_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread worker_;
};

}  // namespace kcore

#endif  // KCORE_TICKER_HPP_
