/**
 * @file log.hpp
 * @brief Synchronous category-tagged logger with printf-style macros.
 *
 * Each record is formatted into a stack buffer and emitted with a single
 * fwrite(3) on stderr, so lines coming from supervisor threads never
 * interleave.
 *
 * Compile-time floor: KCORE_LOG_MIN_LEVEL (0=DEBUG ... 3=ERROR).
 * ERROR and FATAL are never compiled out.
 * Runtime gate: SetLevel() / GetLevel().
 *
 * Usage:
 * @code
 *   KCORE_LOG_INFO("Server", "using public address: %s", addr);
 * @endcode
 */

#ifndef KCORE_LOG_HPP_
#define KCORE_LOG_HPP_

#include "kcore/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <time.h>

#ifndef KCORE_LOG_MIN_LEVEL
#define KCORE_LOG_MIN_LEVEL 0
#endif

#ifndef KCORE_LOG_LINE_MAX
#define KCORE_LOG_LINE_MAX 1024U
#endif

namespace kcore {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// Format "YYYY-MM-DD HH:MM:SS.mmm" (local time) into @p buf.
inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  ::localtime_r(&ts.tv_sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      ts.tv_nsec / 1000000L);
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Mark the logger initialized (unbuffers stderr).
inline void Init() noexcept {
  (void)std::setvbuf(stderr, nullptr, _IONBF, 0);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char out[KCORE_LOG_LINE_MAX];
  int n = std::snprintf(out, sizeof(out), "[%s] [%s] [%s] ", ts,
                        detail::LevelTag(level),
                        (category != nullptr) ? category : "");
  if (n < 0) return;
  size_t len = static_cast<size_t>(n);

  if (len < sizeof(out)) {
    int m = std::vsnprintf(out + len, sizeof(out) - len, fmt, args);
    if (m > 0) len += static_cast<size_t>(m);
  }
#ifndef NDEBUG
  if (len < sizeof(out)) {
    int m = std::snprintf(out + len, sizeof(out) - len, " (%s:%d)",
                          detail::Basename(file), line);
    if (m > 0) len += static_cast<size_t>(m);
  }
#else
  (void)file;
  (void)line;
#endif
  // Truncated records still end with a newline.
  if (len >= sizeof(out)) len = sizeof(out) - 1;
  out[len++] = '\n';
  (void)std::fwrite(out, 1, len, stderr);
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace kcore

// ============================================================================
// Macros
// ============================================================================

#define KCORE_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                      \
    if (KCORE_LOG_MIN_LEVEL <= 0) {                                         \
      ::kcore::log::LogWrite(::kcore::log::Level::kDebug, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define KCORE_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                      \
    if (KCORE_LOG_MIN_LEVEL <= 1) {                                         \
      ::kcore::log::LogWrite(::kcore::log::Level::kInfo, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define KCORE_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                      \
    if (KCORE_LOG_MIN_LEVEL <= 2) {                                         \
      ::kcore::log::LogWrite(::kcore::log::Level::kWarn, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                       \
  } while (0)

#define KCORE_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                      \
    ::kcore::log::LogWrite(::kcore::log::Level::kError, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
  } while (0)

/// Logs unconditionally, then aborts.
#define KCORE_LOG_FATAL(cat, fmt, ...)                                      \
  do {                                                                      \
    ::kcore::log::LogWrite(::kcore::log::Level::kFatal, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    std::abort();                                                           \
  } while (0)

#endif  // KCORE_LOG_HPP_
