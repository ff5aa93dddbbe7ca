/**
 * @file platform.hpp
 * @brief Platform detection and assertion macro.
 */

#ifndef KCORE_PLATFORM_HPP_
#define KCORE_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace kcore {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define KCORE_PLATFORM_LINUX 1
#else
#error "kcore supervises Linux control-plane processes and requires Linux"
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "KCORE_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define KCORE_ASSERT(cond) ((void)0)
#else
#define KCORE_ASSERT(cond) \
  ((cond) ? ((void)0) : ::kcore::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace kcore

#endif  // KCORE_PLATFORM_HPP_
