/**
 * @file platform.hpp
 * @brief Platform detection, clocks and assertion macros.
 */

#ifndef FLUX_PLATFORM_HPP_
#define FLUX_PLATFORM_HPP_

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace flux {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FLUX_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FLUX_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define FLUX_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Clocks
// ============================================================================

/// @brief Monotonic timestamp in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

/// @brief Wall-clock timestamp in microseconds since the Unix epoch.
inline uint64_t WallNowUs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

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
  (void)std::fprintf(stderr, "FLUX_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FLUX_ASSERT(cond) ((void)0)
#else
#define FLUX_ASSERT(cond) \
  ((cond) ? ((void)0) : ::flux::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace flux

#endif  // FLUX_PLATFORM_HPP_
