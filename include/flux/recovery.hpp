/**
 * @file recovery.hpp
 * @brief Failure containment for caller-supplied work.
 *
 * RecoveryHandler() runs a callable that reports failure through
 * WorkResult. When the build has exceptions enabled, anything the callable
 * throws is caught, logged at ERROR with a banner, the exception message and
 * the current call stack, and turned into a WorkError. Nothing escapes to
 * the calling thread.
 *
 * Log layout for a thrown exception:
 *   ---------<tag>-Panic----------------
 *   Error: <what()>
 *   Stack of <n> frames:
 *     #0 ...
 *   ---------<tag>--END-----------------
 */

#ifndef FLUX_RECOVERY_HPP_
#define FLUX_RECOVERY_HPP_

#include "flux/log.hpp"
#include "flux/platform.hpp"
#include "flux/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define FLUX_HAS_EXCEPTIONS 1
#include <exception>
#endif

#if defined(FLUX_PLATFORM_LINUX) && defined(__GLIBC__)
#define FLUX_HAS_BACKTRACE 1
#include <execinfo.h>
#endif

namespace flux {

enum class WorkError : uint8_t {
  kFailed = 0,        ///< Work reported failure through its result.
  kException,         ///< Work threw a std::exception.
  kUnknownException,  ///< Work threw something else.
};

using WorkResult = expected<void, WorkError>;

namespace detail {

static constexpr int kMaxStackFrames = 32;

inline void LogStack() noexcept {
#ifdef FLUX_HAS_BACKTRACE
  void* frames[kMaxStackFrames];
  const int n = ::backtrace(frames, kMaxStackFrames);
  char** symbols = ::backtrace_symbols(frames, n);
  FLUX_LOG_ERROR("Recovery", "Stack of %d frames:", n);
  for (int i = 0; i < n; ++i) {
    FLUX_LOG_ERROR("Recovery", "  #%d %s", i, (symbols != nullptr) ? symbols[i] : "?");
  }
  std::free(symbols);
#else
  FLUX_LOG_ERROR("Recovery", "Stack unavailable on this platform");
#endif
}

inline void ReportPanic(const char* tag, const char* what) noexcept {
  FLUX_LOG_ERROR("Recovery", "---------%s-Panic----------------", tag);
  FLUX_LOG_ERROR("Recovery", "Error: %s", what);
  LogStack();
  FLUX_LOG_ERROR("Recovery", "---------%s--END-----------------", tag);
}

}  // namespace detail

/**
 * @brief Run @p fn, containing any exception it throws.
 *
 * @param tag Label printed in the panic banner.
 * @param fn  Callable returning WorkResult.
 * @return fn's result, or WorkError::kException / kUnknownException.
 */
template <typename Fn>
WorkResult RecoveryHandler(const char* tag, Fn&& fn) noexcept {
#ifdef FLUX_HAS_EXCEPTIONS
  try {
    return fn();
  } catch (const std::exception& e) {
    detail::ReportPanic(tag, e.what());
    return WorkResult::error(WorkError::kException);
  } catch (...) {
    detail::ReportPanic(tag, "unknown exception");
    return WorkResult::error(WorkError::kUnknownException);
  }
#else
  (void)tag;
  return fn();
#endif
}

}  // namespace flux

#endif  // FLUX_RECOVERY_HPP_
