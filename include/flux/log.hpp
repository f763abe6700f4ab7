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
 * @file log.hpp
 * @brief Lightweight synchronous logging with runtime and compile-time levels.
 *
 * Each call formats into a stack buffer and writes one line to stderr (or
 * to a user sink installed with SetSink()). The runtime level is a global
 * atomic; FLUX_LOG_MIN_LEVEL removes lower levels at compile time.
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [WorkPool] message (work_pool.hpp:42)
 *
 * Usage:
 *   FLUX_LOG_INFO("WorkPool", "pool %s started with %d workers", name, n);
 */

#ifndef FLUX_LOG_HPP_
#define FLUX_LOG_HPP_

#include "flux/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(FLUX_PLATFORM_LINUX) || defined(FLUX_PLATFORM_MACOS)
#include <time.h>
#endif

// ============================================================================
// Compile-Time Configuration
// ============================================================================

/// 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL 5=OFF
#ifndef FLUX_LOG_MIN_LEVEL
#ifdef NDEBUG
#define FLUX_LOG_MIN_LEVEL 1
#else
#define FLUX_LOG_MIN_LEVEL 0
#endif
#endif

namespace flux {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Sink signature for redirecting formatted log lines.
 *
 * @param level     Severity of the entry.
 * @param category  Category tag passed to the macro.
 * @param message   Formatted message (no timestamp, no newline).
 * @param context   User-provided context pointer.
 */
using LogSinkFn = void (*)(Level level, const char* category, const char* message, void* context);

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

struct SinkSlot {
  std::atomic<LogSinkFn> fn{nullptr};
  std::atomic<void*> context{nullptr};
};

inline SinkSlot& SinkRef() noexcept {
  static SinkSlot slot;
  return slot;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format current wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(FLUX_PLATFORM_LINUX) || defined(FLUX_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld", tm_local.tm_year + 1900,
                 tm_local.tm_mon + 1, tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                 tm_local.tm_sec, static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000", tm_local->tm_year + 1900,
                   tm_local->tm_mon + 1, tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                   tm_local->tm_sec);
  } else {
    (void)snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Mark the logger initialized. Optional; logging works without it.
 */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/**
 * @brief Flush stderr and mark the logger uninitialized.
 */
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Redirect log output to @p fn (nullptr restores stderr).
 */
inline void SetSink(LogSinkFn fn, void* context = nullptr) noexcept {
  detail::SinkRef().context.store(context, std::memory_order_relaxed);
  detail::SinkRef().fn.store(fn, std::memory_order_release);
}

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char msg[512];
  (void)vsnprintf(msg, sizeof(msg), fmt, args);

  LogSinkFn sink = detail::SinkRef().fn.load(std::memory_order_acquire);
  if (sink != nullptr) {
    sink(level, category, msg, detail::SinkRef().context.load(std::memory_order_relaxed));
  } else {
    char ts[32];
    detail::FormatTimestamp(ts, sizeof(ts));
#ifdef NDEBUG
    (void)line;
    (void)file;
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level), category, msg);
#else
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts, detail::LevelTag(level), category,
                       msg, detail::Basename(file), line);
#endif
  }

  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
  if (level == Level::kFatal) {
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace flux

// ============================================================================
// Macros
// ============================================================================

#define FLUX_LOG_DEBUG(cat, fmt, ...)                                                              \
  do {                                                                                             \
    if (FLUX_LOG_MIN_LEVEL <= 0) {                                                                 \
      ::flux::log::LogWrite(::flux::log::Level::kDebug, cat, __FILE__, __LINE__, fmt,              \
                            ##__VA_ARGS__);                                                        \
    }                                                                                              \
  } while (0)

#define FLUX_LOG_INFO(cat, fmt, ...)                                                               \
  do {                                                                                             \
    if (FLUX_LOG_MIN_LEVEL <= 1) {                                                                 \
      ::flux::log::LogWrite(::flux::log::Level::kInfo, cat, __FILE__, __LINE__, fmt,               \
                            ##__VA_ARGS__);                                                        \
    }                                                                                              \
  } while (0)

#define FLUX_LOG_WARN(cat, fmt, ...)                                                               \
  do {                                                                                             \
    if (FLUX_LOG_MIN_LEVEL <= 2) {                                                                 \
      ::flux::log::LogWrite(::flux::log::Level::kWarn, cat, __FILE__, __LINE__, fmt,               \
                            ##__VA_ARGS__);                                                        \
    }                                                                                              \
  } while (0)

#define FLUX_LOG_ERROR(cat, fmt, ...)                                                              \
  do {                                                                                             \
    if (FLUX_LOG_MIN_LEVEL <= 3) {                                                                 \
      ::flux::log::LogWrite(::flux::log::Level::kError, cat, __FILE__, __LINE__, fmt,              \
                            ##__VA_ARGS__);                                                        \
    }                                                                                              \
  } while (0)

#define FLUX_LOG_FATAL(cat, fmt, ...)                                                              \
  do {                                                                                             \
    ::flux::log::LogWrite(::flux::log::Level::kFatal, cat, __FILE__, __LINE__, fmt,                \
                          ##__VA_ARGS__);                                                          \
  } while (0)

#endif  // FLUX_LOG_HPP_
