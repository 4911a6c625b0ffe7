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
 * @brief Synchronous leveled logging to stderr.
 *
 * Two gates filter every message:
 *   - compile time: TETHER_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF)
 *   - run time:     tether::log::SetLevel()
 *
 * Output format (debug builds add the source location):
 *   [2026-10-18 12:00:00.123] [INFO] [ACCEPT] Session 1 opened from ...
 *
 * Usage:
 * @code
 *   tether::log::Init();
 *   TETHER_LOG_INFO("MAIN", "listening on %s:%u", host, port);
 * @endcode
 */

#ifndef TETHER_LOG_HPP_
#define TETHER_LOG_HPP_

#include "tether/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <sys/time.h>

#ifndef TETHER_LOG_MIN_LEVEL
#define TETHER_LOG_MIN_LEVEL 0
#endif

namespace tether {
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

/// Serializes whole lines so concurrent threads do not interleave output.
inline std::mutex& SinkMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    case Level::kOff: return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t sec = tv.tv_sec;
  ::localtime_r(&sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0 && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03ld",
                        static_cast<long>(tv.tv_usec / 1000));
  }
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...).
 * @return The matching level, or @p fallback for unknown names.
 */
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  static const char* const kNames[] = {"debug", "info", "warn",
                                       "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6; ++i) {
    const char* a = name;
    const char* b = kNames[i];
    while (*a != '\0' && *b != '\0' &&
           ((*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a) == *b) {
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') return static_cast<Level>(i);
  }
  return fallback;
}

inline void Init() noexcept {
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

  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::SinkMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

TETHER_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace tether

// ============================================================================
// Logging Macros
// ============================================================================

#define TETHER_LOG_IMPL(min, lvl, cat, fmt, ...)                           \
  do {                                                                     \
    if (TETHER_LOG_MIN_LEVEL <= (min)) {                                   \
      ::tether::log::LogWrite(::tether::log::Level::lvl, cat, __FILE__,    \
                              __LINE__, fmt, ##__VA_ARGS__);               \
    }                                                                      \
  } while (0)

#define TETHER_LOG_DEBUG(cat, fmt, ...) \
  TETHER_LOG_IMPL(0, kDebug, cat, fmt, ##__VA_ARGS__)
#define TETHER_LOG_INFO(cat, fmt, ...) \
  TETHER_LOG_IMPL(1, kInfo, cat, fmt, ##__VA_ARGS__)
#define TETHER_LOG_WARN(cat, fmt, ...) \
  TETHER_LOG_IMPL(2, kWarn, cat, fmt, ##__VA_ARGS__)
#define TETHER_LOG_ERROR(cat, fmt, ...) \
  TETHER_LOG_IMPL(3, kError, cat, fmt, ##__VA_ARGS__)
#define TETHER_LOG_FATAL(cat, fmt, ...) \
  TETHER_LOG_IMPL(4, kFatal, cat, fmt, ##__VA_ARGS__)

#endif  // TETHER_LOG_HPP_
