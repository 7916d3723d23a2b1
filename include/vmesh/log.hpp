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
 * @brief Lightweight synchronous logger for vmesh.
 *
 * printf-style formatting into a stack buffer, one fprintf to stderr per
 * line. Runtime threshold via SetLevel(); compile-time floor via
 * VMESH_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF).
 *
 * Line format:
 *   [2024-01-01 12:00:00.123] [I] [Mesh] message (file.hpp:42)
 */

#ifndef VMESH_LOG_HPP_
#define VMESH_LOG_HPP_

#include "vmesh/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifndef VMESH_LOG_MIN_LEVEL
#ifdef NDEBUG
#define VMESH_LOG_MIN_LEVEL 1
#else
#define VMESH_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef VMESH_LOG_LINE_MAX
#define VMESH_LOG_LINE_MAX 512U
#endif

namespace vmesh {
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

inline std::atomic<Level>& LevelRef() noexcept {
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
    case Level::kDebug: return "D";
    case Level::kInfo:  return "I";
    case Level::kWarn:  return "W";
    case Level::kError: return "E";
    case Level::kFatal: return "F";
    default:            return "?";
  }
}

/// Strip directories so lines stay short.
inline const char* BaseName(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, uint32_t size) noexcept {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm_buf{};
  (void)localtime_r(&secs, &tm_buf);
  char date[32];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03d", date,
                      static_cast<int>(ms % 1000));
}

}  // namespace detail

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

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LevelRef().load(std::memory_order_relaxed);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (level < GetLevel()) return;

  char msg[VMESH_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));

  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level),
                     category != nullptr ? category : "-", msg,
                     detail::BaseName(file), line);
  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

VMESH_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace vmesh

// ============================================================================
// Macros
// ============================================================================

#define VMESH_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                       \
    if (VMESH_LOG_MIN_LEVEL <= 0) {                                          \
      ::vmesh::log::LogWrite(::vmesh::log::Level::kDebug, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define VMESH_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                       \
    if (VMESH_LOG_MIN_LEVEL <= 1) {                                          \
      ::vmesh::log::LogWrite(::vmesh::log::Level::kInfo, cat, __FILE__,      \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define VMESH_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                       \
    if (VMESH_LOG_MIN_LEVEL <= 2) {                                          \
      ::vmesh::log::LogWrite(::vmesh::log::Level::kWarn, cat, __FILE__,      \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define VMESH_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                       \
    if (VMESH_LOG_MIN_LEVEL <= 3) {                                          \
      ::vmesh::log::LogWrite(::vmesh::log::Level::kError, cat, __FILE__,     \
                             __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                        \
  } while (0)

#define VMESH_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                       \
    ::vmesh::log::LogWrite(::vmesh::log::Level::kFatal, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                            \
  } while (0)

#endif  // VMESH_LOG_HPP_
