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
 * @brief Synchronous printf-style logging to stderr or an append-only file.
 *
 * One line per message:
 *   [2026-01-02 03:04:05.678] [node1] [INFO] [Dispatch] message
 *
 * The sink is stderr until Init(path) opens a log file. Close()/Reopen()
 * let the daemonizer drop the descriptor across fork and fd cleanup
 * without forgetting where the log lives.
 *
 * Compile-time floor: DND_LOG_MIN_LEVEL (0=debug .. 4=off).
 */

#ifndef DND_LOG_HPP_
#define DND_LOG_HPP_

#include "dnd/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <strings.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#ifndef DND_LOG_MIN_LEVEL
#define DND_LOG_MIN_LEVEL 0
#endif

namespace dnd {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kOff = 4
};

namespace detail {

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kOff: return "OFF";
  }
  return "?";
}

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

static constexpr uint32_t kMaxPathLen = 256;
static constexpr uint32_t kMaxHostLen = 64;
static constexpr uint32_t kMaxMessageLen = 1024;

/// @brief Process-wide sink state (Meyer's singleton).
struct LogState {
  std::mutex mtx;
  FILE* file = nullptr;
  char path[kMaxPathLen] = {};
  char host[kMaxHostLen] = {};
  std::atomic<Level> level{kDefaultLevel};
  std::atomic<bool> initialized{false};
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

/// @brief Local wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  ::localtime_r(&tv.tv_sec, &tm_buf);
  char base[32];
  (void)std::strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03ld", base,
                      static_cast<long>(tv.tv_usec / 1000));
}

/// @brief Must be called with State().mtx held.
inline bool OpenFileLocked(LogState& s) noexcept {
  if (s.path[0] == '\0') return false;
  int fd = ::open(s.path, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  FILE* f = ::fdopen(fd, "a");
  if (f == nullptr) {
    ::close(fd);
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  s.file = f;
  return true;
}

inline void CloseFileLocked(LogState& s) noexcept {
  if (s.file != nullptr) {
    (void)std::fclose(s.file);
    s.file = nullptr;
  }
}

}  // namespace detail

// ============================================================================
// Lifecycle
// ============================================================================

/** @brief Initialize logging to stderr. */
inline void Init() noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  detail::CloseFileLocked(s);
  s.path[0] = '\0';
  if (::gethostname(s.host, sizeof(s.host)) != 0) {
    std::strncpy(s.host, "localhost", sizeof(s.host) - 1);
  }
  s.host[sizeof(s.host) - 1] = '\0';
  s.initialized.store(true);
}

/**
 * @brief Initialize logging to an append-only file.
 * @return false if the file cannot be opened; logging then stays on stderr.
 */
inline bool Init(const char* path) noexcept {
  Init();
  if (path == nullptr || path[0] == '\0') return true;
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  std::strncpy(s.path, path, sizeof(s.path) - 1);
  s.path[sizeof(s.path) - 1] = '\0';
  return detail::OpenFileLocked(s);
}

/** @brief Close the log file (if any) but remember its path. */
inline void Close() noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  if (s.file != nullptr) (void)std::fflush(s.file);
  detail::CloseFileLocked(s);
}

/** @brief Reopen the file remembered by Init(path). */
inline bool Reopen() noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  detail::CloseFileLocked(s);
  return detail::OpenFileLocked(s);
}

inline void Shutdown() noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  detail::CloseFileLocked(s);
  s.path[0] = '\0';
  s.initialized.store(false);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load();
}

inline bool HasFile() noexcept {
  detail::LogState& s = detail::State();
  std::lock_guard<std::mutex> lock(s.mtx);
  return s.file != nullptr;
}

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

/**
 * @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
 * @return false if the name is not recognized; @p out is left unchanged.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"warning", Level::kWarn},
                {"error", Level::kError}, {"off", Level::kOff}};
  if (name == nullptr) return false;
  for (const auto& n : kNames) {
    if (::strcasecmp(n.name, name) == 0) {
      out = n.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  detail::LogState& s = detail::State();
  if (level < s.level.load(std::memory_order_relaxed) || level == Level::kOff) {
    return;
  }

  char msg[detail::kMaxMessageLen];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(s.mtx);
  FILE* out = (s.file != nullptr) ? s.file : stderr;
  const char* host = (s.host[0] != '\0') ? s.host : "-";
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(out, "[%s] [%s] [%s] [%s] %s\n", ts, host,
                     detail::LevelTag(level), category, msg);
#else
  const char* slash = (file != nullptr) ? std::strrchr(file, '/') : nullptr;
  const char* base = (slash != nullptr) ? slash + 1 : (file ? file : "?");
  (void)std::fprintf(out, "[%s] [%s] [%s] [%s] %s (%s:%d)\n", ts, host,
                     detail::LevelTag(level), category, msg, base, line);
#endif
}

DND_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace dnd

// ============================================================================
// Macros
// ============================================================================

#define DND_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (DND_LOG_MIN_LEVEL <= 0) {                                           \
      ::dnd::log::LogWrite(::dnd::log::Level::kDebug, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define DND_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (DND_LOG_MIN_LEVEL <= 1) {                                           \
      ::dnd::log::LogWrite(::dnd::log::Level::kInfo, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define DND_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (DND_LOG_MIN_LEVEL <= 2) {                                           \
      ::dnd::log::LogWrite(::dnd::log::Level::kWarn, cat, __FILE__,         \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define DND_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (DND_LOG_MIN_LEVEL <= 3) {                                           \
      ::dnd::log::LogWrite(::dnd::log::Level::kError, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#endif  // DND_LOG_HPP_
