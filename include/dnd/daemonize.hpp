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
 * @file daemonize.hpp
 * @brief Detach the current process from its terminal.
 *
 * Single fork + setsid. The surviving child records its pid in the
 * ProcessLock before it closes inherited descriptors, so the lock file
 * always names the process that will run the watch loop.
 */

#ifndef DND_DAEMONIZE_HPP_
#define DND_DAEMONIZE_HPP_

#include "dnd/log.hpp"
#include "dnd/pid_lock.hpp"
#include "dnd/platform.hpp"
#include "dnd/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dnd {

enum class DaemonError : uint8_t {
  kForkFailed = 0,
  kSetsidFailed,
  kChdirFailed,
  kLockWriteFailed,
  kRedirectFailed
};

inline const char* ToString(DaemonError e) noexcept {
  switch (e) {
    case DaemonError::kForkFailed: return "fork failed";
    case DaemonError::kSetsidFailed: return "setsid failed";
    case DaemonError::kChdirFailed: return "chdir failed";
    case DaemonError::kLockWriteFailed: return "cannot write pid file";
    case DaemonError::kRedirectFailed: return "cannot redirect stdio";
  }
  return "unknown";
}

struct DaemonizeOptions {
  bool foreground = false;
};

namespace detail {

inline int OpenMaxFd() noexcept {
  long n = ::sysconf(_SC_OPEN_MAX);
  return (n > 0) ? static_cast<int>(n) : 1024;
}

/// @brief Point fds 0, 1 and 2 at /dev/null. Assumes they are closed.
inline bool RedirectStdioToNull() noexcept {
  int in = ::open("/dev/null", O_RDONLY);
  int out = ::open("/dev/null", O_WRONLY);
  int err = ::open("/dev/null", O_WRONLY);
  return in == STDIN_FILENO && out == STDOUT_FILENO && err == STDERR_FILENO;
}

}  // namespace detail

/**
 * @brief Become a background daemon.
 *
 * The parent calls _exit(0) and never returns. In the child the log file
 * is reopened after all descriptors are closed. With
 * @p opts.foreground set nothing happens.
 *
 * Errors after the fork are returned in the child, which is then
 * expected to exit.
 */
inline expected<void, DaemonError> Daemonize(ProcessLock& lock,
                                             const DaemonizeOptions& opts) {
  using Result = expected<void, DaemonError>;
  if (opts.foreground) return Result::success();

  log::Close();
  pid_t pid = ::fork();
  if (pid < 0) {
    (void)log::Reopen();
    DND_LOG_ERROR("Daemon", "fork failed: %s", std::strerror(errno));
    return Result::error(DaemonError::kForkFailed);
  }
  if (pid > 0) {
    ::_exit(0);
  }

  if (::setsid() < 0) {
    (void)log::Reopen();
    DND_LOG_ERROR("Daemon", "setsid failed: %s", std::strerror(errno));
    return Result::error(DaemonError::kSetsidFailed);
  }
  if (::chdir("/") != 0) {
    (void)log::Reopen();
    DND_LOG_ERROR("Daemon", "chdir(/) failed: %s", std::strerror(errno));
    return Result::error(DaemonError::kChdirFailed);
  }
  ::umask(0);

  lock.SetPid(::getpid());
  if (!lock.Write()) {
    (void)log::Reopen();
    return Result::error(DaemonError::kLockWriteFailed);
  }

  const int max_fd = detail::OpenMaxFd();
  for (int fd = 0; fd < max_fd; ++fd) {
    (void)::close(fd);
  }
  if (!detail::RedirectStdioToNull()) {
    (void)log::Reopen();
    return Result::error(DaemonError::kRedirectFailed);
  }

  (void)log::Reopen();
  DND_LOG_INFO("Daemon", "forked and running in background (pid %d)",
               static_cast<int>(::getpid()));
  return Result::success();
}

}  // namespace dnd

#endif  // DND_DAEMONIZE_HPP_
