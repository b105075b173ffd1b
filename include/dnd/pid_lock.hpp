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
 * @file pid_lock.hpp
 * @brief Single-instance PID file: acquire-or-detect-stale, write, read, remove.
 *
 * The lock file holds the owner's pid as decimal text plus a newline. A
 * file naming a dead pid is a leftover from a crash and is overwritten;
 * a file naming a live pid means another instance owns the spool.
 *
 * One ProcessLock is constructed at startup and passed by reference to the
 * daemonizer (which re-stamps the child pid) and to shutdown teardown.
 */

#ifndef DND_PID_LOCK_HPP_
#define DND_PID_LOCK_HPP_

#include "dnd/log.hpp"
#include "dnd/platform.hpp"
#include "dnd/process.hpp"
#include "dnd/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace dnd {

enum class LockError : uint8_t {
  kAlreadyRunning = 0,
  kWriteFailed,
  kRemoveFailed
};

inline const char* ToString(LockError e) noexcept {
  switch (e) {
    case LockError::kAlreadyRunning: return "another instance is running";
    case LockError::kWriteFailed: return "cannot write pid file";
    case LockError::kRemoveFailed: return "cannot remove pid file";
  }
  return "unknown";
}

static constexpr const char* kDefaultPidFile = "/var/run/dnd.pid";

class ProcessLock final {
 public:
  explicit ProcessLock(std::string path)
      : path_(std::move(path)), pid_(::getpid()), holder_pid_(0) {}

  ProcessLock(const ProcessLock&) = delete;
  ProcessLock& operator=(const ProcessLock&) = delete;

  const std::string& Path() const noexcept { return path_; }

  /** @brief The pid this lock writes (defaults to getpid() at construction). */
  pid_t Pid() const noexcept { return pid_; }

  /** @brief Re-stamp the owning pid, e.g. after fork(2). Chainable. */
  ProcessLock& SetPid(pid_t pid) noexcept {
    pid_ = pid;
    return *this;
  }

  /** @brief Pid of the live instance seen by the last failed Acquire(). */
  pid_t HolderPid() const noexcept { return holder_pid_; }

  /**
   * @brief Read the recorded pid.
   * @return Empty if the file is absent, unreadable, or not a positive number.
   */
  optional<pid_t> Read() const {
    FILE* f = std::fopen(path_.c_str(), "re");
    if (f == nullptr) return {};
    char buf[32] = {};
    const bool got = std::fgets(buf, sizeof(buf), f) != nullptr;
    std::fclose(f);
    if (!got) return {};
    char* end = nullptr;
    long v = std::strtol(buf, &end, 10);
    if (end == buf || v <= 0) return {};
    return optional<pid_t>(static_cast<pid_t>(v));
  }

  /** @brief The recorded pid if that process is alive. */
  optional<pid_t> Running() const {
    optional<pid_t> pid = Read();
    if (pid && IsProcessAlive(pid.value())) return pid;
    return {};
  }

  /**
   * @brief Persist Pid() atomically (write temp file, then rename).
   */
  expected<void, LockError> Write() {
    const std::string tmp = path_ + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
      DND_LOG_ERROR("Lock", "cannot create %s: %s", tmp.c_str(),
                    std::strerror(errno));
      return expected<void, LockError>::error(LockError::kWriteFailed);
    }
    char buf[32];
    const int len = std::snprintf(buf, sizeof(buf), "%d\n", static_cast<int>(pid_));
    const bool wrote = ::write(fd, buf, static_cast<size_t>(len)) == len;
    if (::close(fd) != 0 || !wrote ||
        ::rename(tmp.c_str(), path_.c_str()) != 0) {
      DND_LOG_ERROR("Lock", "cannot write %s: %s", path_.c_str(),
                    std::strerror(errno));
      (void)::unlink(tmp.c_str());
      return expected<void, LockError>::error(LockError::kWriteFailed);
    }
    return expected<void, LockError>::success();
  }

  /**
   * @brief Take ownership of the lock file.
   *
   * A live recorded pid yields kAlreadyRunning (see HolderPid()); a dead
   * or garbled one is logged as stale and overwritten.
   */
  expected<void, LockError> Acquire() {
    optional<pid_t> live = Running();
    if (live) {
      holder_pid_ = live.value();
      return expected<void, LockError>::error(LockError::kAlreadyRunning);
    }
    if (::access(path_.c_str(), F_OK) == 0) {
      optional<pid_t> old = Read();
      DND_LOG_WARN("Lock",
                   "stale pid file \"%s\" (pid: %d); previous instance may "
                   "have crashed",
                   path_.c_str(), old ? static_cast<int>(old.value()) : -1);
    }
    return Write();
  }

  /** @brief Delete the lock file. A missing file is not an error. */
  expected<void, LockError> Remove() {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      return expected<void, LockError>::error(LockError::kRemoveFailed);
    }
    return expected<void, LockError>::success();
  }

  /**
   * @brief Remove the file only if it still records Pid().
   *
   * Used at teardown so an instance never deletes a successor's lock.
   */
  expected<void, LockError> Release() {
    optional<pid_t> recorded = Read();
    if (recorded && recorded.value() != pid_) {
      return expected<void, LockError>::success();
    }
    return Remove();
  }

 private:
  std::string path_;
  pid_t pid_;
  pid_t holder_pid_;
};

}  // namespace dnd

#endif  // DND_PID_LOCK_HPP_
