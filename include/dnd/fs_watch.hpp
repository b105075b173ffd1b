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
 * @file fs_watch.hpp
 * @brief Directory change notification: inotify(7) with a polling fallback.
 *
 * DirWatcher yields (directory, file name) pairs for two kinds of events:
 *   - kCloseWrite: a file opened for writing was closed (complete content)
 *   - kMovedTo:    a file was renamed into the directory
 *
 * InotifyWatcher maps these to IN_CLOSE_WRITE / IN_MOVED_TO. PollingWatcher
 * diffs directory listings every interval; it reports a new or rewritten
 * file for kCloseWrite once its size and mtime were unchanged across one
 * interval, and a new file for kMovedTo as soon as it is listed.
 *
 * Waits take a CancelToken and return 0 events once it fires.
 */

#ifndef DND_FS_WATCH_HPP_
#define DND_FS_WATCH_HPP_

#include "dnd/io_poller.hpp"
#include "dnd/log.hpp"
#include "dnd/platform.hpp"
#include "dnd/shutdown.hpp"
#include "dnd/spool.hpp"
#include "dnd/vocabulary.hpp"

#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <sys/inotify.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// Types
// ============================================================================

enum class WatchError : uint8_t {
  kInitFailed = 0,
  kSubscribeFailed,
  kUnsubscribeFailed,
  kReadFailed,
  kTimeout,
  kCancelled
};

inline const char* ToString(WatchError e) noexcept {
  switch (e) {
    case WatchError::kInitFailed: return "watcher init failed";
    case WatchError::kSubscribeFailed: return "cannot watch directory";
    case WatchError::kUnsubscribeFailed: return "cannot remove watch";
    case WatchError::kReadFailed: return "event read failed";
    case WatchError::kTimeout: return "timed out";
    case WatchError::kCancelled: return "cancelled";
  }
  return "unknown";
}

enum class WatchKind : uint8_t {
  kCloseWrite = 0x01,
  kMovedTo = 0x02,
  /// Events were lost; rescan the watched directories. Always delivered.
  kOverflow = 0x04
};

inline constexpr uint8_t operator|(WatchKind a, WatchKind b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

enum class WatchBackend : uint8_t {
  kInotify = 0,
  kPolling
};

struct WatchEvent {
  int32_t wd;
  std::string dir;
  std::string name;
  WatchKind kind;

  std::string Path() const { return detail::JoinPath(dir, name); }
};

// ============================================================================
// DirWatcher
// ============================================================================

class DirWatcher {
 public:
  virtual ~DirWatcher() = default;

  /**
   * @brief Start watching @p dir for the WatchKind bits in @p kinds.
   * @return A watch descriptor for Unsubscribe().
   */
  virtual expected<int32_t, WatchError> Subscribe(const std::string& dir,
                                                  uint8_t kinds) = 0;

  virtual expected<void, WatchError> Unsubscribe(int32_t wd) = 0;

  /**
   * @brief Block until events arrive, @p cancel fires, or @p timeout_ms
   *        elapses (-1 waits forever).
   * @return Number of events appended to @p out; 0 on cancel or timeout.
   */
  virtual expected<uint32_t, WatchError> Wait(std::vector<WatchEvent>& out,
                                              const CancelToken& cancel,
                                              int32_t timeout_ms = -1) = 0;
};

namespace detail {

/// @brief Milliseconds left until @p deadline, -1 when @p infinite.
inline int32_t RemainingMs(bool infinite,
                           std::chrono::steady_clock::time_point deadline) {
  if (infinite) return -1;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return (left.count() > 0) ? static_cast<int32_t>(left.count()) : 0;
}

}  // namespace detail

// ============================================================================
// InotifyWatcher
// ============================================================================

class InotifyWatcher final : public DirWatcher {
 public:
  InotifyWatcher() noexcept
      : inotify_fd_(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC)), cancel_fd_(-1) {
    if (inotify_fd_ >= 0 && poller_.IsValid()) {
      if (!poller_.Add(inotify_fd_, static_cast<uint8_t>(IoEvent::kReadable))) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
      }
    }
  }

  ~InotifyWatcher() override {
    if (inotify_fd_ >= 0) ::close(inotify_fd_);
  }

  InotifyWatcher(const InotifyWatcher&) = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  bool IsValid() const noexcept { return inotify_fd_ >= 0 && poller_.IsValid(); }

  expected<int32_t, WatchError> Subscribe(const std::string& dir,
                                          uint8_t kinds) override {
    if (!IsValid()) {
      return expected<int32_t, WatchError>::error(WatchError::kInitFailed);
    }
    uint32_t mask = IN_ONLYDIR;
    if (kinds & static_cast<uint8_t>(WatchKind::kCloseWrite)) mask |= IN_CLOSE_WRITE;
    if (kinds & static_cast<uint8_t>(WatchKind::kMovedTo)) mask |= IN_MOVED_TO;
    int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), mask);
    if (wd < 0) {
      DND_LOG_ERROR("Watch", "inotify_add_watch %s failed: %s", dir.c_str(),
                    std::strerror(errno));
      return expected<int32_t, WatchError>::error(WatchError::kSubscribeFailed);
    }
    dirs_[wd] = dir;
    return expected<int32_t, WatchError>::success(wd);
  }

  expected<void, WatchError> Unsubscribe(int32_t wd) override {
    if (dirs_.erase(wd) == 0 || ::inotify_rm_watch(inotify_fd_, wd) != 0) {
      return expected<void, WatchError>::error(WatchError::kUnsubscribeFailed);
    }
    return expected<void, WatchError>::success();
  }

  expected<uint32_t, WatchError> Wait(std::vector<WatchEvent>& out,
                                      const CancelToken& cancel,
                                      int32_t timeout_ms = -1) override {
    if (!IsValid()) {
      return expected<uint32_t, WatchError>::error(WatchError::kInitFailed);
    }
    if (!WatchCancelFd(cancel.Fd())) {
      return expected<uint32_t, WatchError>::error(WatchError::kInitFailed);
    }
    const bool infinite = timeout_ms < 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(infinite ? 0 : timeout_ms);
    for (;;) {
      if (cancel.IsCancelled()) {
        return expected<uint32_t, WatchError>::success(0U);
      }
      auto drained = Drain(out);
      if (!drained) return drained;
      if (drained.value() > 0U) return drained;

      const int32_t left = detail::RemainingMs(infinite, deadline);
      if (left == 0) {
        return expected<uint32_t, WatchError>::success(0U);
      }
      if (!poller_.Wait(left)) {
        return expected<uint32_t, WatchError>::error(WatchError::kReadFailed);
      }
    }
  }

 private:
  bool WatchCancelFd(int fd) {
    if (fd == cancel_fd_) return true;
    if (cancel_fd_ >= 0) (void)poller_.Remove(cancel_fd_);
    cancel_fd_ = -1;
    if (fd < 0) return true;
    if (!poller_.Add(fd, static_cast<uint8_t>(IoEvent::kReadable))) return false;
    cancel_fd_ = fd;
    return true;
  }

  /// Read every queued inotify record; the fd is non-blocking.
  expected<uint32_t, WatchError> Drain(std::vector<WatchEvent>& out) {
    alignas(struct inotify_event) char buf[4096];
    uint32_t count = 0;
    for (;;) {
      ssize_t n = ::read(inotify_fd_, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        DND_LOG_ERROR("Watch", "inotify read failed: %s", std::strerror(errno));
        return expected<uint32_t, WatchError>::error(WatchError::kReadFailed);
      }
      if (n == 0) break;
      for (char* p = buf; p < buf + n;) {
        auto* ev = reinterpret_cast<struct inotify_event*>(p);
        p += sizeof(struct inotify_event) + ev->len;
        if (ev->mask & IN_Q_OVERFLOW) {
          DND_LOG_WARN("Watch", "inotify queue overflow; events were lost");
          WatchEvent lost;
          lost.wd = -1;
          lost.kind = WatchKind::kOverflow;
          out.push_back(std::move(lost));
          ++count;
          continue;
        }
        if ((ev->mask & IN_ISDIR) || ev->len == 0) continue;
        auto it = dirs_.find(ev->wd);
        if (it == dirs_.end()) continue;
        WatchEvent we;
        we.wd = ev->wd;
        we.dir = it->second;
        we.name = ev->name;
        if (ev->mask & IN_CLOSE_WRITE) {
          we.kind = WatchKind::kCloseWrite;
        } else if (ev->mask & IN_MOVED_TO) {
          we.kind = WatchKind::kMovedTo;
        } else {
          continue;
        }
        out.push_back(std::move(we));
        ++count;
      }
    }
    return expected<uint32_t, WatchError>::success(count);
  }

  int inotify_fd_;
  int cancel_fd_;
  IoPoller poller_;
  std::map<int32_t, std::string> dirs_;
};

// ============================================================================
// PollingWatcher
// ============================================================================

class PollingWatcher final : public DirWatcher {
 public:
  explicit PollingWatcher(uint32_t interval_ms = 500) noexcept
      : interval_ms_(interval_ms == 0 ? 1U : interval_ms), next_wd_(1), cancel_fd_(-1) {}

  expected<int32_t, WatchError> Subscribe(const std::string& dir,
                                          uint8_t kinds) override {
    if (!detail::IsDirectory(dir)) {
      return expected<int32_t, WatchError>::error(WatchError::kSubscribeFailed);
    }
    Subscription sub;
    sub.dir = dir;
    sub.kinds = kinds;
    // Files already present are not events.
    for (auto& kv : List(dir)) {
      kv.second.reported = true;
      sub.files.insert(std::move(kv));
    }
    const int32_t wd = next_wd_++;
    subs_[wd] = std::move(sub);
    return expected<int32_t, WatchError>::success(wd);
  }

  expected<void, WatchError> Unsubscribe(int32_t wd) override {
    if (subs_.erase(wd) == 0) {
      return expected<void, WatchError>::error(WatchError::kUnsubscribeFailed);
    }
    return expected<void, WatchError>::success();
  }

  expected<uint32_t, WatchError> Wait(std::vector<WatchEvent>& out,
                                      const CancelToken& cancel,
                                      int32_t timeout_ms = -1) override {
    if (!poller_.IsValid()) {
      return expected<uint32_t, WatchError>::error(WatchError::kInitFailed);
    }
    if (cancel.Fd() != cancel_fd_) {
      if (cancel_fd_ >= 0) (void)poller_.Remove(cancel_fd_);
      cancel_fd_ = -1;
      if (cancel.Fd() >= 0) {
        if (!poller_.Add(cancel.Fd(), static_cast<uint8_t>(IoEvent::kReadable))) {
          return expected<uint32_t, WatchError>::error(WatchError::kInitFailed);
        }
        cancel_fd_ = cancel.Fd();
      }
    }
    const bool infinite = timeout_ms < 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(infinite ? 0 : timeout_ms);
    for (;;) {
      if (cancel.IsCancelled()) {
        return expected<uint32_t, WatchError>::success(0U);
      }
      const uint32_t found = ScanAll(out);
      if (found > 0U) {
        return expected<uint32_t, WatchError>::success(found);
      }
      int32_t left = detail::RemainingMs(infinite, deadline);
      if (left == 0) {
        return expected<uint32_t, WatchError>::success(0U);
      }
      const int32_t interval = static_cast<int32_t>(interval_ms_);
      if (left < 0 || left > interval) left = interval;
      if (!poller_.Wait(left)) {
        return expected<uint32_t, WatchError>::error(WatchError::kReadFailed);
      }
    }
  }

 private:
  struct FileSig {
    struct timespec mtime;
    off_t size;
    bool reported;
  };

  struct Subscription {
    std::string dir;
    uint8_t kinds = 0;
    std::map<std::string, FileSig> files;
  };

  static bool SameSig(const FileSig& a, const FileSig& b) noexcept {
    return a.size == b.size && a.mtime.tv_sec == b.mtime.tv_sec &&
           a.mtime.tv_nsec == b.mtime.tv_nsec;
  }

  static std::map<std::string, FileSig> List(const std::string& dir) {
    std::map<std::string, FileSig> files;
    detail::DirGuard dh(::opendir(dir.c_str()));
    if (!dh.get()) return files;
    struct dirent* entry;
    while ((entry = ::readdir(dh.get())) != nullptr) {
      if (entry->d_name[0] == '.') continue;
      struct stat st;
      const std::string path = detail::JoinPath(dir, entry->d_name);
      if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
      files[entry->d_name] = FileSig{st.st_mtim, st.st_size, false};
    }
    return files;
  }

  uint32_t ScanAll(std::vector<WatchEvent>& out) {
    uint32_t count = 0;
    for (auto& kv : subs_) {
      Subscription& sub = kv.second;
      const bool close_write = sub.kinds & static_cast<uint8_t>(WatchKind::kCloseWrite);
      std::map<std::string, FileSig> now = List(sub.dir);
      for (auto& f : now) {
        auto prev = sub.files.find(f.first);
        bool report = false;
        if (prev == sub.files.end()) {
          // New file: a rename is complete at once, a write needs to settle.
          report = !close_write;
          f.second.reported = report;
        } else if (!SameSig(prev->second, f.second)) {
          f.second.reported = false;
        } else {
          report = close_write && !prev->second.reported;
          f.second.reported = prev->second.reported || report;
        }
        if (report) {
          WatchEvent we;
          we.wd = kv.first;
          we.dir = sub.dir;
          we.name = f.first;
          we.kind = close_write ? WatchKind::kCloseWrite : WatchKind::kMovedTo;
          out.push_back(std::move(we));
          ++count;
        }
      }
      sub.files = std::move(now);
    }
    return count;
  }

  uint32_t interval_ms_;
  int32_t next_wd_;
  int cancel_fd_;
  IoPoller poller_;
  std::map<int32_t, Subscription> subs_;
};

/** @brief Construct the watcher selected by configuration. */
inline std::unique_ptr<DirWatcher> MakeWatcher(WatchBackend backend,
                                               uint32_t poll_interval_ms) {
  if (backend == WatchBackend::kPolling) {
    return std::make_unique<PollingWatcher>(poll_interval_ms);
  }
  return std::make_unique<InotifyWatcher>();
}

// ============================================================================
// WatchForOutcome
// ============================================================================

enum class OutcomeStatus : uint8_t {
  kOk = 0,
  kFail = 1
};

/**
 * @brief Block until @p filename is renamed into (or written and closed in)
 *        @p success_dir or @p failure_dir.
 *
 * Both watches are removed before returning. A file that already sits in
 * either directory when the watches are in place is reported immediately.
 *
 * @param watcher Watcher to use; an InotifyWatcher is created if nullptr.
 * @return kOk for the success directory, kFail for the failure directory,
 *         or kCancelled / kTimeout / a setup error.
 */
inline expected<OutcomeStatus, WatchError> WatchForOutcome(
    const std::string& filename, const std::string& success_dir,
    const std::string& failure_dir, const CancelToken& cancel,
    int32_t timeout_ms = -1, DirWatcher* watcher = nullptr) {
  using Result = expected<OutcomeStatus, WatchError>;
  std::unique_ptr<DirWatcher> owned;
  if (watcher == nullptr) {
    owned = MakeWatcher(WatchBackend::kInotify, 0);
    watcher = owned.get();
  }

  const uint8_t kinds = WatchKind::kMovedTo | WatchKind::kCloseWrite;
  auto ok_wd = watcher->Subscribe(success_dir, kinds);
  if (!ok_wd) return Result::error(ok_wd.get_error());
  auto fail_wd = watcher->Subscribe(failure_dir, kinds);
  if (!fail_wd) {
    (void)watcher->Unsubscribe(ok_wd.value());
    return Result::error(fail_wd.get_error());
  }

  auto finish = [&](Result r) {
    (void)watcher->Unsubscribe(ok_wd.value());
    (void)watcher->Unsubscribe(fail_wd.value());
    return r;
  };

  if (::access(detail::JoinPath(success_dir, filename).c_str(), F_OK) == 0) {
    return finish(Result::success(OutcomeStatus::kOk));
  }
  if (::access(detail::JoinPath(failure_dir, filename).c_str(), F_OK) == 0) {
    return finish(Result::success(OutcomeStatus::kFail));
  }

  const bool infinite = timeout_ms < 0;
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(infinite ? 0 : timeout_ms);
  std::vector<WatchEvent> events;
  for (;;) {
    events.clear();
    const int32_t left = detail::RemainingMs(infinite, deadline);
    if (!infinite && left == 0) return finish(Result::error(WatchError::kTimeout));
    auto r = watcher->Wait(events, cancel, left);
    if (!r) return finish(Result::error(r.get_error()));
    if (cancel.IsCancelled()) return finish(Result::error(WatchError::kCancelled));
    for (const auto& ev : events) {
      if (ev.kind == WatchKind::kOverflow) {
        if (::access(detail::JoinPath(success_dir, filename).c_str(), F_OK) == 0) {
          return finish(Result::success(OutcomeStatus::kOk));
        }
        if (::access(detail::JoinPath(failure_dir, filename).c_str(), F_OK) == 0) {
          return finish(Result::success(OutcomeStatus::kFail));
        }
        continue;
      }
      if (ev.name != filename) continue;
      if (ev.wd == ok_wd.value()) return finish(Result::success(OutcomeStatus::kOk));
      if (ev.wd == fail_wd.value()) return finish(Result::success(OutcomeStatus::kFail));
    }
  }
}

}  // namespace dnd

#endif  // DND_FS_WATCH_HPP_
