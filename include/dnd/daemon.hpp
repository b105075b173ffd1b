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
 * @file daemon.hpp
 * @brief The dispatcher daemon: startup sequence, watch loop, teardown,
 *        and the stop / status helpers used by the dnd tool.
 *
 * Startup order:
 *   1. acquire the pid file lock            (exit 4 held, exit 3 unwritable)
 *   2. create the spool tree                (exit 2)
 *   3. detach unless running in foreground  (exit 5)
 *   4. install signal handlers, watch queue/ (exit 6)
 *   5. dispatch everything already queued, oldest first
 *   6. dispatch each new file as it is closed after writing
 *
 * A storage fault ends the run with exit 7 after the normal teardown.
 */

#ifndef DND_DAEMON_HPP_
#define DND_DAEMON_HPP_

#include "dnd/config.hpp"
#include "dnd/daemonize.hpp"
#include "dnd/dispatcher.hpp"
#include "dnd/fs_watch.hpp"
#include "dnd/log.hpp"
#include "dnd/pid_lock.hpp"
#include "dnd/process.hpp"
#include "dnd/shutdown.hpp"
#include "dnd/spool.hpp"
#include "dnd/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// Exit codes
// ============================================================================

static constexpr int kExitOk = 0;
static constexpr int kExitSpoolUnavailable = 2;
static constexpr int kExitLockWriteFailed = 3;
static constexpr int kExitAlreadyRunning = 4;
static constexpr int kExitDaemonizeFailed = 5;
static constexpr int kExitWatcherFailed = 6;
static constexpr int kExitStorageFault = 7;

// ============================================================================
// Watch loop
// ============================================================================

enum class LoopExit : uint8_t {
  kCancelled = 0,
  kWatchFailed,
  kStorageFault
};

/**
 * @brief Dispatch every entry currently in queue/, oldest first.
 *
 * Stops early when @p cancel fires.
 */
inline LoopExit DrainQueue(const SpoolStore& spool, Dispatcher& dispatcher,
                           const CancelToken& cancel) {
  auto entries = spool.ScanQueue();
  if (!entries) return LoopExit::kStorageFault;
  DND_LOG_INFO("Daemon", "startup scan found %u queued file(s)",
               static_cast<unsigned>(entries.value().size()));
  for (const auto& path : entries.value()) {
    if (cancel.IsCancelled()) break;
    if (dispatcher.ProcessEntry(path) == DispatchOutcome::kStorageFault) {
      return LoopExit::kStorageFault;
    }
  }
  return LoopExit::kCancelled;
}

/**
 * @brief Feed new queue files reported on @p wd to @p dispatcher until
 *        @p cancel fires.
 *
 * @p wd must be a kMovedTo | kCloseWrite subscription on the queue
 * directory made before the startup scan; files the scan already settled
 * are skipped. A kOverflow event triggers a full DrainQueue() of @p spool.
 */
inline LoopExit RunWatchLoop(DirWatcher& watcher, int32_t wd,
                             const SpoolStore& spool, Dispatcher& dispatcher,
                             const CancelToken& cancel) {
  std::vector<WatchEvent> events;
  while (!cancel.IsCancelled()) {
    events.clear();
    auto r = watcher.Wait(events, cancel);
    if (!r) {
      DND_LOG_ERROR("Daemon", "watch failed: %s", ToString(r.get_error()));
      return LoopExit::kWatchFailed;
    }
    for (const auto& ev : events) {
      if (ev.kind == WatchKind::kOverflow) {
        DND_LOG_WARN("Daemon", "watch events lost; rescanning %s",
                     spool.QueueDir().c_str());
        if (DrainQueue(spool, dispatcher, cancel) == LoopExit::kStorageFault) {
          return LoopExit::kStorageFault;
        }
        continue;
      }
      if (ev.wd != wd || ev.name.empty() || ev.name[0] == '.') continue;
      const std::string path = ev.Path();
      if (::access(path.c_str(), F_OK) != 0) continue;
      DND_LOG_DEBUG("Daemon", "new file \"%s\"", path.c_str());
      if (dispatcher.ProcessEntry(path) == DispatchOutcome::kStorageFault) {
        return LoopExit::kStorageFault;
      }
    }
  }
  return LoopExit::kCancelled;
}

// ============================================================================
// Daemon
// ============================================================================

class Daemon {
 public:
  /**
   * Relative spool, pid and log paths are resolved against the current
   * directory here, since Daemonize() changes it to "/".
   *
   * @param relay Copy transport; a CommandRelay built from the config is
   *              used when nullptr.
   */
  explicit Daemon(DaemonConfig cfg, RelayTransport* relay = nullptr)
      : cfg_(Absolutize(std::move(cfg))),
        lock_(cfg_.pid_file),
        spool_(cfg_.spool_dir, cfg_.hostname),
        relay_(relay),
        manager_(nullptr),
        stop_requested_(false) {
    if (relay_ == nullptr) {
      owned_relay_ = std::make_unique<CommandRelay>(cfg_.relay_program,
                                                  SplitArgs(cfg_.relay_args));
      relay_ = owned_relay_.get();
    }
  }

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  const DaemonConfig& Settings() const noexcept { return cfg_; }
  const SpoolStore& Spool() const noexcept { return spool_; }
  ProcessLock& Lock() noexcept { return lock_; }

  /**
   * @brief Ask a running Run() to return. Safe from any thread, including
   *        before Run() has installed its handlers.
   */
  void RequestStop() noexcept {
    std::lock_guard<std::mutex> guard(manager_mtx_);
    stop_requested_ = true;
    if (manager_ != nullptr) manager_->Quit();
  }

  /** @brief Run until stopped. @return Process exit status. */
  int Run() {
    if (!log::Init(cfg_.log_file.c_str())) {
      DND_LOG_WARN("Daemon", "cannot open log file %s; logging to stderr",
                   cfg_.log_file.c_str());
    }
    log::SetLevel(cfg_.log_level);
    DND_LOG_INFO("Daemon", "request to start up daemon as user \"%s\"",
                 CurrentUser().c_str());

    auto acquired = lock_.Acquire();
    if (!acquired) {
      if (acquired.get_error() == LockError::kAlreadyRunning) {
        DND_LOG_ERROR("Daemon", "another instance is running (pid %d)",
                      static_cast<int>(lock_.HolderPid()));
        return kExitAlreadyRunning;
      }
      return kExitLockWriteFailed;
    }

    if (!spool_.EnsureLayout()) {
      (void)lock_.Remove();
      return kExitSpoolUnavailable;
    }

    DaemonizeOptions opts;
    opts.foreground = cfg_.foreground;
    if (!Daemonize(lock_, opts)) {
      (void)lock_.Release();
      return kExitDaemonizeFailed;
    }

    // Created after Daemonize(), which closes every inherited fd.
    ShutdownManager mgr;
    if (!mgr.IsValid()) {
      DND_LOG_ERROR("Daemon", "cannot create shutdown manager");
      (void)lock_.Release();
      return kExitWatcherFailed;
    }
    (void)mgr.Register(&Daemon::CloseLog, nullptr);
    (void)mgr.Register(&Daemon::ReleaseLock, &lock_);
    {
      std::lock_guard<std::mutex> guard(manager_mtx_);
      manager_ = &mgr;
      if (stop_requested_) mgr.Quit();
    }

    const int code = Serve(mgr);

    {
      std::lock_guard<std::mutex> guard(manager_mtx_);
      manager_ = nullptr;
    }
    DND_LOG_INFO("Daemon", "sent %llu, failed %llu, dispatched %llu, exhausted %llu",
                 static_cast<unsigned long long>(Count(DispatchOutcome::kSent)),
                 static_cast<unsigned long long>(Count(DispatchOutcome::kExecFailed)),
                 static_cast<unsigned long long>(Count(DispatchOutcome::kDispatched)),
                 static_cast<unsigned long long>(Count(DispatchOutcome::kRelayExhausted)));
    mgr.Teardown();
    return code;
  }

 private:
  static DaemonConfig Absolutize(DaemonConfig cfg) {
    cfg.spool_dir = detail::AbsolutePath(cfg.spool_dir);
    cfg.pid_file = detail::AbsolutePath(cfg.pid_file);
    cfg.log_file = detail::AbsolutePath(cfg.log_file);
    return cfg;
  }

  int Serve(ShutdownManager& mgr) {
    if (!mgr.InstallSignalHandlers()) {
      DND_LOG_ERROR("Daemon", "cannot install signal handlers");
      return kExitWatcherFailed;
    }

    std::unique_ptr<DirWatcher> watcher =
        MakeWatcher(cfg_.watch_backend, cfg_.poll_interval_ms);
    auto wd = watcher->Subscribe(spool_.QueueDir(),
                                 WatchKind::kMovedTo | WatchKind::kCloseWrite);
    if (!wd) {
      DND_LOG_ERROR("Daemon", "cannot watch %s: %s", spool_.QueueDir().c_str(),
                    ToString(wd.get_error()));
      return kExitWatcherFailed;
    }

    Dispatcher dispatcher(spool_, *relay_, cfg_.hostname);
    const CancelToken token = mgr.Token();
    LoopExit result = DrainQueue(spool_, dispatcher, token);
    if (result == LoopExit::kCancelled && !token.IsCancelled()) {
      DND_LOG_DEBUG("Daemon", "entering event loop on %s",
                    spool_.QueueDir().c_str());
      result = RunWatchLoop(*watcher, wd.value(), spool_, dispatcher, token);
    }
    for (uint32_t i = 0; i < kDispatchOutcomeCount; ++i) {
      stats_[i] = dispatcher.Count(static_cast<DispatchOutcome>(i));
    }

    switch (result) {
      case LoopExit::kCancelled:
        return kExitOk;
      case LoopExit::kWatchFailed:
        return kExitWatcherFailed;
      case LoopExit::kStorageFault:
        DND_LOG_ERROR("Daemon", "storage fault; stopping");
        return kExitStorageFault;
    }
    return kExitOk;
  }

  uint64_t Count(DispatchOutcome o) const noexcept {
    return stats_[static_cast<uint32_t>(o)];
  }

  static void ReleaseLock(int signo, void* ctx) {
    if (signo != 0) {
      DND_LOG_INFO("Daemon", "caught signal %d; cleaning up", signo);
    }
    auto* lock = static_cast<ProcessLock*>(ctx);
    if (!lock->Release()) {
      DND_LOG_WARN("Daemon", "cannot remove pid file %s", lock->Path().c_str());
    }
  }

  static void CloseLog(int, void*) {
    DND_LOG_INFO("Daemon", "stopped");
    log::Shutdown();
  }

  DaemonConfig cfg_;
  ProcessLock lock_;
  SpoolStore spool_;
  RelayTransport* relay_;
  std::unique_ptr<RelayTransport> owned_relay_;
  std::mutex manager_mtx_;
  ShutdownManager* manager_;
  bool stop_requested_;
  uint64_t stats_[kDispatchOutcomeCount] = {};
};

// ============================================================================
// Control: stop / status
// ============================================================================

enum class DaemonState : uint8_t {
  kStopped = 0,
  kRunning,
  kStale
};

struct DaemonStatus {
  DaemonState state = DaemonState::kStopped;
  pid_t pid = 0;
};

/** @brief Inspect the pid file without touching it. */
inline DaemonStatus QueryStatus(const ProcessLock& lock) {
  DaemonStatus st;
  optional<pid_t> pid = lock.Read();
  if (!pid) return st;
  st.pid = pid.value();
  st.state = IsProcessAlive(st.pid) ? DaemonState::kRunning : DaemonState::kStale;
  return st;
}

/** @brief "running (pid N)", "stale (pid N)" or "stopped". */
inline std::string FormatStatus(const DaemonStatus& st) {
  switch (st.state) {
    case DaemonState::kRunning:
      return "running (pid " + std::to_string(st.pid) + ")";
    case DaemonState::kStale:
      return "stale (pid " + std::to_string(st.pid) + ")";
    case DaemonState::kStopped:
      break;
  }
  return "stopped";
}

/**
 * @brief Send SIGTERM to the process recorded in @p lock.
 * @return false if no live process is recorded or the signal failed.
 */
inline bool StopDaemon(const ProcessLock& lock) {
  optional<pid_t> pid = lock.Running();
  if (!pid) return false;
  return SignalProcess(pid.value(), SIGTERM) == ProcessResult::kSuccess;
}

}  // namespace dnd

#endif  // DND_DAEMON_HPP_
