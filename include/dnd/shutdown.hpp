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
 * @file shutdown.hpp
 * @brief Signal-driven cancellation and deterministic teardown.
 *
 * CancelSource owns a self-pipe plus an atomic flag. Cancel() is
 * async-signal-safe: it sets the flag and writes one byte, which wakes any
 * poller watching CancelToken::Fd(). Blocking loops take a CancelToken and
 * return normally once it fires.
 *
 * ShutdownManager installs SIGINT/SIGTERM/SIGHUP/SIGQUIT handlers that
 * cancel its source. The signal handler does nothing else: cleanup runs
 * later, on the main thread, through Teardown() (LIFO callbacks).
 */

#ifndef DND_SHUTDOWN_HPP_
#define DND_SHUTDOWN_HPP_

#include "dnd/platform.hpp"
#include "dnd/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// ShutdownError
// ============================================================================

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

inline const char* ToString(ShutdownError e) noexcept {
  switch (e) {
    case ShutdownError::kCallbacksFull: return "callback table full";
    case ShutdownError::kPipeCreationFailed: return "pipe creation failed";
    case ShutdownError::kSignalInstallFailed: return "sigaction failed";
    case ShutdownError::kAlreadyInstantiated: return "already instantiated";
  }
  return "unknown";
}

// ============================================================================
// CancelToken / CancelSource
// ============================================================================

/** @brief Read-only view of a CancelSource, passed into blocking calls. */
class CancelToken {
 public:
  CancelToken() noexcept : fd_(-1), flag_(nullptr) {}
  CancelToken(int fd, const std::atomic<bool>* flag) noexcept
      : fd_(fd), flag_(flag) {}

  /** @brief Becomes readable once cancelled; -1 for a token that never fires. */
  int Fd() const noexcept { return fd_; }

  bool IsCancelled() const noexcept {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }

 private:
  int fd_;
  const std::atomic<bool>* flag_;
};

class CancelSource final {
 public:
  CancelSource() noexcept : cancelled_(false), signo_(0) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (::pipe2(pipe_fd_, O_CLOEXEC | O_NONBLOCK) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
    }
  }

  ~CancelSource() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  CancelSource(const CancelSource&) = delete;
  CancelSource& operator=(const CancelSource&) = delete;

  bool IsValid() const noexcept { return pipe_fd_[0] >= 0; }

  CancelToken Token() const noexcept {
    return CancelToken(pipe_fd_[0], &cancelled_);
  }

  /**
   * @brief Fire the token. Async-signal-safe; only the first call writes.
   * @param signo Recorded for teardown callbacks (0 for manual).
   */
  void Cancel(int signo = 0) noexcept {
    bool expected_val = false;
    if (cancelled_.compare_exchange_strong(expected_val, true,
                                           std::memory_order_acq_rel)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        // write(2) is async-signal-safe; a full pipe already wakes readers
        (void)!::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  int pipe_fd_[2];
  std::atomic<bool> cancelled_;
  std::atomic<int> signo_;
};

// ============================================================================
// ShutdownFn - Teardown callback type
// ============================================================================

/// @brief Teardown callback. Receives the signal number (0 for manual) and
/// the context pointer given at registration.
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/**
 * @brief Returns a reference to the global ShutdownManager pointer.
 *
 * The signal handler has no other way to reach its instance. Exactly one
 * ShutdownManager may exist per process.
 */
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownManager
// ============================================================================

/**
 * @brief Signal-to-cancellation bridge with LIFO teardown callbacks.
 *
 * Usage:
 * @code
 *   dnd::ShutdownManager mgr;
 *   mgr.Register(&ReleaseLock, &lock);
 *   mgr.InstallSignalHandlers();
 *   RunLoop(mgr.Token());   // returns after SIGTERM
 *   mgr.Teardown();
 * @endcode
 */
class ShutdownManager final {
 public:
  ShutdownManager() noexcept : callback_count_(0), torn_down_(false), valid_(false) {
    // A second instance stays invalid and leaves the global pointer alone.
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (!source_.IsValid()) {
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  /**
   * @brief Restores default dispositions for handlers this instance installed
   * and clears the global instance pointer.
   */
  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      if (installed_) {
        struct sigaction sa;
        sa.sa_handler = SIG_DFL;
        ::sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        for (int sig : kSignals) {
          (void)::sigaction(sig, &sa, nullptr);
        }
      }
      detail::GetShutdownInstance() = nullptr;
    }
  }

  // Non-copyable, non-movable
  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Register a teardown callback (run in LIFO order).
   * @return kAlreadyInstantiated for an invalid instance, kCallbacksFull if
   *         @p fn is nullptr or the table is full.
   */
  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_].fn = fn;
    callbacks_[callback_count_].ctx = ctx;
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  /**
   * @brief Install handlers for SIGINT, SIGTERM, SIGHUP and SIGQUIT.
   *
   * SA_RESTART is deliberately not set so blocking waits return EINTR.
   */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    for (int sig : kSignals) {
      if (::sigaction(sig, &sa, nullptr) != 0) {
        return expected<void, ShutdownError>::error(
            ShutdownError::kSignalInstallFailed);
      }
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /** @brief Manually request shutdown (same effect as a signal). */
  void Quit(int signo = 0) noexcept { source_.Cancel(signo); }

  bool IsShutdownRequested() const noexcept { return source_.IsCancelled(); }

  /** @brief Signal that triggered shutdown, 0 if manual or none yet. */
  int Signal() const noexcept { return source_.Signal(); }

  CancelToken Token() const noexcept { return source_.Token(); }

  /**
   * @brief Run registered callbacks once, newest first.
   */
  void Teardown() noexcept {
    if (torn_down_) return;
    torn_down_ = true;
    const int signo = source_.Signal();
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
    }
  }

 private:
  static constexpr uint32_t kMaxCallbacks = 16;
  static constexpr int kSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

  struct Callback {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  /// Async-signal-safe: atomic store plus write(2) inside Cancel().
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->source_.Cancel(signo);
    }
  }

  CancelSource source_;
  Callback callbacks_[kMaxCallbacks];
  uint32_t callback_count_;
  bool torn_down_;
  bool installed_ = false;
  bool valid_;
};

}  // namespace dnd

#endif  // DND_SHUTDOWN_HPP_
