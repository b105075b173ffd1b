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
 * @file io_poller.hpp
 * @brief Thin epoll(7) wrapper used to wait on watcher and cancel fds together.
 *
 * Header-only, Linux only. Registrations are edge-triggered: callers must
 * drain a readable fd until EAGAIN before waiting again.
 */

#ifndef DND_IO_POLLER_HPP_
#define DND_IO_POLLER_HPP_

#include "dnd/platform.hpp"
#include "dnd/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <cstdint>

#include <sys/epoll.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kError    = 0x04
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

#ifndef DND_IO_POLLER_MAX_EVENTS
#define DND_IO_POLLER_MAX_EVENTS 16U
#endif

namespace detail {

inline uint32_t IoEventToEpoll(uint8_t events) {
  uint32_t ep = EPOLLET;  // edge-triggered by default
  if (events & static_cast<uint8_t>(IoEvent::kReadable)) {
    ep |= EPOLLIN;
  }
  return ep;
}

inline uint8_t EpollToIoEvent(uint32_t ep) {
  uint8_t ev = 0;
  if (ep & EPOLLIN) {
    ev |= static_cast<uint8_t>(IoEvent::kReadable);
  }
  if (ep & (EPOLLERR | EPOLLHUP)) {
    ev |= static_cast<uint8_t>(IoEvent::kError);
  }
  return ev;
}

}  // namespace detail

// ============================================================================
// IoPoller
// ============================================================================

class IoPoller {
 public:
  IoPoller() noexcept : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)), results_{} {}

  ~IoPoller() {
    if (poller_fd_ >= 0) {
      ::close(poller_fd_);
    }
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }

  /** @brief Add an fd to monitor for @p events (kReadable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events) {
    struct epoll_event ev {};
    ev.events = detail::IoEventToEpoll(events);
    ev.data.fd = fd;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    return expected<void, PollerError>::success();
  }

  /** @brief Remove an fd from monitoring. */
  expected<void, PollerError> Remove(int32_t fd) {
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for events into the internal buffer (see Results()).
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready events; 0 on timeout or when a signal
   *         interrupted the wait (EINTR).
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    struct epoll_event raw_events[DND_IO_POLLER_MAX_EVENTS];
    int32_t n = ::epoll_wait(poller_fd_, raw_events,
                             static_cast<int>(DND_IO_POLLER_MAX_EVENTS), timeout_ms);
    if (n < 0) {
      if (errno == EINTR) {
        return expected<uint32_t, PollerError>::success(0U);
      }
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    auto count = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < count; ++i) {
      results_[i].fd = raw_events[i].data.fd;
      results_[i].events = detail::EpollToIoEvent(raw_events[i].events);
    }
    return expected<uint32_t, PollerError>::success(count);
  }

  /** @brief Access results from the last Wait() call. */
  const PollResult* Results() const noexcept { return results_.data(); }

 private:
  int32_t poller_fd_;
  std::array<PollResult, DND_IO_POLLER_MAX_EVENTS> results_;
};

}  // namespace dnd

#endif  // DND_IO_POLLER_HPP_
