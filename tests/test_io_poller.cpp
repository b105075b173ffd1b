/**
 * @file test_io_poller.cpp
 * @brief Tests for io_poller.hpp: IoPoller, PollResult, IoEvent.
 */

#include <catch2/catch_test_macros.hpp>
#include "dnd/io_poller.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <type_traits>

namespace {

struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { (void)::pipe2(fds, O_CLOEXEC | O_NONBLOCK); }
  ~Pipe() {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
  }
  int Read() const { return fds[0]; }
  int Write() const { return fds[1]; }
};

}  // namespace

TEST_CASE("io_poller - default construction is valid", "[io_poller]") {
  dnd::IoPoller poller;
  REQUIRE(poller.IsValid());
}

TEST_CASE("io_poller - Add and Remove", "[io_poller]") {
  dnd::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());

  auto dup = poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable));
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error() == dnd::PollerError::kAddFailed);

  REQUIRE(poller.Remove(p.Read()).has_value());
  auto again = poller.Remove(p.Read());
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == dnd::PollerError::kRemoveFailed);
}

TEST_CASE("io_poller - Wait non-blocking returns 0 when idle", "[io_poller]") {
  dnd::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());
  auto r = poller.Wait(0);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
}

TEST_CASE("io_poller - readable pipe is reported", "[io_poller]") {
  dnd::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());
  const char byte = 'x';
  REQUIRE(::write(p.Write(), &byte, 1) == 1);

  auto r = poller.Wait(100);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(poller.Results()[0].fd == p.Read());
  REQUIRE((poller.Results()[0].events &
           static_cast<uint8_t>(dnd::IoEvent::kReadable)) != 0);
}

TEST_CASE("io_poller - edge-triggered: no repeat until new data",
          "[io_poller]") {
  dnd::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());
  const char byte = 'x';
  REQUIRE(::write(p.Write(), &byte, 1) == 1);

  REQUIRE(poller.Wait(100).value() == 1U);
  // Data still unread, but no new edge
  REQUIRE(poller.Wait(0).value() == 0U);

  REQUIRE(::write(p.Write(), &byte, 1) == 1);
  REQUIRE(poller.Wait(100).value() == 1U);
}

TEST_CASE("io_poller - multiple fds", "[io_poller]") {
  dnd::IoPoller poller;
  Pipe a;
  Pipe b;
  REQUIRE(poller.Add(a.Read(), dnd::IoEvent::kReadable | dnd::IoEvent::kError).has_value());
  REQUIRE(poller.Add(b.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());
  const char byte = 'x';
  REQUIRE(::write(a.Write(), &byte, 1) == 1);
  REQUIRE(::write(b.Write(), &byte, 1) == 1);

  auto r = poller.Wait(100);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 2U);
}

TEST_CASE("io_poller - owns its epoll fd exclusively", "[io_poller]") {
  STATIC_REQUIRE(!std::is_copy_constructible<dnd::IoPoller>::value);
  STATIC_REQUIRE(!std::is_move_constructible<dnd::IoPoller>::value);
}

TEST_CASE("io_poller - closed writer is reported as kError", "[io_poller]") {
  dnd::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.Read(), static_cast<uint8_t>(dnd::IoEvent::kReadable)).has_value());
  ::close(p.fds[1]);
  p.fds[1] = -1;

  auto r = poller.Wait(100);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE((poller.Results()[0].events &
           static_cast<uint8_t>(dnd::IoEvent::kError)) != 0);
}
