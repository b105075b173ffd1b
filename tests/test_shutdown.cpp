/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "dnd/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <vector>

static bool IsReadable(int fd, int timeout_ms) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  return ::poll(&pfd, 1, timeout_ms) == 1 && (pfd.revents & POLLIN) != 0;
}

// ============================================================================
// CancelSource / CancelToken
// ============================================================================

TEST_CASE("CancelSource fires its token once", "[shutdown]") {
  dnd::CancelSource src;
  REQUIRE(src.IsValid());
  dnd::CancelToken token = src.Token();
  REQUIRE(!token.IsCancelled());
  REQUIRE(!IsReadable(token.Fd(), 0));

  src.Cancel(SIGTERM);
  src.Cancel(SIGINT);
  REQUIRE(token.IsCancelled());
  REQUIRE(src.Signal() == SIGTERM);
  REQUIRE(IsReadable(token.Fd(), 0));
}

TEST_CASE("Default CancelToken never fires", "[shutdown]") {
  dnd::CancelToken token;
  REQUIRE(token.Fd() == -1);
  REQUIRE(!token.IsCancelled());
}

// ============================================================================
// ShutdownManager
// ============================================================================

TEST_CASE("ShutdownManager Register callbacks", "[shutdown]") {
  dnd::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  for (uint32_t i = 0; i < 16; ++i) {
    REQUIRE(mgr.Register([](int, void*) {}).has_value());
  }
  auto rn = mgr.Register([](int, void*) {});
  REQUIRE(!rn.has_value());
  REQUIRE(rn.get_error() == dnd::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownManager null callback rejected", "[shutdown]") {
  dnd::ShutdownManager mgr;
  auto r = mgr.Register(nullptr);
  REQUIRE(!r.has_value());
}

TEST_CASE("ShutdownManager second instance is invalid", "[shutdown]") {
  dnd::ShutdownManager first;
  dnd::ShutdownManager second;
  REQUIRE(first.IsValid());
  REQUIRE(!second.IsValid());
  auto r = second.Register([](int, void*) {});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dnd::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownManager Quit and IsShutdownRequested", "[shutdown]") {
  dnd::ShutdownManager mgr;
  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit(0);
  REQUIRE(mgr.IsShutdownRequested());
  REQUIRE(mgr.Token().IsCancelled());
}

TEST_CASE("ShutdownManager runs callbacks LIFO exactly once", "[shutdown]") {
  dnd::ShutdownManager mgr;
  std::vector<int> order;

  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(1); },
               &order);
  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(2); },
               &order);
  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(3); },
               &order);

  mgr.Quit(0);
  mgr.Teardown();
  mgr.Teardown();

  REQUIRE(order == std::vector<int>{3, 2, 1});
}

TEST_CASE("ShutdownManager passes the signal to callbacks", "[shutdown]") {
  dnd::ShutdownManager mgr;
  int seen = -1;
  mgr.Register([](int signo, void* ctx) { *static_cast<int*>(ctx) = signo; }, &seen);
  mgr.Quit(SIGHUP);
  mgr.Teardown();
  REQUIRE(seen == SIGHUP);
}

TEST_CASE("ShutdownManager signal handler cancels the token", "[shutdown]") {
  dnd::ShutdownManager mgr;
  REQUIRE(mgr.InstallSignalHandlers().has_value());
  const dnd::CancelToken token = mgr.Token();

  REQUIRE(::raise(SIGTERM) == 0);
  REQUIRE(token.IsCancelled());
  REQUIRE(mgr.Signal() == SIGTERM);
  REQUIRE(IsReadable(token.Fd(), 100));
}

TEST_CASE("ShutdownManager restores default handlers", "[shutdown]") {
  {
    dnd::ShutdownManager mgr;
    REQUIRE(mgr.InstallSignalHandlers().has_value());
  }
  struct sigaction sa;
  REQUIRE(::sigaction(SIGTERM, nullptr, &sa) == 0);
  REQUIRE(sa.sa_handler == SIG_DFL);
}
