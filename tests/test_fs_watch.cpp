/**
 * @file test_fs_watch.cpp
 * @brief Tests for fs_watch.hpp - inotify and polling watchers.
 */

#include "dnd/fs_watch.hpp"
#include "dnd/shutdown.hpp"

#include "test_util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

static const uint8_t kCloseWrite = static_cast<uint8_t>(dnd::WatchKind::kCloseWrite);
static const uint8_t kMovedTo = static_cast<uint8_t>(dnd::WatchKind::kMovedTo);

/// Wait until at least one event arrives or @p total_ms passes.
static std::vector<dnd::WatchEvent> Collect(dnd::DirWatcher& w,
                                            const dnd::CancelToken& token,
                                            int32_t total_ms) {
  std::vector<dnd::WatchEvent> events;
  auto r = w.Wait(events, token, total_ms);
  REQUIRE(r.has_value());
  return events;
}

// ============================================================================
// InotifyWatcher
// ============================================================================

TEST_CASE("InotifyWatcher reports close-after-write", "[fs_watch][inotify]") {
  dnd_test::TempDir tmp;
  dnd::InotifyWatcher w;
  REQUIRE(w.IsValid());
  auto wd = w.Subscribe(tmp.Path(), kCloseWrite);
  REQUIRE(wd.has_value());

  REQUIRE(dnd_test::WriteFile(tmp.Sub("entry"), "data"));

  dnd::CancelSource src;
  auto events = Collect(w, src.Token(), 2000);
  REQUIRE(events.size() == 1U);
  REQUIRE(events[0].wd == wd.value());
  REQUIRE(events[0].name == "entry");
  REQUIRE(events[0].kind == dnd::WatchKind::kCloseWrite);
  REQUIRE(events[0].Path() == tmp.Sub("entry"));
}

TEST_CASE("InotifyWatcher reports renames into the directory",
          "[fs_watch][inotify]") {
  dnd_test::TempDir tmp;
  REQUIRE(::mkdir(tmp.Sub("in").c_str(), 0755) == 0);
  REQUIRE(dnd_test::WriteFile(tmp.Sub("staged"), "data"));

  dnd::InotifyWatcher w;
  auto wd = w.Subscribe(tmp.Sub("in"), kMovedTo);
  REQUIRE(wd.has_value());
  REQUIRE(std::rename(tmp.Sub("staged").c_str(), tmp.Sub("in/staged").c_str()) == 0);

  dnd::CancelSource src;
  auto events = Collect(w, src.Token(), 2000);
  REQUIRE(events.size() == 1U);
  REQUIRE(events[0].kind == dnd::WatchKind::kMovedTo);
  REQUIRE(events[0].name == "staged");
}

TEST_CASE("InotifyWatcher times out with no events", "[fs_watch][inotify]") {
  dnd_test::TempDir tmp;
  dnd::InotifyWatcher w;
  REQUIRE(w.Subscribe(tmp.Path(), kCloseWrite).has_value());
  dnd::CancelSource src;
  auto events = Collect(w, src.Token(), 50);
  REQUIRE(events.empty());
}

TEST_CASE("InotifyWatcher Wait returns when cancelled", "[fs_watch][inotify]") {
  dnd_test::TempDir tmp;
  dnd::InotifyWatcher w;
  REQUIRE(w.Subscribe(tmp.Path(), kCloseWrite).has_value());
  dnd::CancelSource src;

  std::thread canceller([&src]() {
    ::usleep(50 * 1000);
    src.Cancel();
  });
  std::vector<dnd::WatchEvent> events;
  auto r = w.Wait(events, src.Token());
  canceller.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
  REQUIRE(src.IsCancelled());
}

TEST_CASE("InotifyWatcher rejects a missing directory", "[fs_watch][inotify]") {
  dnd::InotifyWatcher w;
  auto r = w.Subscribe("/nonexistent/dnd/queue", kCloseWrite);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dnd::WatchError::kSubscribeFailed);
}

TEST_CASE("InotifyWatcher Unsubscribe stops delivery", "[fs_watch][inotify]") {
  dnd_test::TempDir tmp;
  dnd::InotifyWatcher w;
  auto wd = w.Subscribe(tmp.Path(), kCloseWrite);
  REQUIRE(wd.has_value());
  REQUIRE(w.Unsubscribe(wd.value()).has_value());
  REQUIRE(!w.Unsubscribe(wd.value()).has_value());

  REQUIRE(dnd_test::WriteFile(tmp.Sub("late"), "x"));
  dnd::CancelSource src;
  REQUIRE(Collect(w, src.Token(), 50).empty());
}

// ============================================================================
// PollingWatcher
// ============================================================================

TEST_CASE("PollingWatcher ignores files present at subscribe time",
          "[fs_watch][polling]") {
  dnd_test::TempDir tmp;
  REQUIRE(dnd_test::WriteFile(tmp.Sub("old"), "x"));
  dnd::PollingWatcher w(10);
  REQUIRE(w.Subscribe(tmp.Path(), kCloseWrite).has_value());
  dnd::CancelSource src;
  REQUIRE(Collect(w, src.Token(), 100).empty());
}

TEST_CASE("PollingWatcher reports a settled new file once",
          "[fs_watch][polling]") {
  dnd_test::TempDir tmp;
  dnd::PollingWatcher w(10);
  auto wd = w.Subscribe(tmp.Path(), kCloseWrite);
  REQUIRE(wd.has_value());
  REQUIRE(dnd_test::WriteFile(tmp.Sub("new"), "x"));
  REQUIRE(dnd_test::WriteFile(tmp.Sub(".hidden"), "x"));

  dnd::CancelSource src;
  auto events = Collect(w, src.Token(), 2000);
  REQUIRE(events.size() == 1U);
  REQUIRE(events[0].wd == wd.value());
  REQUIRE(events[0].name == "new");
  REQUIRE(events[0].kind == dnd::WatchKind::kCloseWrite);

  REQUIRE(Collect(w, src.Token(), 100).empty());
}

TEST_CASE("PollingWatcher reports moved-in files immediately",
          "[fs_watch][polling]") {
  dnd_test::TempDir tmp;
  dnd::PollingWatcher w(10);
  REQUIRE(w.Subscribe(tmp.Path(), kMovedTo).has_value());
  REQUIRE(dnd_test::WriteFile(tmp.Sub("arrived"), "x"));

  dnd::CancelSource src;
  auto events = Collect(w, src.Token(), 2000);
  REQUIRE(events.size() == 1U);
  REQUIRE(events[0].kind == dnd::WatchKind::kMovedTo);
}

TEST_CASE("PollingWatcher Wait returns when cancelled", "[fs_watch][polling]") {
  dnd_test::TempDir tmp;
  dnd::PollingWatcher w(1000);
  REQUIRE(w.Subscribe(tmp.Path(), kCloseWrite).has_value());
  dnd::CancelSource src;
  src.Cancel();
  std::vector<dnd::WatchEvent> events;
  auto r = w.Wait(events, src.Token());
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
}

TEST_CASE("MakeWatcher selects the backend", "[fs_watch]") {
  auto a = dnd::MakeWatcher(dnd::WatchBackend::kInotify, 0);
  auto b = dnd::MakeWatcher(dnd::WatchBackend::kPolling, 20);
  REQUIRE(dynamic_cast<dnd::InotifyWatcher*>(a.get()) != nullptr);
  REQUIRE(dynamic_cast<dnd::PollingWatcher*>(b.get()) != nullptr);
}

// ============================================================================
// WatchForOutcome
// ============================================================================

namespace {

struct OutcomeDirs {
  dnd_test::TempDir tmp;
  std::string ok;
  std::string fail;
  OutcomeDirs() : ok(tmp.Sub("sent")), fail(tmp.Sub("failed")) {
    (void)::mkdir(ok.c_str(), 0755);
    (void)::mkdir(fail.c_str(), 0755);
  }
};

}  // namespace

TEST_CASE("WatchForOutcome success directory", "[fs_watch][outcome]") {
  OutcomeDirs d;
  REQUIRE(dnd_test::WriteFile(d.tmp.Sub("job"), "x"));
  dnd::CancelSource src;

  std::thread mover([&d]() {
    ::usleep(50 * 1000);
    (void)std::rename(d.tmp.Sub("job").c_str(), (d.ok + "/job").c_str());
  });
  auto r = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 5000);
  mover.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == dnd::OutcomeStatus::kOk);
}

TEST_CASE("WatchForOutcome failure directory", "[fs_watch][outcome]") {
  OutcomeDirs d;
  REQUIRE(dnd_test::WriteFile(d.tmp.Sub("other"), "x"));
  REQUIRE(dnd_test::WriteFile(d.tmp.Sub("job"), "x"));
  dnd::CancelSource src;

  std::thread mover([&d]() {
    ::usleep(30 * 1000);
    (void)std::rename(d.tmp.Sub("other").c_str(), (d.ok + "/other").c_str());
    ::usleep(30 * 1000);
    (void)std::rename(d.tmp.Sub("job").c_str(), (d.fail + "/job").c_str());
  });
  auto r = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 5000);
  mover.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == dnd::OutcomeStatus::kFail);
}

TEST_CASE("WatchForOutcome file already settled", "[fs_watch][outcome]") {
  OutcomeDirs d;
  REQUIRE(dnd_test::WriteFile(d.fail + "/job", "x"));
  dnd::CancelSource src;
  auto r = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 0);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == dnd::OutcomeStatus::kFail);
}

TEST_CASE("WatchForOutcome timeout and cancel", "[fs_watch][outcome]") {
  OutcomeDirs d;
  dnd::CancelSource src;
  auto timed_out = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 50);
  REQUIRE(!timed_out.has_value());
  REQUIRE(timed_out.get_error() == dnd::WatchError::kTimeout);

  src.Cancel();
  auto cancelled = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 5000);
  REQUIRE(!cancelled.has_value());
  REQUIRE(cancelled.get_error() == dnd::WatchError::kCancelled);
}

TEST_CASE("WatchForOutcome with a polling watcher", "[fs_watch][outcome]") {
  OutcomeDirs d;
  REQUIRE(dnd_test::WriteFile(d.tmp.Sub("job"), "x"));
  dnd::PollingWatcher w(10);
  dnd::CancelSource src;

  std::thread mover([&d]() {
    ::usleep(50 * 1000);
    (void)std::rename(d.tmp.Sub("job").c_str(), (d.ok + "/job").c_str());
  });
  auto r = dnd::WatchForOutcome("job", d.ok, d.fail, src.Token(), 5000, &w);
  mover.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == dnd::OutcomeStatus::kOk);
}

TEST_CASE("WatchForOutcome missing directory", "[fs_watch][outcome]") {
  dnd::CancelSource src;
  auto r = dnd::WatchForOutcome("job", "/nonexistent/a", "/nonexistent/b",
                                src.Token(), 10);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dnd::WatchError::kSubscribeFailed);
}
