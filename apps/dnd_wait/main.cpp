/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file main.cpp
 * @brief dnd_wait -- block until a spool file reaches a terminal directory.
 *
 * Usage: dnd_wait NAME SUCCESS_DIR FAIL_DIR [TIMEOUT_MS]
 *
 * Exit 0 if NAME appears in SUCCESS_DIR, 1 if it appears in FAIL_DIR,
 * 2 on timeout, interruption or error. SIGINT / SIGTERM interrupt the wait.
 */

#include "dnd/fs_watch.hpp"
#include "dnd/log.hpp"
#include "dnd/shutdown.hpp"

#include <cstdio>
#include <cstdlib>

int main(int argc, char* argv[]) {
  if (argc < 4 || argc > 5) {
    std::fprintf(stderr, "usage: %s NAME SUCCESS_DIR FAIL_DIR [TIMEOUT_MS]\n",
                 argv[0]);
    return 2;
  }
  int32_t timeout_ms = -1;
  if (argc == 5) {
    char* end = nullptr;
    long v = std::strtol(argv[4], &end, 10);
    if (end == argv[4] || *end != '\0' || v < 0) {
      std::fprintf(stderr, "%s: invalid timeout \"%s\"\n", argv[0], argv[4]);
      return 2;
    }
    timeout_ms = static_cast<int32_t>(v);
  }

  dnd::log::Init();
  dnd::ShutdownManager mgr;
  if (!mgr.IsValid() || !mgr.InstallSignalHandlers()) {
    std::fprintf(stderr, "%s: cannot install signal handlers\n", argv[0]);
    return 2;
  }

  auto r = dnd::WatchForOutcome(argv[1], argv[2], argv[3], mgr.Token(), timeout_ms);
  if (!r) {
    std::fprintf(stderr, "%s: %s\n", argv[0], dnd::ToString(r.get_error()));
    return 2;
  }
  return (r.value() == dnd::OutcomeStatus::kOk) ? 0 : 1;
}
