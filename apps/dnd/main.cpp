/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file main.cpp
 * @brief dnd -- spool directory dispatcher daemon.
 *
 * Usage:
 *   dnd start [-f] [-c FILE] [-s DIR] [-p FILE] [-l FILE]
 *   dnd stop   [-c FILE] [-p FILE]
 *   dnd status [-c FILE] [-p FILE]
 *
 * Exit codes of "start": 0 clean stop, 2 spool unavailable, 3 pid file
 * unwritable, 4 already running, 5 daemonize failed, 6 watcher failed,
 * 7 storage fault. "stop" and "status" exit 0 when a live daemon was
 * found, 1 otherwise.
 */

#include "dnd/config.hpp"
#include "dnd/daemon.hpp"
#include "dnd/log.hpp"

#include <cstdio>
#include <cstring>

static void Usage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s start|stop|status [-f] [-c FILE] [-s DIR] "
               "[-p FILE] [-l FILE]\n",
               prog);
}

struct CliOptions {
  const char* command = nullptr;
  const char* config_file = nullptr;
  const char* spool_dir = nullptr;
  const char* pid_file = nullptr;
  const char* log_file = nullptr;
  bool foreground = false;
};

static bool ParseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = (i + 1) < argc;
    if (std::strcmp(arg, "-f") == 0) {
      opts.foreground = true;
    } else if (std::strcmp(arg, "-c") == 0 && has_value) {
      opts.config_file = argv[++i];
    } else if (std::strcmp(arg, "-s") == 0 && has_value) {
      opts.spool_dir = argv[++i];
    } else if (std::strcmp(arg, "-p") == 0 && has_value) {
      opts.pid_file = argv[++i];
    } else if (std::strcmp(arg, "-l") == 0 && has_value) {
      opts.log_file = argv[++i];
    } else if (arg[0] != '-' && opts.command == nullptr) {
      opts.command = arg;
    } else {
      return false;
    }
  }
  return opts.command != nullptr;
}

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!ParseArgs(argc, argv, opts)) {
    Usage(argv[0]);
    return 1;
  }

  dnd::log::Init();
  auto loaded = dnd::LoadDaemonConfig(opts.config_file);
  if (!loaded) {
    std::fprintf(stderr, "%s: cannot load config %s: %s\n", argv[0],
                 opts.config_file, dnd::ToString(loaded.get_error()));
    return 1;
  }
  dnd::DaemonConfig cfg = loaded.value();
  if (opts.foreground) cfg.foreground = true;
  if (opts.spool_dir != nullptr) cfg.spool_dir = opts.spool_dir;
  if (opts.pid_file != nullptr) cfg.pid_file = opts.pid_file;
  if (opts.log_file != nullptr) cfg.log_file = opts.log_file;

  if (std::strcmp(opts.command, "start") == 0) {
    dnd::Daemon daemon(cfg);
    const int code = daemon.Run();
    if (code == dnd::kExitAlreadyRunning) {
      std::fprintf(stderr, "%s: another instance is already running (pid %d)\n",
                   argv[0], static_cast<int>(daemon.Lock().HolderPid()));
    }
    return code;
  }

  dnd::ProcessLock lock(cfg.pid_file);
  if (std::strcmp(opts.command, "stop") == 0) {
    if (!dnd::StopDaemon(lock)) {
      std::fprintf(stderr, "%s: no running instance recorded in %s\n", argv[0],
                   cfg.pid_file.c_str());
      return 1;
    }
    return 0;
  }
  if (std::strcmp(opts.command, "status") == 0) {
    const dnd::DaemonStatus st = dnd::QueryStatus(lock);
    std::printf("%s\n", dnd::FormatStatus(st).c_str());
    return (st.state == dnd::DaemonState::kRunning) ? 0 : 1;
  }

  Usage(argv[0]);
  return 1;
}
