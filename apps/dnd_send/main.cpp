/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file main.cpp
 * @brief dnd_send -- write a notification file into the dnd queue.
 *
 * Usage:
 *   dnd_send --destination-host HOST [--destination-host HOST ...]
 *            --command CMD [--command CMD ...]
 *            [--source-host HOST] [--comments TEXT] [--dir DIR]
 *            [--config FILE]
 *   dnd_send --kill [--config FILE]
 *
 * Options take their value as the next argument or after '='
 * (--dir=/tmp). Prints the path of the created file.
 */

#include "dnd/config.hpp"
#include "dnd/daemon.hpp"
#include "dnd/log.hpp"
#include "dnd/spool.hpp"
#include "dnd/submit.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

static void Usage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s --destination-host HOST --command CMD "
               "[--source-host HOST] [--comments TEXT] [--dir DIR] "
               "[--config FILE] | --kill\n",
               prog);
}

/// Match "--name VALUE" or "--name=VALUE"; advances @p i past the value.
static bool TakeValue(int argc, char* argv[], int& i, const char* name,
                      const char*& value) {
  const size_t len = std::strlen(name);
  if (std::strncmp(argv[i], name, len) != 0) return false;
  if (argv[i][len] == '=') {
    value = argv[i] + len + 1;
    return true;
  }
  if (argv[i][len] == '\0' && (i + 1) < argc) {
    value = argv[++i];
    return true;
  }
  return false;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    Usage(argv[0]);
    return 1;
  }

  const char* config_file = nullptr;
  const char* dir = nullptr;
  bool kill_daemon = false;
  dnd::SubmitRequest req;
  std::vector<std::string> comments;

  for (int i = 1; i < argc; ++i) {
    const char* v = nullptr;
    if (std::strcmp(argv[i], "--kill") == 0) {
      kill_daemon = true;
    } else if (TakeValue(argc, argv, i, "--destination-host", v)) {
      req.destinations.push_back(v);
    } else if (TakeValue(argc, argv, i, "--command", v)) {
      req.commands.push_back(v);
    } else if (TakeValue(argc, argv, i, "--source-host", v)) {
      req.src_host = std::string(v);
    } else if (TakeValue(argc, argv, i, "--comments", v)) {
      comments.push_back(v);
    } else if (TakeValue(argc, argv, i, "--dir", v)) {
      dir = v;
    } else if (TakeValue(argc, argv, i, "--config", v)) {
      config_file = v;
    } else {
      Usage(argv[0]);
      return 2;
    }
  }

  dnd::log::Init();
  auto loaded = dnd::LoadDaemonConfig(config_file);
  if (!loaded) {
    std::fprintf(stderr, "%s: cannot load config: %s\n", argv[0],
                 dnd::ToString(loaded.get_error()));
    return 1;
  }
  const dnd::DaemonConfig& cfg = loaded.value();
  if (!dnd::log::Init(cfg.log_file.c_str())) {
    dnd::log::Init();
  }
  dnd::log::SetLevel(cfg.log_level);

  if (kill_daemon) {
    dnd::ProcessLock lock(cfg.pid_file);
    return dnd::StopDaemon(lock) ? 0 : 1;
  }

  dnd::SubmitRequest full = dnd::MakeSubmitRequest(cfg.hostname);
  if (req.src_host) full.src_host = req.src_host;
  full.destinations = req.destinations;
  full.commands = req.commands;
  full.comments = comments;
  if (dir != nullptr) full.target_dir = std::string(dir);

  dnd::SpoolStore spool(cfg.spool_dir, cfg.hostname);
  auto path = dnd::Submit(full, spool);
  if (!path) {
    std::fprintf(stderr, "%s: cannot write spool file: %s\n", argv[0],
                 dnd::ToString(path.get_error()));
    return 1;
  }
  std::printf("%s\n", path.value().c_str());
  return 0;
}
