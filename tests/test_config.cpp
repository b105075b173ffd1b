/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - config store, backends and DaemonConfig.
 */

#include "dnd/config.hpp"

#include "test_util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore typed getters", "[config]") {
  dnd::ConfigStore store;
  REQUIRE(store.Set("watch", "poll_interval_ms", "250"));
  REQUIRE(store.Set("daemon", "foreground", "yes"));
  REQUIRE(store.Set("spool", "dir", "/srv/spool"));

  REQUIRE(store.GetInt("watch", "poll_interval_ms", 0) == 250);
  REQUIRE(store.GetBool("daemon", "foreground"));
  REQUIRE(std::strcmp(store.GetString("spool", "dir"), "/srv/spool") == 0);
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.EntryCount() == 3U);
}

TEST_CASE("ConfigStore lookups ignore case", "[config]") {
  dnd::ConfigStore store;
  REQUIRE(store.Set("Log", "Level", "warn"));
  REQUIRE(store.HasSection("log"));
  REQUIRE(store.HasKey("LOG", "level"));
  REQUIRE(!store.HasKey("log", "file"));
}

TEST_CASE("ConfigStore Set overwrites", "[config]") {
  dnd::ConfigStore store;
  REQUIRE(store.Set("s", "k", "v1"));
  REQUIRE(store.Set("S", "K", "v2"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(std::strcmp(store.GetString("s", "k"), "v2") == 0);
}

TEST_CASE("ConfigStore FindInt and FindBool reject junk", "[config]") {
  dnd::ConfigStore store;
  REQUIRE(store.Set("a", "n", "12abc"));
  REQUIRE(store.Set("a", "b", "maybe"));
  REQUIRE(store.Set("a", "off", "off"));
  REQUIRE(!store.FindInt("a", "n").has_value());
  REQUIRE(!store.FindBool("a", "b").has_value());
  REQUIRE(store.FindBool("a", "off").has_value());
  REQUIRE(!store.FindBool("a", "off").value());
}

// ============================================================================
// DaemonConfig
// ============================================================================

TEST_CASE("LoadDaemonConfig without a file yields defaults", "[config]") {
  auto r = dnd::LoadDaemonConfig(nullptr);
  REQUIRE(r.has_value());
  const dnd::DaemonConfig& cfg = r.value();
  REQUIRE(cfg.spool_dir == "/var/spool/dnd");
  REQUIRE(cfg.pid_file == "/var/run/dnd.pid");
  REQUIRE(!cfg.foreground);
  REQUIRE(!cfg.hostname.empty());
  REQUIRE(cfg.log_file == "/var/log/dnd.log");
  REQUIRE(cfg.log_level == dnd::log::Level::kInfo);
  REQUIRE(cfg.relay_program == "/usr/bin/scp");
  REQUIRE(cfg.relay_args == "-qp");
  REQUIRE(cfg.watch_backend == dnd::WatchBackend::kInotify);
  REQUIRE(cfg.poll_interval_ms == 500U);
}

TEST_CASE("ApplyConfig overlays present keys only", "[config]") {
  dnd::ConfigStore store;
  REQUIRE(store.Set("spool", "dir", "/tmp/spool"));
  REQUIRE(store.Set("daemon", "foreground", "true"));
  REQUIRE(store.Set("daemon", "hostname", "mon01"));
  REQUIRE(store.Set("log", "level", "debug"));
  REQUIRE(store.Set("watch", "backend", "polling"));
  REQUIRE(store.Set("watch", "poll_interval_ms", "100"));

  dnd::DaemonConfig cfg;
  REQUIRE(dnd::ApplyConfig(store, cfg).has_value());
  REQUIRE(cfg.spool_dir == "/tmp/spool");
  REQUIRE(cfg.foreground);
  REQUIRE(cfg.hostname == "mon01");
  REQUIRE(cfg.log_level == dnd::log::Level::kDebug);
  REQUIRE(cfg.watch_backend == dnd::WatchBackend::kPolling);
  REQUIRE(cfg.poll_interval_ms == 100U);
  REQUIRE(cfg.pid_file == "/var/run/dnd.pid");
  REQUIRE(cfg.relay_program == "/usr/bin/scp");
}

TEST_CASE("ApplyConfig rejects invalid values", "[config]") {
  SECTION("log level") {
    dnd::ConfigStore store;
    REQUIRE(store.Set("log", "level", "chatty"));
    dnd::DaemonConfig cfg;
    auto r = dnd::ApplyConfig(store, cfg);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == dnd::ConfigError::kInvalidValue);
  }
  SECTION("watch backend") {
    dnd::ConfigStore store;
    REQUIRE(store.Set("watch", "backend", "fanotify"));
    dnd::DaemonConfig cfg;
    REQUIRE(!dnd::ApplyConfig(store, cfg).has_value());
  }
  SECTION("poll interval") {
    dnd::ConfigStore store;
    REQUIRE(store.Set("watch", "poll_interval_ms", "0"));
    dnd::DaemonConfig cfg;
    REQUIRE(!dnd::ApplyConfig(store, cfg).has_value());
  }
  SECTION("foreground flag") {
    dnd::ConfigStore store;
    REQUIRE(store.Set("daemon", "foreground", "sometimes"));
    dnd::DaemonConfig cfg;
    REQUIRE(!dnd::ApplyConfig(store, cfg).has_value());
  }
  SECTION("empty spool dir") {
    dnd::ConfigStore store;
    REQUIRE(store.Set("spool", "dir", ""));
    dnd::DaemonConfig cfg;
    REQUIRE(!dnd::ApplyConfig(store, cfg).has_value());
  }
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef DND_CONFIG_INI_ENABLED

using IniCfg = dnd::Config<dnd::IniBackend>;

TEST_CASE("INI LoadText basic", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadText(
      "[spool]\n"
      "dir = /var/spool/dnd\n"
      "[relay]\n"
      "args = -qp -o BatchMode=yes\n",
      dnd::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("spool", "dir"), "/var/spool/dnd") == 0);
  REQUIRE(std::strcmp(cfg.GetString("relay", "args"), "-qp -o BatchMode=yes") == 0);
}

TEST_CASE("INI syntax error is a parse error", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadText("[spool\ndir\n", dnd::ConfigFormat::kIni);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == dnd::ConfigError::kParseError);
}

TEST_CASE("INI missing file", "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadFile("/nonexistent/dnd.ini");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == dnd::ConfigError::kFileNotFound);
}

TEST_CASE("INI unsupported format through a single-backend Config",
          "[config][ini]") {
  IniCfg cfg;
  auto result = cfg.LoadText("{}", dnd::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == dnd::ConfigError::kFormatNotSupported);
}

TEST_CASE("LoadDaemonConfig reads an INI file", "[config][ini]") {
  dnd_test::TempDir dir;
  const std::string path = dir.Sub("dnd.ini");
  REQUIRE(dnd_test::WriteFile(path,
                              "; comment\n"
                              "[spool]\n"
                              "dir = /srv/dnd\n"
                              "[daemon]\n"
                              "pid_file = /run/dnd.pid\n"
                              "foreground = on\n"
                              "[log]\n"
                              "level = error\n"));
  auto r = dnd::LoadDaemonConfig(path.c_str());
  REQUIRE(r.has_value());
  REQUIRE(r.value().spool_dir == "/srv/dnd");
  REQUIRE(r.value().pid_file == "/run/dnd.pid");
  REQUIRE(r.value().foreground);
  REQUIRE(r.value().log_level == dnd::log::Level::kError);
}

TEST_CASE("LoadDaemonConfig reports a missing file", "[config][ini]") {
  auto r = dnd::LoadDaemonConfig("/nonexistent/dnd.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dnd::ConfigError::kFileNotFound);
}

#endif  // DND_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef DND_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadText flattens sections", "[config][json]") {
  dnd::Config<dnd::JsonBackend> cfg;
  auto result = cfg.LoadText(
      R"({"spool": {"dir": "/srv/dnd"}, "watch": {"poll_interval_ms": 250},
          "daemon": {"foreground": true}})",
      dnd::ConfigFormat::kJson);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("spool", "dir"), "/srv/dnd") == 0);
  REQUIRE(cfg.GetInt("watch", "poll_interval_ms") == 250);
  REQUIRE(cfg.GetBool("daemon", "foreground"));
}

TEST_CASE("JSON rejects malformed input", "[config][json]") {
  dnd::Config<dnd::JsonBackend> cfg;
  REQUIRE(!cfg.LoadText("{not json", dnd::ConfigFormat::kJson).has_value());
}

#endif  // DND_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef DND_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadText flattens sections", "[config][yaml]") {
  dnd::Config<dnd::YamlBackend> cfg;
  auto result = cfg.LoadText(
      "spool:\n"
      "  dir: /srv/dnd\n"
      "watch:\n"
      "  backend: polling\n"
      "  poll_interval_ms: 250\n",
      dnd::ConfigFormat::kYaml);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("watch", "backend"), "polling") == 0);
  REQUIRE(cfg.GetInt("watch", "poll_interval_ms") == 250);
}

#endif  // DND_CONFIG_YAML_ENABLED
