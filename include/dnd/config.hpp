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
 * @file config.hpp
 * @brief Daemon configuration: multi-format reader plus the DaemonConfig
 *        mapping.
 *
 * Every format is flattened to "section + key = value" entries held in a
 * ConfigStore. Formats are selected at compile time through backend tags:
 *   - IniBackend  : inih          (DND_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (DND_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (DND_CONFIG_YAML_ENABLED)
 *
 * @code
 *   auto cfg = dnd::LoadDaemonConfig("/etc/dnd/dnd.ini");
 *   if (cfg) run(cfg.value().spool_dir);
 * @endcode
 */

#ifndef DND_CONFIG_HPP_
#define DND_CONFIG_HPP_

#include "dnd/fs_watch.hpp"
#include "dnd/log.hpp"
#include "dnd/pid_lock.hpp"
#include "dnd/platform.hpp"
#include "dnd/spool.hpp"
#include "dnd/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#include <strings.h>

#ifdef DND_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef DND_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef DND_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace dnd {

// ============================================================================
// ConfigFormat and backend tags
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool IEquals(const char* a, const char* b) noexcept {
  return a != nullptr && b != nullptr && ::strcasecmp(a, b) == 0;
}

/// @brief Text after the last '.' of the last path component, or nullptr.
inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
  return dot + 1;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::IEquals(ext, "ini") || detail::IEquals(ext, "conf") ||
           detail::IEquals(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::IEquals(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::IEquals(ext, "yaml") || detail::IEquals(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef DND_CONFIG_MAX_ENTRIES
#define DND_CONFIG_MAX_ENTRIES 256U
#endif

/** @brief Flat, case-insensitive (section, key) -> value table. */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    optional<bool> v = FindBool(section, key);
    return v.value_or(default_val);
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return {};
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  /// Accepts true/false, yes/no, on/off, 1/0; anything else is empty.
  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    if (detail::IEquals(s, "true") || detail::IEquals(s, "yes") ||
        detail::IEquals(s, "on") || std::strcmp(s, "1") == 0) {
      return optional<bool>(true);
    }
    if (detail::IEquals(s, "false") || detail::IEquals(s, "no") ||
        detail::IEquals(s, "off") || std::strcmp(s, "0") == 0) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasSection(const char* section) const {
    DND_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::IEquals(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /**
   * @brief Insert or overwrite one entry.
   * @return false once DND_CONFIG_MAX_ENTRIES distinct keys are stored.
   */
  bool Set(const char* section, const char* key, const char* value) {
    DND_ASSERT(section != nullptr && key != nullptr);
    for (auto& e : entries_) {
      if (detail::IEquals(e.section.c_str(), section) &&
          detail::IEquals(e.key.c_str(), key)) {
        e.value = (value != nullptr) ? value : "";
        return true;
      }
    }
    if (entries_.size() >= DND_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, (value != nullptr) ? value : ""});
    return true;
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  const Entry* Find(const char* section, const char* key) const {
    DND_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::IEquals(e.section.c_str(), section) &&
          detail::IEquals(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadWholeFile(const char* path) {
    FILE* f = std::fopen(path, "re");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string text;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
      return expected<std::string, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<std::string, ConfigError>::success(std::move(text));
  }

  std::vector<Entry> entries_;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseText(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef DND_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return Check(ini_parse(path, &OnEntry, &store));
  }

  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    return Check(ini_parse_string(text.c_str(), &OnEntry, &store));
  }

 private:
  // ini_parse: 0 ok, -1 open failed, -2 out of memory, >0 first bad line
  static expected<void, ConfigError> Check(int rc) {
    if (rc == 0) return expected<void, ConfigError>::success();
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc > 0) DND_LOG_ERROR("Config", "INI syntax error on line %d", rc);
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section ? section : "", name ? name : "", value) ? 1 : 0;
  }
};
#endif

#ifdef DND_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto text = ConfigStore::ReadWholeFile(path);
    if (!text) return expected<void, ConfigError>::error(text.get_error());
    return ParseText(store, text.value());
  }

  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Set(it.key().c_str(), kit.key().c_str(),
                         Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", it.key().c_str(), Scalar(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

#ifdef DND_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto text = ConfigStore::ReadWholeFile(path);
    if (!text) return expected<void, ConfigError>::error(text.get_error());
    return ParseText(store, text.value());
  }

  static expected<void, ConfigError> ParseText(ConfigStore& store,
                                               const std::string& text) {
    auto root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const std::string key = kit.key().get_value<std::string>();
          if (!store.Set(section.c_str(), key.c_str(), Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", section.c_str(), Scalar(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    DND_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadText(const std::string& text,
                                       ConfigFormat format) {
    return ParseTextAs<Backends...>(text, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return ParseFileAs<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseTextAs(const std::string& text,
                                          ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseText(*this, text);
    if constexpr (sizeof...(Rest) > 0) return ParseTextAs<Rest...>(text, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  /// Unknown or missing extensions fall back to the first backend.
  static ConfigFormat DetectFormat(const char* path) noexcept {
    const char* ext = detail::FileExtension(path);
    return (ext == nullptr) ? Head::kFormat : FormatForExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  static ConfigFormat FormatForExt(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return FormatForExt<Rest...>(ext);
    return Head::kFormat;
  }
};

#if defined(DND_CONFIG_INI_ENABLED) || defined(DND_CONFIG_JSON_ENABLED) || \
    defined(DND_CONFIG_YAML_ENABLED)
#define DND_CONFIG_HAS_BACKEND 1
using MultiConfig = Config<
#ifdef DND_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(DND_CONFIG_INI_ENABLED) && \
    (defined(DND_CONFIG_JSON_ENABLED) || defined(DND_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef DND_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(DND_CONFIG_JSON_ENABLED) && defined(DND_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef DND_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

// ============================================================================
// DaemonConfig
// ============================================================================

static constexpr const char* kDefaultLogFile = "/var/log/dnd.log";
static constexpr uint32_t kDefaultPollIntervalMs = 500;

struct DaemonConfig {
  std::string spool_dir = kDefaultSpoolDir;
  std::string pid_file = kDefaultPidFile;
  bool foreground = false;
  std::string hostname = LocalHostname();
  std::string log_file = kDefaultLogFile;
  log::Level log_level = log::Level::kInfo;
  std::string relay_program = "/usr/bin/scp";
  std::string relay_args = "-qp";
  WatchBackend watch_backend = WatchBackend::kInotify;
  uint32_t poll_interval_ms = kDefaultPollIntervalMs;
};

/**
 * @brief Overlay the entries of @p store onto @p cfg.
 *
 * Missing keys keep their current value. An unknown log level or watch
 * backend, a non-boolean foreground flag or a non-positive poll interval
 * is rejected with kInvalidValue.
 */
inline expected<void, ConfigError> ApplyConfig(const ConfigStore& store,
                                               DaemonConfig& cfg) {
  using Result = expected<void, ConfigError>;
  auto reject = [](const char* section, const char* key, const char* value) {
    DND_LOG_ERROR("Config", "invalid value for %s.%s: \"%s\"", section, key,
                  value);
    return Result::error(ConfigError::kInvalidValue);
  };

  auto take = [&store](const char* section, const char* key, std::string& dst) {
    if (store.HasKey(section, key)) dst = store.GetString(section, key);
  };
  take("spool", "dir", cfg.spool_dir);
  take("daemon", "pid_file", cfg.pid_file);
  take("daemon", "hostname", cfg.hostname);
  take("log", "file", cfg.log_file);
  take("relay", "program", cfg.relay_program);
  take("relay", "args", cfg.relay_args);

  if (store.HasKey("daemon", "foreground")) {
    optional<bool> fg = store.FindBool("daemon", "foreground");
    if (!fg) return reject("daemon", "foreground", store.GetString("daemon", "foreground"));
    cfg.foreground = fg.value();
  }

  if (store.HasKey("log", "level")) {
    const char* name = store.GetString("log", "level");
    if (!log::ParseLevel(name, cfg.log_level)) return reject("log", "level", name);
  }

  if (store.HasKey("watch", "backend")) {
    const char* name = store.GetString("watch", "backend");
    if (detail::IEquals(name, "inotify")) {
      cfg.watch_backend = WatchBackend::kInotify;
    } else if (detail::IEquals(name, "polling")) {
      cfg.watch_backend = WatchBackend::kPolling;
    } else {
      return reject("watch", "backend", name);
    }
  }

  if (store.HasKey("watch", "poll_interval_ms")) {
    optional<int32_t> ms = store.FindInt("watch", "poll_interval_ms");
    if (!ms || ms.value() <= 0) {
      return reject("watch", "poll_interval_ms",
                    store.GetString("watch", "poll_interval_ms"));
    }
    cfg.poll_interval_ms = static_cast<uint32_t>(ms.value());
  }

  if (cfg.spool_dir.empty()) return reject("spool", "dir", "");
  if (cfg.hostname.empty()) return reject("daemon", "hostname", "");
  return Result::success();
}

/**
 * @brief Defaults overlaid with the file at @p path.
 * @param path Config file; nullptr or "" yields the defaults.
 */
inline expected<DaemonConfig, ConfigError> LoadDaemonConfig(const char* path) {
  using Result = expected<DaemonConfig, ConfigError>;
  DaemonConfig cfg;
  if (path == nullptr || path[0] == '\0') return Result::success(std::move(cfg));
#ifdef DND_CONFIG_HAS_BACKEND
  MultiConfig file;
  auto loaded = file.LoadFile(path);
  if (!loaded) {
    DND_LOG_ERROR("Config", "cannot load %s: %s", path,
                  ToString(loaded.get_error()));
    return Result::error(loaded.get_error());
  }
  auto applied = ApplyConfig(file, cfg);
  if (!applied) return Result::error(applied.get_error());
  return Result::success(std::move(cfg));
#else
  DND_LOG_ERROR("Config", "no config backend compiled in; cannot read %s", path);
  return Result::error(ConfigError::kFormatNotSupported);
#endif
}

}  // namespace dnd

#endif  // DND_CONFIG_HPP_
