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
 * @file record.hpp
 * @brief Spool record codec: "key = value" lines plus free-text comments.
 *
 * File format:
 * @code
 *   created  = 1717171717
 *   src_host = node1
 *   dst_host = node2          (repeatable, priority order)
 *   dst_host = node3
 *   cmd      = /usr/bin/sendsms 4712345678 "disk full"   (repeatable)
 *   Any line without a separator is a comment.
 * @endcode
 *
 * dst_host values "localhost" (any case) and "127.0.0.1" are resolved to
 * the local hostname while parsing, so routing never relays to self.
 */

#ifndef DND_RECORD_HPP_
#define DND_RECORD_HPP_

#include "dnd/platform.hpp"
#include "dnd/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <strings.h>

namespace dnd {

// ============================================================================
// Well-known keys
// ============================================================================

static constexpr const char* kKeyCreated = "created";
static constexpr const char* kKeySrcHost = "src_host";
static constexpr const char* kKeyDstHost = "dst_host";
static constexpr const char* kKeyCmd = "cmd";
static constexpr const char* kKeyComments = "comments";

// ============================================================================
// RecordError
// ============================================================================

enum class RecordError : uint8_t {
  kOpenFailed = 0,
  kReadFailed
};

inline const char* ToString(RecordError e) noexcept {
  switch (e) {
    case RecordError::kOpenFailed: return "cannot open record";
    case RecordError::kReadFailed: return "cannot read record";
  }
  return "unknown";
}

// ============================================================================
// Record
// ============================================================================

/** @brief One parsed spool entry. */
struct Record {
  optional<std::string> created;
  optional<std::string> src_host;
  std::vector<std::string> dst_hosts;
  std::vector<std::string> commands;
  std::vector<std::string> comments;
  /// Unknown keys in first-seen order; a repeated key keeps its last value.
  std::vector<std::pair<std::string, std::string>> extra;

  /** @brief Set an unknown key, overwriting an earlier value in place. */
  void SetExtra(const std::string& key, const std::string& value) {
    for (auto& kv : extra) {
      if (kv.first == key) {
        kv.second = value;
        return;
      }
    }
    extra.emplace_back(key, value);
  }

  /** @brief Value of an unknown key, or nullptr. */
  const std::string* FindExtra(const std::string& key) const {
    for (const auto& kv : extra) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }
};

namespace detail {

inline bool IsBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

inline std::string TrimLeft(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && IsBlank(s[b])) ++b;
  return s.substr(b);
}

inline std::string TrimRight(const std::string& s) {
  size_t e = s.size();
  while (e > 0 && IsBlank(s[e - 1])) --e;
  return s.substr(0, e);
}

inline std::string Trim(const std::string& s) { return TrimRight(TrimLeft(s)); }

/// @brief Split at the first '='. False when the line is not a field.
inline bool SplitField(const std::string& line, std::string& key,
                       std::string& value) {
  const size_t eq = line.find('=');
  if (eq == std::string::npos) return false;
  key = Trim(line.substr(0, eq));
  value = Trim(line.substr(eq + 1));
  return !key.empty() && !value.empty();
}

inline bool IsLoopbackName(const std::string& host) noexcept {
  return ::strcasecmp(host.c_str(), "localhost") == 0 || host == "127.0.0.1";
}

/// @brief Remove every '=' so a comment can never re-parse as a field.
inline std::string StripSeparators(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '=') out.push_back(c);
  }
  return out;
}

}  // namespace detail

// ============================================================================
// Parse
// ============================================================================

/**
 * @brief Parse record text that has already been read into memory.
 * @param text Whole file content.
 * @param local_hostname Substituted for loopback destinations.
 */
inline Record ParseRecordText(const std::string& text,
                              const std::string& local_hostname) {
  Record rec;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    const std::string line = text.substr(pos, nl - pos);
    pos = nl + 1;

    std::string key;
    std::string value;
    if (!detail::SplitField(line, key, value)) {
      rec.comments.push_back(line);
      continue;
    }

    if (key == kKeyDstHost) {
      rec.dst_hosts.push_back(detail::IsLoopbackName(value) ? local_hostname
                                                            : value);
    } else if (key == kKeyCmd) {
      rec.commands.push_back(value);
    } else if (key == kKeyCreated) {
      rec.created = value;
    } else if (key == kKeySrcHost) {
      rec.src_host = value;
    } else if (key == kKeyComments) {
      rec.comments.push_back(value);
    } else {
      rec.SetExtra(key, value);
    }
  }
  return rec;
}

/**
 * @brief Read and parse a spool file.
 * @return The record, or kOpenFailed / kReadFailed. A file without any
 *         field is still a valid (all-comments) record.
 */
inline expected<Record, RecordError> ParseRecord(
    const std::string& path, const std::string& local_hostname) {
  FILE* f = std::fopen(path.c_str(), "re");
  if (f == nullptr) {
    return expected<Record, RecordError>::error(RecordError::kOpenFailed);
  }
  std::string text;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    text.append(buf, n);
  }
  const bool read_error = std::ferror(f) != 0;
  std::fclose(f);
  if (read_error) {
    return expected<Record, RecordError>::error(RecordError::kReadFailed);
  }
  return expected<Record, RecordError>::success(
      ParseRecordText(text, local_hostname));
}

// ============================================================================
// Serialize
// ============================================================================

/**
 * @brief Render a record as file lines (no trailing newlines).
 *
 * Order: created, src_host, unknown keys, dst_host..., cmd..., comments.
 * Empty values are skipped; '=' is stripped from comments.
 */
inline std::vector<std::string> SerializeRecord(const Record& rec) {
  std::vector<std::string> lines;
  auto emit = [&lines](const char* key, const std::string& value) {
    if (!value.empty()) lines.push_back(std::string(key) + " = " + value);
  };

  if (rec.created) emit(kKeyCreated, rec.created.value());
  if (rec.src_host) emit(kKeySrcHost, rec.src_host.value());
  for (const auto& kv : rec.extra) emit(kv.first.c_str(), kv.second);
  for (const auto& h : rec.dst_hosts) emit(kKeyDstHost, h);
  for (const auto& c : rec.commands) emit(kKeyCmd, c);
  for (const auto& c : rec.comments) {
    lines.push_back(detail::StripSeparators(c));
  }
  return lines;
}

/** @brief SerializeRecord() joined with '\n', newline-terminated. */
inline std::string RecordToString(const Record& rec) {
  std::string out;
  for (const auto& line : SerializeRecord(rec)) {
    out += line;
    out += '\n';
  }
  return out;
}

}  // namespace dnd

#endif  // DND_RECORD_HPP_
