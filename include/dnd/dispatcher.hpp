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
 * @file dispatcher.hpp
 * @brief Per-entry dispatch: execute locally or relay to the next host.
 *
 * ProcessEntry() walks the record's dst_host list in order. The first
 * entry naming this host is executed through /bin/sh and ends the walk
 * (sent/ or failed/). Other hosts get a copy of the file through the
 * RelayTransport; the first successful copy moves it to dispatched/.
 * When every copy fails the entry lands in failed/.
 */

#ifndef DND_DISPATCHER_HPP_
#define DND_DISPATCHER_HPP_

#include "dnd/log.hpp"
#include "dnd/platform.hpp"
#include "dnd/process.hpp"
#include "dnd/record.hpp"
#include "dnd/spool.hpp"
#include "dnd/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <strings.h>

namespace dnd {

// ============================================================================
// RelayTransport
// ============================================================================

/** @brief Copies a spool file to the same path on another host. */
class RelayTransport {
 public:
  virtual ~RelayTransport() = default;

  /** @return exit_code 0 on success. */
  virtual CommandResult Copy(const std::string& host,
                             const std::string& path) = 0;
};

static constexpr const char* kDefaultRelayProgram = "/usr/bin/scp";
static constexpr const char* kDefaultRelayArgs = "-qp";

/**
 * @brief Runs "<program> <args...> <path> <host>:<path>".
 *
 * With the defaults this is "scp -qp FILE HOST:FILE".
 */
class CommandRelay final : public RelayTransport {
 public:
  CommandRelay() : program_(kDefaultRelayProgram), args_{kDefaultRelayArgs} {}

  CommandRelay(std::string program, std::vector<std::string> args)
      : program_(std::move(program)), args_(std::move(args)) {}

  const std::string& Program() const noexcept { return program_; }

  CommandResult Copy(const std::string& host,
                     const std::string& path) override {
    std::vector<std::string> argv;
    argv.reserve(args_.size() + 3);
    argv.push_back(program_);
    for (const auto& a : args_) argv.push_back(a);
    argv.push_back(path);
    argv.push_back(host + ":" + path);
    return RunCommand(argv);
  }

 private:
  std::string program_;
  std::vector<std::string> args_;
};

/// @brief Split a whitespace-separated argument string ("-qp -o X").
inline std::vector<std::string> SplitArgs(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : text) {
    if (detail::IsBlank(c)) {
      if (!cur.empty()) out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

// ============================================================================
// DispatchOutcome
// ============================================================================

enum class DispatchOutcome : uint8_t {
  kUnreadable = 0,   ///< Parse failed; file left in queue/
  kNoDestination,    ///< No dst_host; moved to failed/
  kSent,             ///< Executed locally, all commands exited 0
  kExecFailed,       ///< Executed locally, some command failed
  kDispatched,       ///< Copied to a remote host
  kRelayExhausted,   ///< Every remote copy failed
  kStorageFault      ///< Spool bookkeeping failed
};

static constexpr uint32_t kDispatchOutcomeCount = 7;

inline const char* ToString(DispatchOutcome o) noexcept {
  switch (o) {
    case DispatchOutcome::kUnreadable: return "unreadable";
    case DispatchOutcome::kNoDestination: return "no destination";
    case DispatchOutcome::kSent: return "sent";
    case DispatchOutcome::kExecFailed: return "execution failed";
    case DispatchOutcome::kDispatched: return "dispatched";
    case DispatchOutcome::kRelayExhausted: return "relay exhausted";
    case DispatchOutcome::kStorageFault: return "storage fault";
  }
  return "unknown";
}

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher {
 public:
  Dispatcher(const SpoolStore& spool, RelayTransport& relay, std::string hostname)
      : spool_(spool), relay_(relay), hostname_(std::move(hostname)), counts_{} {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  const std::string& Hostname() const noexcept { return hostname_; }

  /** @brief Number of entries that ended with @p o since construction. */
  uint64_t Count(DispatchOutcome o) const noexcept {
    return counts_[static_cast<uint32_t>(o)];
  }

  /**
   * @brief Dispatch one queued file to its terminal state.
   * @param path Full path of a file in queue/.
   */
  DispatchOutcome ProcessEntry(const std::string& path) {
    DispatchOutcome o = Process(path);
    ++counts_[static_cast<uint32_t>(o)];
    return o;
  }

 private:
  DispatchOutcome Process(const std::string& path) {
    auto parsed = ParseRecord(path, hostname_);
    if (!parsed) {
      DND_LOG_ERROR("Dispatch", "cannot parse \"%s\": %s; left in queue",
                    path.c_str(), ToString(parsed.get_error()));
      return DispatchOutcome::kUnreadable;
    }
    const Record& rec = parsed.value();

    if (rec.dst_hosts.empty()) {
      DND_LOG_WARN("Dispatch", "no destination in \"%s\"", path.c_str());
      return Settle(path, SpoolState::kFailed, "No destination specified",
                    DispatchOutcome::kNoDestination);
    }

    std::vector<std::string> tried;
    for (const auto& host : rec.dst_hosts) {
      if (host.empty()) continue;
      if (::strcasecmp(host.c_str(), hostname_.c_str()) == 0) {
        return ExecuteLocally(path, rec);
      }
      tried.push_back(host);
      CommandResult cr = relay_.Copy(host, path);
      if (cr.exit_code == 0) {
        DND_LOG_INFO("Dispatch", "file \"%s\" copied to host \"%s\"",
                     detail::BaseName(path).c_str(), host.c_str());
        std::string note = "Successfully copied file \"" + path + "\" to " +
                           host + ":\"" + path + "\"";
        return Settle(path, SpoolState::kDispatched, note,
                      DispatchOutcome::kDispatched);
      }
      DND_LOG_WARN("Dispatch", "error copying file \"%s\" to \"%s\" (ret: %d, err: %d)",
                   path.c_str(), host.c_str(), cr.exit_code, cr.error_code);
    }

    std::string note = "Error copying file \"" + path + "\" to any of: ";
    for (size_t i = 0; i < tried.size(); ++i) {
      if (i != 0) note += ", ";
      note += tried[i];
    }
    DND_LOG_ERROR("Dispatch", "all destinations failed for \"%s\"", path.c_str());
    return Settle(path, SpoolState::kFailed, note,
                  DispatchOutcome::kRelayExhausted);
  }

  DispatchOutcome ExecuteLocally(const std::string& path, const Record& rec) {
    struct Failure {
      CommandResult result;
      const std::string* cmd;
    };
    std::vector<Failure> results;
    bool all_zero = true;
    for (const auto& cmd : rec.commands) {
      CommandResult cr = RunShellCommand(cmd);
      DND_LOG_DEBUG("Dispatch", "ran \"%s\": ret %d, err %d", cmd.c_str(),
                    cr.exit_code, cr.error_code);
      if (cr.exit_code != 0) all_zero = false;
      results.push_back(Failure{cr, &cmd});
    }

    if (all_zero) {
      DND_LOG_INFO("Dispatch", "file \"%s\" parsed and executed locally",
                   path.c_str());
      return Settle(path, SpoolState::kSent, std::string(),
                    DispatchOutcome::kSent);
    }

    std::string note = "Local execution failed. Return codes from system call: ";
    char buf[64];
    for (size_t i = 0; i < results.size(); ++i) {
      if (i != 0) note += ", ";
      std::snprintf(buf, sizeof(buf), "[ ret: %d, err: %d, cmd: ",
                    results[i].result.exit_code, results[i].result.error_code);
      note += buf;
      note += *results[i].cmd;
      note += " ]";
    }
    DND_LOG_INFO("Dispatch",
                 "errors when executing \"%s\" locally; see failed/%s",
                 path.c_str(), detail::BaseName(path).c_str());
    return Settle(path, SpoolState::kFailed, note, DispatchOutcome::kExecFailed);
  }

  /**
   * Move to @p state and append @p note (if any). When that move fails the
   * entry is parked in failed/ under a free name, with the reason added.
   */
  DispatchOutcome Settle(const std::string& path, SpoolState state,
                         const std::string& note, DispatchOutcome outcome) {
    auto moved = spool_.MoveTo(path, state);
    if (moved) {
      if (!note.empty() && !spool_.AppendOutcome(moved.value(), note)) {
        DND_LOG_ERROR("Dispatch", "cannot annotate \"%s\"", moved.value().c_str());
        return DispatchOutcome::kStorageFault;
      }
      return outcome;
    }

    auto parked = spool_.MoveToUnique(path, SpoolState::kFailed);
    if (!parked) {
      DND_LOG_ERROR("Dispatch", "cannot move \"%s\" to %s/ or failed/",
                    path.c_str(), StateDirName(state));
      return DispatchOutcome::kStorageFault;
    }
    std::string text = std::string("Could not move file to ") +
                       StateDirName(state) + "/: " + ToString(moved.get_error());
    if (parked.value() != detail::JoinPath(spool_.StateDir(SpoolState::kFailed),
                                           detail::BaseName(path))) {
      text += "; stored as " + detail::BaseName(parked.value());
    }
    if (!note.empty()) text = note + "\n" + text;
    if (!spool_.AppendOutcome(parked.value(), text)) {
      return DispatchOutcome::kStorageFault;
    }
    if (state == SpoolState::kFailed) return outcome;
    return (outcome == DispatchOutcome::kDispatched)
               ? DispatchOutcome::kRelayExhausted
               : DispatchOutcome::kExecFailed;
  }

  const SpoolStore& spool_;
  RelayTransport& relay_;
  std::string hostname_;
  uint64_t counts_[kDispatchOutcomeCount];
};

}  // namespace dnd

#endif  // DND_DISPATCHER_HPP_
