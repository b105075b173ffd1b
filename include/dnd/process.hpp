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
 * @file process.hpp
 * @brief Linux process helpers: liveness check, signalling, spawn-and-wait.
 *
 * Header-only. Children are started with fork(2)/execvp(2) in their own
 * session with default signal dispositions and inherit stdio, which is
 * /dev/null once the daemon has detached.
 *
 * Features:
 *   - IsProcessAlive: kill(pid, 0) check, conservative on EPERM
 *   - SignalProcess: deliver a signal by PID
 *   - Subprocess: spawn an argv vector and wait for its exit status
 *   - RunCommand / RunShellCommand: blocking convenience wrappers
 *   - CurrentUser: login name of the effective uid
 */

#ifndef DND_PROCESS_HPP_
#define DND_PROCESS_HPP_

#include "dnd/platform.hpp"

#if defined(DND_PLATFORM_LINUX)

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <pwd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,     ///< fork(2) or signal delivery failed
  kWaitError = -2,  ///< waitpid(2) failed
};

static constexpr const char* kShellPath = "/bin/sh";
static constexpr int kExecFailedCode = 127;

// ============================================================================
// Process query / control
// ============================================================================

/**
 * @brief Check whether @p pid names a live process.
 *
 * Any kill(2) error other than ESRCH (typically EPERM: the process exists
 * but belongs to someone else) counts as alive.
 */
inline bool IsProcessAlive(pid_t pid) {
  if (pid <= 0) return false;
  if (kill(pid, 0) == 0) return true;
  return errno != ESRCH;
}

/**
 * @brief Send @p signo to @p pid.
 * @return kSuccess if delivered, kFailed otherwise (errno preserved).
 */
inline ProcessResult SignalProcess(pid_t pid, int signo) {
  if (pid <= 0) return ProcessResult::kFailed;
  return (kill(pid, signo) == 0) ? ProcessResult::kSuccess : ProcessResult::kFailed;
}

// ============================================================================
// Subprocess
// ============================================================================

/// @brief Wait result from Subprocess::Wait.
struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< Exit code (valid if exited==true)
  bool signaled;    ///< true if child was killed by signal
  int term_signal;  ///< Signal number (valid if signaled==true)
  int wait_errno;   ///< errno from waitpid(2), 0 on success

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0), wait_errno(0) {}

  /// @brief Shell-style status: exit code, or 128 + signal number.
  int StatusCode() const {
    if (exited) return exit_code;
    if (signaled) return 128 + term_signal;
    return -1;
  }
};

/**
 * @brief Child process handle.
 *
 * RAII: the destructor kills and reaps a child that was never waited for.
 *
 * Usage:
 * @code
 *   const char* argv[] = {"/usr/bin/scp", "-qp", src, dst, nullptr};
 *   dnd::Subprocess proc;
 *   if (proc.Start(argv) == dnd::ProcessResult::kSuccess) {
 *     dnd::WaitResult wr = proc.Wait();
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1) {}

  ~Subprocess() {
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status;
      waitpid(pid_, &status, 0);
    }
  }

  // Non-copyable, movable
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) : pid_(other.pid_) { other.pid_ = -1; }

  Subprocess& operator=(Subprocess&& other) {
    if (this != &other) {
      if (pid_ > 0) {
        kill(pid_, SIGKILL);
        int status;
        waitpid(pid_, &status, 0);
      }
      pid_ = other.pid_;
      other.pid_ = -1;
    }
    return *this;
  }

  /**
   * @brief Spawn a child process.
   * @param argv NULL-terminated argument array; argv[0] is looked up in PATH.
   * @return kSuccess on success, kFailed on fork error (errno preserved).
   *         An exec failure surfaces as exit code 127 from Wait().
   */
  ProcessResult Start(const char* const* argv) {
    if (!argv || !argv[0])
      return ProcessResult::kFailed;

    pid_t child = fork();
    if (child < 0)
      return ProcessResult::kFailed;

    if (child == 0) {
      // -- Child process --
      // Create new session to isolate signals from parent
      setsid();

      // Reset all signal dispositions to default (SIG_IGN survives exec)
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }
      sigset_t none;
      sigemptyset(&none);
      sigprocmask(SIG_SETMASK, &none, nullptr);

      execvp(argv[0], const_cast<char* const*>(argv));
      _exit(kExecFailedCode);
    }

    pid_ = child;
    return ProcessResult::kSuccess;
  }

  /**
   * @brief Block until the child exits. Retries waitpid(2) on EINTR.
   */
  WaitResult Wait() {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.wait_errno = ECHILD;
      return wr;
    }
    int status = 0;
    pid_t w;
    do {
      w = waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
      wr.wait_errno = errno;
      return wr;
    }
    pid_ = -1;
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
    return wr;
  }

  /// @brief Get child PID (-1 if not started or already waited).
  pid_t GetPid() const { return pid_; }

 private:
  pid_t pid_;
};

/// @brief Name of the effective user, or the numeric uid if unknown.
inline std::string CurrentUser() {
  const uid_t uid = ::geteuid();
  struct passwd pw;
  struct passwd* found = nullptr;
  char buf[1024];
  if (::getpwuid_r(uid, &pw, buf, sizeof(buf), &found) == 0 && found != nullptr) {
    return std::string(found->pw_name);
  }
  return std::to_string(static_cast<unsigned long>(uid));
}

// ============================================================================
// Convenience: run to completion
// ============================================================================

/// @brief Outcome of one blocking command run.
struct CommandResult {
  int exit_code = -1;  ///< Shell-style status (exit code or 128 + signal)
  int error_code = 0;  ///< errno if the command could not be run or reaped
};

/**
 * @brief Run an argv vector and wait for it.
 *
 * @code
 *   const char* argv[] = {"/bin/true", nullptr};
 *   dnd::CommandResult r = dnd::RunCommand(argv);
 * @endcode
 */
inline CommandResult RunCommand(const char* const* argv) {
  CommandResult res;
  Subprocess proc;
  if (proc.Start(argv) != ProcessResult::kSuccess) {
    res.error_code = errno;
    return res;
  }
  WaitResult wr = proc.Wait();
  res.exit_code = wr.StatusCode();
  res.error_code = wr.wait_errno;
  return res;
}

/** @brief Run @p command through "/bin/sh -c". The text is not inspected. */
inline CommandResult RunShellCommand(const std::string& command) {
  const char* argv[] = {kShellPath, "-c", command.c_str(), nullptr};
  return RunCommand(argv);
}

/** @brief RunCommand() for an argument list held in std::strings. */
inline CommandResult RunCommand(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(a.c_str());
  argv.push_back(nullptr);
  return RunCommand(argv.data());
}

}  // namespace dnd

#endif  // defined(DND_PLATFORM_LINUX)

#endif  // DND_PROCESS_HPP_
