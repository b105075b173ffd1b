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
 * @file spool.hpp
 * @brief Spool directory layout and state transitions.
 *
 * Layout under a configurable root:
 *   <root>/queue/       pending entries (the only place entries are created)
 *   <root>/sent/        executed locally with success
 *   <root>/failed/      terminal failure, diagnostic text appended
 *   <root>/dispatched/  relayed to a peer
 *
 * Every transition is a single rename(2) that never replaces an existing
 * file, so an entry is always wholly in one directory. Entries are never
 * deleted.
 */

#ifndef DND_SPOOL_HPP_
#define DND_SPOOL_HPP_

#include "dnd/log.hpp"
#include "dnd/platform.hpp"
#include "dnd/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

namespace dnd {

// ============================================================================
// SpoolState / SpoolError
// ============================================================================

enum class SpoolState : uint8_t {
  kQueue = 0,
  kSent,
  kFailed,
  kDispatched
};

inline const char* StateDirName(SpoolState state) noexcept {
  switch (state) {
    case SpoolState::kQueue: return "queue";
    case SpoolState::kSent: return "sent";
    case SpoolState::kFailed: return "failed";
    case SpoolState::kDispatched: return "dispatched";
  }
  return "queue";
}

/// @brief Inverse of StateDirName(); empty for unknown names.
inline optional<SpoolState> StateFromName(const char* name) noexcept {
  static const SpoolState kAll[] = {SpoolState::kQueue, SpoolState::kSent,
                                    SpoolState::kFailed,
                                    SpoolState::kDispatched};
  if (name == nullptr) return {};
  for (SpoolState s : kAll) {
    if (std::strcmp(name, StateDirName(s)) == 0) return optional<SpoolState>(s);
  }
  return {};
}

/// @brief gethostname(2), or "localhost" if it fails.
inline std::string LocalHostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "localhost";
  }
  return std::string(buf);
}

enum class SpoolError : uint8_t {
  kStorageUnavailable = 0,
  kCreateFailed,
  kWriteFailed,
  kMoveFailed,
  kAppendFailed,
  kInvalidState,
  kScanFailed,
  kNameTaken
};

inline const char* ToString(SpoolError e) noexcept {
  switch (e) {
    case SpoolError::kStorageUnavailable: return "storage unavailable";
    case SpoolError::kCreateFailed: return "create failed";
    case SpoolError::kWriteFailed: return "write failed";
    case SpoolError::kMoveFailed: return "move failed";
    case SpoolError::kAppendFailed: return "append failed";
    case SpoolError::kInvalidState: return "invalid state for operation";
    case SpoolError::kScanFailed: return "queue scan failed";
    case SpoolError::kNameTaken: return "name already taken";
  }
  return "unknown";
}

static constexpr const char* kDefaultSpoolDir = "/var/spool/dnd";
static constexpr const char* kQueueFilePrefix = "dnd_notify_";
static constexpr mode_t kSpoolDirMode = 0775;
static constexpr mode_t kSpoolFileMode = 0664;

namespace detail {

// ============================================================================
// DirGuard - RAII wrapper for DIR*
// ============================================================================

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

inline std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

inline std::string BaseName(const std::string& path) {
  const size_t slash = path.rfind('/');
  return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

inline std::string DirName(const std::string& path) {
  const size_t slash = path.rfind('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

/// @brief @p path joined to the current directory unless already absolute.
inline std::string AbsolutePath(const std::string& path) {
  if (path.empty() || path[0] == '/') return path;
  char cwd[PATH_MAX];
  if (::getcwd(cwd, sizeof(cwd)) == nullptr) return path;
  std::string rel = path;
  while (rel.size() >= 2 && rel[0] == '.' && rel[1] == '/') rel.erase(0, 2);
  if (rel == ".") return cwd;
  return JoinPath(cwd, rel);
}

inline bool IsDirectory(const std::string& path) noexcept {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/// @brief mkdir -p with @p mode for every created component.
inline bool MakeDirs(const std::string& path, mode_t mode) noexcept {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;
  const std::string parent = DirName(path);
  if (parent != path && !IsDirectory(parent) && !MakeDirs(parent, mode)) {
    return false;
  }
  if (::mkdir(path.c_str(), mode) != 0 && errno != EEXIST) return false;
  return IsDirectory(path);
}

/// @brief Local time as "YYYY-MM-DD HH:MM:SS".
inline std::string FormatLocalTime(time_t t) {
  struct tm tm_buf;
  ::localtime_r(&t, &tm_buf);
  char buf[32];
  (void)std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return buf;
}

/// @brief write(2) the whole buffer, retrying on EINTR and short writes.
inline bool WriteAll(int fd, const char* data, size_t size) noexcept {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

/// @brief rename(2) that fails with EEXIST instead of replacing @p dst.
inline int RenameNoReplace(const char* src, const char* dst) noexcept {
  int rc = ::renameat2(AT_FDCWD, src, AT_FDCWD, dst, RENAME_NOREPLACE);
  if (rc != 0 && (errno == EINVAL || errno == ENOSYS)) {
    // Filesystem without RENAME_NOREPLACE support.
    if (::access(dst, F_OK) == 0) {
      errno = EEXIST;
      return -1;
    }
    rc = ::rename(src, dst);
  }
  return rc;
}

/// @brief Write @p content to a new hidden file in @p dir; returns its path.
inline expected<std::string, SpoolError> WriteHiddenFile(
    const std::string& dir, const std::string& content) {
  std::string tmpl =
      JoinPath(dir, std::string(".") + kQueueFilePrefix + "XXXXXXXX");
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');
  // mkostemp() only replaces the final six X's; fill the other two here.
  static const char kAlnum[] =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  static std::atomic<uint32_t> seq{0};
  uint32_t r = (static_cast<uint32_t>(::getpid()) * 2654435761U) ^
               (seq.fetch_add(1U) * 40503U) ^ static_cast<uint32_t>(::time(nullptr));
  const size_t first_x = tmpl.size() - 8U;
  name[first_x] = kAlnum[r % 62U];
  name[first_x + 1U] = kAlnum[(r / 62U) % 62U];

  int fd = ::mkostemp(name.data(), O_CLOEXEC);
  if (fd < 0) {
    return expected<std::string, SpoolError>::error(SpoolError::kCreateFailed);
  }
  const std::string path(name.data());
  const bool ok = ::fchmod(fd, kSpoolFileMode) == 0 &&
                  WriteAll(fd, content.data(), content.size()) &&
                  ::fsync(fd) == 0;
  if (::close(fd) != 0 || !ok) {
    (void)::unlink(path.c_str());
    return expected<std::string, SpoolError>::error(SpoolError::kWriteFailed);
  }
  return expected<std::string, SpoolError>::success(path);
}

/**
 * @brief Create a uniquely named file in @p dir holding @p content.
 *
 * The content is written to a hidden name first and renamed into place,
 * so readers of @p dir only ever see complete files and watchers get a
 * single moved-in event.
 */
inline expected<std::string, SpoolError> CreateUniqueFile(
    const std::string& dir, const std::string& content) {
  static constexpr int kMaxAttempts = 8;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    auto hidden = WriteHiddenFile(dir, content);
    if (!hidden) return hidden;
    const std::string& src = hidden.value();
    const std::string dst = JoinPath(dir, BaseName(src).substr(1));
    if (RenameNoReplace(src.c_str(), dst.c_str()) == 0) {
      return expected<std::string, SpoolError>::success(dst);
    }
    const int err = errno;
    (void)::unlink(src.c_str());
    if (err != EEXIST) {
      errno = err;
      return expected<std::string, SpoolError>::error(SpoolError::kCreateFailed);
    }
  }
  errno = EEXIST;
  return expected<std::string, SpoolError>::error(SpoolError::kCreateFailed);
}

}  // namespace detail

// ============================================================================
// SpoolStore
// ============================================================================

/**
 * @brief Owns the spool tree under one root directory.
 *
 * @p hostname is stamped into appended outcome notes.
 */
class SpoolStore {
 public:
  SpoolStore(std::string root, std::string hostname)
      : root_(std::move(root)), hostname_(std::move(hostname)) {}

  const std::string& Root() const noexcept { return root_; }

  std::string StateDir(SpoolState state) const {
    return detail::JoinPath(root_, StateDirName(state));
  }

  std::string QueueDir() const { return StateDir(SpoolState::kQueue); }

  /**
   * @brief Create root and the four state directories if missing.
   * @return kStorageUnavailable if any directory cannot be created.
   */
  expected<void, SpoolError> EnsureLayout() const {
    static const SpoolState kStates[] = {SpoolState::kQueue, SpoolState::kSent,
                                         SpoolState::kFailed,
                                         SpoolState::kDispatched};
    if (!detail::MakeDirs(root_, kSpoolDirMode)) {
      DND_LOG_ERROR("Spool", "cannot create spool root %s: %s", root_.c_str(),
                    std::strerror(errno));
      return expected<void, SpoolError>::error(SpoolError::kStorageUnavailable);
    }
    for (SpoolState s : kStates) {
      const std::string dir = StateDir(s);
      if (!detail::MakeDirs(dir, kSpoolDirMode)) {
        DND_LOG_ERROR("Spool", "cannot create %s: %s", dir.c_str(),
                      std::strerror(errno));
        return expected<void, SpoolError>::error(
            SpoolError::kStorageUnavailable);
      }
    }
    return expected<void, SpoolError>::success();
  }

  /** @brief Write @p content as a new entry in queue/. Returns its path. */
  expected<std::string, SpoolError> CreateQueued(
      const std::string& content) const {
    return CreateQueuedIn(QueueDir(), content);
  }

  /** @brief Same as CreateQueued() but into an arbitrary directory. */
  static expected<std::string, SpoolError> CreateQueuedIn(
      const std::string& dir, const std::string& content) {
    auto r = detail::CreateUniqueFile(dir, content);
    if (!r) {
      DND_LOG_ERROR("Spool", "cannot create entry in %s: %s", dir.c_str(),
                    std::strerror(errno));
    }
    return r;
  }

  /**
   * @brief rename(2) @p path into the directory of @p state.
   *
   * An existing file of the same name is never replaced.
   * @return The new path, kInvalidState for kQueue, kNameTaken if the
   *         name is in use there, kMoveFailed otherwise.
   */
  expected<std::string, SpoolError> MoveTo(const std::string& path,
                                           SpoolState state) const {
    if (state == SpoolState::kQueue) {
      return expected<std::string, SpoolError>::error(SpoolError::kInvalidState);
    }
    return MoveAs(path, StateDir(state), detail::BaseName(path));
  }

  /**
   * @brief MoveTo(), but a taken name gets a ".N" suffix instead of
   *        failing. The returned path carries the name actually used.
   */
  expected<std::string, SpoolError> MoveToUnique(const std::string& path,
                                                 SpoolState state) const {
    static constexpr int kMaxSuffix = 100;
    auto r = MoveTo(path, state);
    const std::string base = detail::BaseName(path);
    for (int n = 1; !r && r.get_error() == SpoolError::kNameTaken && n < kMaxSuffix;
         ++n) {
      r = MoveAs(path, StateDir(state), base + "." + std::to_string(n));
    }
    return r;
  }

  /**
   * @brief Append "\n\n<time> (<host>): <text>\n" to a settled entry.
   *
   * Entries still in queue/ are never modified.
   */
  expected<void, SpoolError> AppendOutcome(const std::string& path,
                                           const std::string& text) const {
    if (detail::DirName(path) == QueueDir()) {
      return expected<void, SpoolError>::error(SpoolError::kInvalidState);
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
      DND_LOG_ERROR("Spool", "cannot open %s for append: %s", path.c_str(),
                    std::strerror(errno));
      return expected<void, SpoolError>::error(SpoolError::kAppendFailed);
    }
    const std::string block = "\n\n" + detail::FormatLocalTime(::time(nullptr)) +
                              " (" + hostname_ + "): " + text + "\n";
    const bool ok = detail::WriteAll(fd, block.data(), block.size());
    if (::close(fd) != 0 || !ok) {
      DND_LOG_ERROR("Spool", "append to %s failed", path.c_str());
      return expected<void, SpoolError>::error(SpoolError::kAppendFailed);
    }
    return expected<void, SpoolError>::success();
  }

  /**
   * @brief List regular, non-hidden files in queue/, oldest mtime first.
   *
   * Equal timestamps are ordered by name so the result is deterministic.
   */
  expected<std::vector<std::string>, SpoolError> ScanQueue() const {
    using Result = expected<std::vector<std::string>, SpoolError>;
    const std::string qdir = QueueDir();
    detail::DirGuard dir(::opendir(qdir.c_str()));
    if (!dir.get()) {
      DND_LOG_ERROR("Spool", "cannot open %s: %s", qdir.c_str(),
                    std::strerror(errno));
      return Result::error(SpoolError::kScanFailed);
    }

    struct Item {
      struct timespec mtime;
      std::string path;
    };
    std::vector<Item> items;
    struct dirent* entry;
    while ((entry = ::readdir(dir.get())) != nullptr) {
      if (entry->d_name[0] == '.') continue;
      std::string path = detail::JoinPath(qdir, entry->d_name);
      struct stat st;
      if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
      items.push_back(Item{st.st_mtim, std::move(path)});
    }

    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
      if (a.mtime.tv_sec != b.mtime.tv_sec) return a.mtime.tv_sec < b.mtime.tv_sec;
      if (a.mtime.tv_nsec != b.mtime.tv_nsec) {
        return a.mtime.tv_nsec < b.mtime.tv_nsec;
      }
      return a.path < b.path;
    });

    std::vector<std::string> out;
    out.reserve(items.size());
    for (auto& it : items) out.push_back(std::move(it.path));
    return Result::success(std::move(out));
  }

 private:
  static expected<std::string, SpoolError> MoveAs(const std::string& path,
                                                  const std::string& dir,
                                                  const std::string& name) {
    const std::string dst = detail::JoinPath(dir, name);
    if (detail::RenameNoReplace(path.c_str(), dst.c_str()) != 0) {
      if (errno == EEXIST) {
        DND_LOG_WARN("Spool", "%s already exists; not replacing it", dst.c_str());
        return expected<std::string, SpoolError>::error(SpoolError::kNameTaken);
      }
      DND_LOG_ERROR("Spool", "rename %s -> %s failed: %s", path.c_str(),
                    dst.c_str(), std::strerror(errno));
      return expected<std::string, SpoolError>::error(SpoolError::kMoveFailed);
    }
    return expected<std::string, SpoolError>::success(dst);
  }

  std::string root_;
  std::string hostname_;
};

}  // namespace dnd

#endif  // DND_SPOOL_HPP_
