// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace nearlink {
namespace util {

enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create/open the lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * DirectoryLock - exclusive fcntl() lock on <directory>/<lockfile_name>
 *
 * Keeps two daemons from sharing one data directory (and thus one persisted
 * identity). The lock is released when the object is destroyed or the
 * process exits.
 */
class DirectoryLock {
public:
  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;
  ~DirectoryLock();

  /**
   * Try to lock a directory
   * @param result Receives the outcome (optional)
   * @return The held lock, or nullptr on failure
   */
  static std::unique_ptr<DirectoryLock>
  Acquire(const std::filesystem::path &directory,
          const std::string &lockfile_name = ".lock",
          LockResult *result = nullptr);

  const std::filesystem::path &path() const { return path_; }

private:
  DirectoryLock(std::filesystem::path path, int fd);

  std::filesystem::path path_;
  int fd_{-1};
};

} // namespace util
} // namespace nearlink
