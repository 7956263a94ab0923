// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace nearlink {
namespace util {

DirectoryLock::DirectoryLock(std::filesystem::path path, int fd)
    : path_(std::move(path)), fd_(fd) {}

DirectoryLock::~DirectoryLock() {
  if (fd_ != -1) {
    // Closing the fd releases the fcntl lock
    close(fd_);
  }
}

std::unique_ptr<DirectoryLock>
DirectoryLock::Acquire(const std::filesystem::path &directory,
                       const std::string &lockfile_name, LockResult *result) {
  auto set_result = [result](LockResult r) {
    if (result) {
      *result = r;
    }
  };

  std::filesystem::path lockfile = directory / lockfile_name;

  // O_CLOEXEC: child processes must not inherit the lock
  int fd = open(lockfile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to open lock file {}: {}", lockfile.string(), std::strerror(errno));
    set_result(LockResult::ErrorWrite);
    return nullptr;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // Entire file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(), std::strerror(errno));
    close(fd);
    set_result(LockResult::ErrorLock);
    return nullptr;
  }

  LOG_TRACE("Acquired directory lock: {}", directory.string());
  set_result(LockResult::Success);
  return std::unique_ptr<DirectoryLock>(new DirectoryLock(lockfile, fd));
}

} // namespace util
} // namespace nearlink
