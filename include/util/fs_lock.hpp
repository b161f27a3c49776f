// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace serverbook {
namespace util {

namespace fs = std::filesystem;

/**
 * POSIX file lock (Linux/macOS only)
 * Holds an exclusive fcntl() write lock on a file for the lifetime of the object.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  explicit FileLock(const fs::path& file);
  ~FileLock();

  // Try to acquire the lock without blocking. Returns true if acquired.
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  const std::string& GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
};

enum class LockResult {
  Success,     // Lock acquired (or another holder added in this process)
  ErrorWrite,  // Could not create the lock file
  ErrorLock,   // Lock held by another process
};

// Lock a data directory so that only one process writes its store files.
// Creates `lockfile_name` in the directory. Locking a directory this process
// already holds succeeds and adds a holder; the lock is released when every
// holder has called UnlockDirectory, on ReleaseAllDirectoryLocks, or at exit.
LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void ReleaseAllDirectoryLocks();

}  // namespace util
}  // namespace serverbook
