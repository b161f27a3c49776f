// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unix/POSIX implementation (Linux/macOS only)

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace serverbook {
namespace util {

namespace {

std::mutex g_dir_locks_mutex;

// One fcntl lock per lock file, shared by every in-process holder
struct HeldLock {
  std::unique_ptr<FileLock> lock;
  int holders{0};
};

// Lock file path -> held lock
std::map<std::string, HeldLock> g_dir_locks;

std::string LockKey(const fs::path& directory, const std::string& lockfile_name) {
  return (directory / lockfile_name).lexically_normal().string();
}

}  // anonymous namespace

FileLock::FileLock(const fs::path& file) {
  // O_CLOEXEC keeps the lock from leaking into child processes
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    // Closing the descriptor releases the fcntl lock
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;  // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  const std::string key = LockKey(directory, lockfile_name);
  if (auto it = g_dir_locks.find(key); it != g_dir_locks.end()) {
    it->second.holders++;
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(directory / lockfile_name);
  if (!file_lock->IsOpen()) {
    LOG_STORE_ERROR("Failed to open lock file {}: {}", key, file_lock->GetReason());
    return LockResult::ErrorWrite;
  }
  if (!file_lock->TryLock()) {
    LOG_STORE_ERROR("Failed to lock data directory {}: {}", directory.string(), file_lock->GetReason());
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(key, HeldLock{std::move(file_lock), 1});
  LOG_STORE_TRACE("Acquired data directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  auto it = g_dir_locks.find(LockKey(directory, lockfile_name));
  if (it == g_dir_locks.end()) {
    return;
  }
  if (--it->second.holders > 0) {
    LOG_STORE_TRACE("Data directory lock {} still has {} holder(s)", directory.string(), it->second.holders);
    return;
  }
  g_dir_locks.erase(it);
  LOG_STORE_TRACE("Released data directory lock: {}", directory.string());
}

void ReleaseAllDirectoryLocks() {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  LOG_STORE_TRACE("Releasing all data directory locks ({} locks)", g_dir_locks.size());
  g_dir_locks.clear();
}

}  // namespace util
}  // namespace serverbook
