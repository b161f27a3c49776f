// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace serverbook {
namespace util {

namespace {

bool sync_file(int fd) {
#if defined(__APPLE__)
  // fsync() on macOS does not flush the drive cache
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool result = sync_file(fd);
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to create parent directory: {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL: never reuse a stale temp file; O_NOFOLLOW: never write through a symlink
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: Failed to create temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: Failed to write to temp file {}: {} (errno={}, written {}/{})", temp_path.string(),
                std::strerror(errno), errno, total, data.size());
      close(fd);
      remove_quietly(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (!sync_file(fd)) {
    LOG_ERROR("atomic_write_file: Failed to fsync temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    close(fd);
    remove_quietly(temp_path);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: Failed to rename {} to {}: {} (code={})", temp_path.string(), path.string(),
              ec.message(), ec.value());
    remove_quietly(temp_path);
    return false;
  }

  // The rename is done; a failed directory sync only weakens durability
  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("atomic_write_file: Failed to fsync directory {} after writing {}: {}", parent.string(), path.string(),
             std::strerror(errno));
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_ERROR("read_file: Failed to stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > MAX_READ_FILE_SIZE) {
    LOG_ERROR("read_file: File {} is {} bytes, over the {} byte limit", path.string(), size, MAX_READ_FILE_SIZE);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_ERROR("read_file: Failed to open file {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }

  std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    LOG_ERROR("read_file: Failed to read {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }
  return data;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (!home || *home == '\0') {
    LOG_ERROR("get_default_datadir: HOME environment variable not set. "
              "Use --datadir to choose a data directory.");
    return std::filesystem::path();
  }

#if defined(__APPLE__)
  return std::filesystem::path(home) / "Library" / "Application Support" / "ServerBook";
#else
  return std::filesystem::path(home) / ".serverbook";
#endif
}

}  // namespace util
}  // namespace serverbook
