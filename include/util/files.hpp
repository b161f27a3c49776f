// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace serverbook {
namespace util {

// Largest file read_file_string will load (store files are a few KB)
constexpr std::uintmax_t MAX_READ_FILE_SIZE = 16 * 1024 * 1024;

// Replace the contents of `path` with `data`.
// Writes a temp file beside the target, fsyncs it, then renames it over the
// target, so readers see either the old or the new contents. Creates the parent
// directory if needed. Returns false (and logs) on any failure.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Read a whole file. Returns std::nullopt (and logs) if the file cannot be
// opened or read, or exceeds MAX_READ_FILE_SIZE. An empty file yields "".
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Create `dir` and missing parents. Returns true if the directory exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

// $HOME/.serverbook (Linux) or ~/Library/Application Support/ServerBook (macOS).
// Empty path if HOME is not set.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace serverbook
