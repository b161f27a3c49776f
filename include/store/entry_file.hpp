// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Entry file - JSON persistence for one server list

 File format: a JSON array, one object per entry, in list order:

   [
     {
       "ip": "203.0.113.5",
       "port": 7777,
       "lastConnected": "2025-03-01T18:04:11Z",
       "serverName": "Friday Night"
     }
   ]

 Reading is lenient: "host" is accepted in place of "ip", timestamps may carry
 fractional seconds and a UTC offset, a missing or unparseable timestamp reads
 as 0, and elements that are not objects or lack a usable host/port are
 skipped. Anything that is not a JSON array is a parse error.

 Neither function throws; outcomes are reported as status values and the
 caller decides how to fall back.
*/

#include "store/server_entry.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace serverbook {
namespace store {

enum class LoadStatus {
  Success,     // file read and parsed (entries may be empty)
  NotFound,    // no file at the path
  ErrorRead,   // file exists but could not be read
  ErrorParse,  // content is not a JSON array
};

struct LoadResult {
  LoadStatus status{LoadStatus::Success};
  std::vector<ServerEntry> entries;  // empty unless status == Success
  size_t skipped{0};                 // elements dropped as invalid
  std::string error;                 // parser / I/O message for logs

  bool ok() const { return status == LoadStatus::Success; }
};

enum class SaveResult {
  Success,
  ErrorSerialize,  // entries could not be encoded (e.g. invalid UTF-8)
  ErrorWrite,      // file could not be written
};

// Decode file content
LoadResult ParseEntries(const std::string& text);

// Encode entries; throws nlohmann::json::exception on unencodable strings
std::string DumpEntries(const std::vector<ServerEntry>& entries);

LoadResult ReadEntries(const std::filesystem::path& path);

// Replaces the whole file
SaveResult WriteEntries(const std::filesystem::path& path, const std::vector<ServerEntry>& entries);

const char* LoadStatusName(LoadStatus status);
const char* SaveResultName(SaveResult result);

}  // namespace store
}  // namespace serverbook
