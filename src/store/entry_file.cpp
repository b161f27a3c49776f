// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/entry_file.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace serverbook {
namespace store {

namespace {

json SerializeEntry(const ServerEntry& entry) {
  json j;
  j["ip"] = entry.host;
  j["port"] = entry.port;
  j["lastConnected"] = util::FormatISO8601(entry.last_contact);
  if (entry.HasDisplayName()) {
    j["serverName"] = *entry.display_name;
  } else {
    j["serverName"] = nullptr;
  }
  return j;
}

// Values FormatISO8601 can write back are kept; anything else reads as 0
int64_t ReadTimestamp(const json& value) {
  int64_t t = 0;
  if (value.is_string()) {
    t = util::ParseISO8601(value.get<std::string>()).value_or(0);
  } else if (value.is_number_integer()) {
    t = value.get<int64_t>();
  }
  if (t < 0 || t > util::MAX_ISO8601_TIME) {
    return 0;
  }
  return t;
}

bool DeserializeEntry(const json& j, ServerEntry& entry) {
  if (!j.is_object()) {
    return false;
  }

  const json* host = nullptr;
  if (auto it = j.find("ip"); it != j.end() && it->is_string()) {
    host = &*it;
  } else if (auto alt = j.find("host"); alt != j.end() && alt->is_string()) {
    host = &*alt;
  }
  if (!host) {
    return false;
  }
  entry.host = host->get<std::string>();
  if (util::TrimWhitespace(entry.host).empty()) {
    return false;
  }

  auto port = j.find("port");
  if (port == j.end() || !port->is_number_integer()) {
    return false;
  }
  const int64_t port_value = port->get<int64_t>();
  if (port_value < 1 || port_value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  entry.port = static_cast<uint16_t>(port_value);

  entry.last_contact = 0;
  if (auto ts = j.find("lastConnected"); ts != j.end()) {
    entry.last_contact = ReadTimestamp(*ts);
  }

  entry.display_name.reset();
  if (auto name = j.find("serverName"); name != j.end() && name->is_string()) {
    std::string value = name->get<std::string>();
    if (!value.empty()) {
      entry.display_name = std::move(value);
    }
  }
  return true;
}

}  // anonymous namespace

LoadResult ParseEntries(const std::string& text) {
  LoadResult result;

  // An empty document or a literal null is an empty list
  if (util::TrimWhitespace(text).empty()) {
    return result;
  }

  json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    result.status = LoadStatus::ErrorParse;
    result.error = "invalid JSON";
    return result;
  }
  if (root.is_null()) {
    return result;
  }
  if (!root.is_array()) {
    result.status = LoadStatus::ErrorParse;
    result.error = std::string("expected a JSON array, found ") + root.type_name();
    return result;
  }

  result.entries.reserve(root.size());
  for (const auto& element : root) {
    ServerEntry entry;
    if (!DeserializeEntry(element, entry)) {
      result.skipped++;
      continue;
    }
    result.entries.push_back(std::move(entry));
  }
  return result;
}

std::string DumpEntries(const std::vector<ServerEntry>& entries) {
  json root = json::array();
  for (const auto& entry : entries) {
    root.push_back(SerializeEntry(entry));
  }
  return root.dump(2);
}

LoadResult ReadEntries(const std::filesystem::path& path) {
  LoadResult result;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      result.status = LoadStatus::ErrorRead;
      result.error = ec.message();
    } else {
      result.status = LoadStatus::NotFound;
    }
    return result;
  }

  auto text = util::read_file_string(path);
  if (!text) {
    result.status = LoadStatus::ErrorRead;
    result.error = "failed to read " + path.string();
    return result;
  }

  result = ParseEntries(*text);
  if (result.skipped > 0) {
    LOG_STORE_WARN_RL("Skipped {} invalid entries in {}", result.skipped, path.string());
  }
  return result;
}

SaveResult WriteEntries(const std::filesystem::path& path, const std::vector<ServerEntry>& entries) {
  std::string data;
  try {
    data = DumpEntries(entries);
  } catch (const json::exception& e) {
    LOG_STORE_ERROR("Failed to encode {} entries for {}: {}", entries.size(), path.string(), e.what());
    return SaveResult::ErrorSerialize;
  }

  if (!util::atomic_write_file(path, data)) {
    return SaveResult::ErrorWrite;
  }

  LOG_STORE_TRACE("Saved {} entries to {}", entries.size(), path.string());
  return SaveResult::Success;
}

const char* LoadStatusName(LoadStatus status) {
  switch (status) {
  case LoadStatus::Success:
    return "success";
  case LoadStatus::NotFound:
    return "not found";
  case LoadStatus::ErrorRead:
    return "read error";
  case LoadStatus::ErrorParse:
    return "parse error";
  }
  return "unknown";
}

const char* SaveResultName(SaveResult result) {
  switch (result) {
  case SaveResult::Success:
    return "success";
  case SaveResult::ErrorSerialize:
    return "serialize error";
  case SaveResult::ErrorWrite:
    return "write error";
  }
  return "unknown";
}

}  // namespace store
}  // namespace serverbook
