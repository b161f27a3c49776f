// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/recency_store.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <algorithm>

namespace serverbook {
namespace store {

BoundedRecencyStore::BoundedRecencyStore(const StoreConfig& config, std::filesystem::path path)
    : config_(config), path_(std::move(path)) {}

LoadStatus BoundedRecencyStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  return LoadLocked();
}

void BoundedRecencyStore::EnsureLoadedLocked() const {
  if (!loaded_) {
    LoadLocked();
  }
}

LoadStatus BoundedRecencyStore::LoadLocked() const {
  loaded_ = true;
  entries_.clear();

  LoadResult result = ReadEntries(path_);
  switch (result.status) {
  case LoadStatus::NotFound:
    LOG_STORE_INFO("No {} file at {}, starting with an empty list", config_.name, path_.string());
    return result.status;
  case LoadStatus::ErrorRead:
  case LoadStatus::ErrorParse:
    LOG_STORE_ERROR("Failed to load {} from {} ({}: {}), starting with an empty list", config_.name,
                    path_.string(), LoadStatusName(result.status), result.error);
    return result.status;
  case LoadStatus::Success:
    break;
  }

  // Duplicate keys keep their first occurrence
  entries_.reserve(result.entries.size());
  size_t duplicates = 0;
  for (auto& entry : result.entries) {
    if (FindLocked(entry.host, entry.port) != entries_.end()) {
      duplicates++;
      continue;
    }
    entries_.push_back(std::move(entry));
  }
  if (duplicates > 0) {
    LOG_STORE_WARN("Dropped {} duplicate {} entries from {}", duplicates, config_.name, path_.string());
  }

  if (config_.sort_on_load) {
    // Stable: entries with equal timestamps keep their file order
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const ServerEntry& a, const ServerEntry& b) { return a.last_contact > b.last_contact; });
  }

  const size_t evicted = EvictLocked();
  if (evicted > 0) {
    LOG_STORE_WARN("{} file held more than {} entries, dropped {}", config_.name, config_.capacity, evicted);
  }

  LOG_STORE_INFO("Loaded {} {} entries from {}", entries_.size(), config_.name, path_.string());
  return LoadStatus::Success;
}

BoundedRecencyStore::EntryList::iterator BoundedRecencyStore::FindLocked(const std::string& host,
                                                                          uint16_t port) const {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&](const ServerEntry& entry) { return entry.Matches(host, port); });
}

size_t BoundedRecencyStore::EvictLocked() const {
  if (entries_.size() <= config_.capacity) {
    return 0;
  }

  const size_t excess = entries_.size() - config_.capacity;
  if (config_.policy == OrderPolicy::Insertion) {
    for (size_t i = 0; i < excess; ++i) {
      LOG_STORE_DEBUG("Evicting oldest {} entry {}", config_.name, entries_[i].Address());
    }
    entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
  } else {
    for (size_t i = config_.capacity; i < entries_.size(); ++i) {
      LOG_STORE_DEBUG("Evicting least recent {} entry {}", config_.name, entries_[i].Address());
    }
    entries_.resize(config_.capacity);
  }
  return excess;
}

void BoundedRecencyStore::SaveLocked() {
  last_save_result_ = WriteEntries(path_, entries_);
  if (last_save_result_ != SaveResult::Success) {
    // In-memory state stays authoritative for the rest of the session
    LOG_STORE_ERROR_RL("Failed to save {} to {} ({}); keeping {} entries in memory", config_.name, path_.string(),
                       SaveResultName(last_save_result_), entries_.size());
  }
}

std::vector<ServerEntry> BoundedRecencyStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  return entries_;
}

bool BoundedRecencyStore::Upsert(const std::string& host, uint16_t port,
                                 const std::optional<std::string>& display_name) {
  if (util::TrimWhitespace(host).empty() || port == 0) {
    LOG_STORE_DEBUG("Ignoring {} upsert of invalid endpoint '{}':{}", config_.name, host, port);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();

  const int64_t now = util::GetTime();
  const bool has_name = display_name.has_value() && !display_name->empty();

  auto it = FindLocked(host, port);
  if (it != entries_.end()) {
    it->last_contact = now;
    if (has_name) {
      it->display_name = *display_name;
    }
    LOG_STORE_DEBUG("Updated {} entry {}", config_.name, it->Address());
    if (config_.policy == OrderPolicy::Recency && it != entries_.begin()) {
      // Move to head, keeping the relative order of the others
      std::rotate(entries_.begin(), it, it + 1);
    }
  } else {
    ServerEntry entry(host, port, has_name ? display_name : std::nullopt, now);
    if (config_.policy == OrderPolicy::Recency) {
      entries_.insert(entries_.begin(), std::move(entry));
    } else {
      entries_.push_back(std::move(entry));
    }
    LOG_STORE_DEBUG("Added {} entry {}:{}", config_.name, host, port);
    EvictLocked();
  }

  SaveLocked();
  return true;
}

bool BoundedRecencyStore::Remove(const std::string& host, uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();

  auto it = FindLocked(host, port);
  if (it == entries_.end()) {
    LOG_STORE_TRACE("{}:{} not in {}, nothing to remove", host, port, config_.name);
    return false;
  }

  entries_.erase(it);
  LOG_STORE_DEBUG("Removed {}:{} from {}", host, port, config_.name);
  SaveLocked();
  return true;
}

void BoundedRecencyStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  // Contents are discarded either way; skip reading the old file
  loaded_ = true;
  entries_.clear();
  LOG_STORE_INFO("Cleared {}", config_.name);
  SaveLocked();
}

bool BoundedRecencyStore::UpdateDisplayName(const std::string& host, uint16_t port, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();

  auto it = FindLocked(host, port);
  if (it == entries_.end()) {
    LOG_STORE_TRACE("{}:{} not in {}, nothing to rename", host, port, config_.name);
    return false;
  }

  if (name.empty()) {
    it->display_name.reset();
  } else {
    it->display_name = name;
  }
  LOG_STORE_DEBUG("Renamed {} entry {} to '{}'", config_.name, it->Address(), name);
  SaveLocked();
  return true;
}

bool BoundedRecencyStore::Contains(const std::string& host, uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  return FindLocked(host, port) != entries_.end();
}

std::optional<ServerEntry> BoundedRecencyStore::Find(const std::string& host, uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  auto it = FindLocked(host, port);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return *it;
}

size_t BoundedRecencyStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  return entries_.size();
}

SaveResult BoundedRecencyStore::LastSaveResult() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_save_result_;
}

}  // namespace store
}  // namespace serverbook
