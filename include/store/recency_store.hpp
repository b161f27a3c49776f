// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 BoundedRecencyStore - one persisted, capacity-bounded server list

 Purpose
 - Keep an ordered list of ServerEntry values, unique by (host, port) with the
   host compared case-insensitively
 - Bound the list to StoreConfig::capacity, evicting per OrderPolicy
 - Mirror every mutation to a JSON file (see entry_file.hpp)

 Ordering
 - Insertion: new entries append at the tail; updates keep their position;
   overflow evicts from the head (oldest inserted)
 - Recency: every upsert moves the entry to the head; overflow evicts from the
   tail (least recently used)

 Failure model
 - Load never fails from the caller's point of view: a missing file starts
   empty, an unreadable or malformed file is logged and starts empty
 - A failed save is logged and the in-memory list stays authoritative
 - Removing or renaming something that is not there is a no-op

 Thread-safety: every public method takes the store's mutex, so the
 mutate-evict-persist sequence is atomic with respect to other callers.
 The backing file must not be shared with another store instance.
*/

#include "store/entry_file.hpp"
#include "store/server_entry.hpp"
#include "store/store_config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace serverbook {
namespace store {

class BoundedRecencyStore {
public:
  // `path` is the backing file. Nothing is read until the first access or Load().
  BoundedRecencyStore(const StoreConfig& config, std::filesystem::path path);
  ~BoundedRecencyStore() = default;

  // Non-copyable
  BoundedRecencyStore(const BoundedRecencyStore&) = delete;
  BoundedRecencyStore& operator=(const BoundedRecencyStore&) = delete;

  // (Re)load from the backing file, replacing the in-memory list.
  // Returns how the file was found; any status other than Success leaves the
  // store empty.
  LoadStatus Load();

  // Independent copy of the entries in list order
  std::vector<ServerEntry> Snapshot() const;

  // Insert or refresh (host, port). Sets last_contact to now, replaces the
  // display name only when a non-empty name is given, reorders/evicts per
  // policy and saves. Returns false (storing nothing) if host is blank or
  // port is 0.
  bool Upsert(const std::string& host, uint16_t port, const std::optional<std::string>& display_name = std::nullopt);

  // Returns true if an entry was removed
  bool Remove(const std::string& host, uint16_t port);

  // Empty the list and save the empty state
  void Clear();

  // Rename in place without touching position or last_contact.
  // Returns true if the entry exists. An empty name clears the display name.
  bool UpdateDisplayName(const std::string& host, uint16_t port, const std::string& name);

  bool Contains(const std::string& host, uint16_t port) const;
  std::optional<ServerEntry> Find(const std::string& host, uint16_t port) const;
  size_t Size() const;

  size_t Capacity() const { return config_.capacity; }
  OrderPolicy Policy() const { return config_.policy; }
  const StoreConfig& Config() const { return config_; }
  const std::filesystem::path& Path() const { return path_; }

  // Outcome of the most recent save (Success before any save)
  SaveResult LastSaveResult() const;

private:
  using EntryList = std::vector<ServerEntry>;

  // All *Locked helpers require mutex_ to be held
  void EnsureLoadedLocked() const;
  LoadStatus LoadLocked() const;
  EntryList::iterator FindLocked(const std::string& host, uint16_t port) const;
  size_t EvictLocked() const;
  void SaveLocked();

  const StoreConfig config_;
  const std::filesystem::path path_;

  mutable std::mutex mutex_;

  // Loaded lazily from const accessors, hence mutable
  mutable EntryList entries_;
  mutable bool loaded_{false};

  SaveResult last_save_result_{SaveResult::Success};
};

}  // namespace store
}  // namespace serverbook
