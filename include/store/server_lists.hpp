// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ServerLists - the favorites, history and recent-servers stores of one data
 directory

 Owned by whatever composes the UI and the connection manager and passed down
 by reference; there is no process-wide instance. Open() creates and locks the
 data directory and loads all three lists. Use one ServerLists per data
 directory per process.
*/

#include "store/recency_store.hpp"
#include "store/store_config.hpp"

#include <filesystem>

namespace serverbook {
namespace store {

class ServerLists {
public:
  explicit ServerLists(const std::filesystem::path& datadir);
  ~ServerLists();

  // Non-copyable
  ServerLists(const ServerLists&) = delete;
  ServerLists& operator=(const ServerLists&) = delete;

  // Create the data directory, lock it against other processes and load the
  // three lists. Returns false if the directory cannot be created or another
  // process holds the lock; the lists must not be used after a failed Open.
  bool Open();

  BoundedRecencyStore& Favorites() { return favorites_; }
  BoundedRecencyStore& History() { return history_; }
  BoundedRecencyStore& Recent() { return recent_; }

  const BoundedRecencyStore& Favorites() const { return favorites_; }
  const BoundedRecencyStore& History() const { return history_; }
  const BoundedRecencyStore& Recent() const { return recent_; }

  BoundedRecencyStore& Get(StoreKind kind);

  const std::filesystem::path& datadir() const { return datadir_; }

private:
  std::filesystem::path datadir_;
  bool locked_{false};

  BoundedRecencyStore favorites_;
  BoundedRecencyStore history_;
  BoundedRecencyStore recent_;
};

}  // namespace store
}  // namespace serverbook
