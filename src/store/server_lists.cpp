// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/server_lists.hpp"

#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"

namespace serverbook {
namespace store {

namespace {

std::filesystem::path StorePath(const std::filesystem::path& datadir, const StoreConfig& config) {
  return datadir / std::string(config.file_name);
}

}  // anonymous namespace

ServerLists::ServerLists(const std::filesystem::path& datadir)
    : datadir_(datadir),
      favorites_(FAVORITES_CONFIG, StorePath(datadir, FAVORITES_CONFIG)),
      history_(HISTORY_CONFIG, StorePath(datadir, HISTORY_CONFIG)),
      recent_(RECENT_CONFIG, StorePath(datadir, RECENT_CONFIG)) {}

ServerLists::~ServerLists() {
  if (locked_) {
    util::UnlockDirectory(datadir_, ".lock");
  }
}

bool ServerLists::Open() {
  if (datadir_.empty()) {
    LOG_STORE_ERROR("ServerLists: data directory is not set");
    return false;
  }

  if (!util::ensure_directory(datadir_)) {
    LOG_STORE_ERROR("ServerLists: failed to create data directory {}", datadir_.string());
    return false;
  }

  if (!locked_) {
    switch (util::LockDirectory(datadir_, ".lock")) {
    case util::LockResult::Success:
      locked_ = true;
      break;
    case util::LockResult::ErrorWrite:
      LOG_STORE_ERROR("ServerLists: cannot write to data directory {}", datadir_.string());
      return false;
    case util::LockResult::ErrorLock:
      LOG_STORE_ERROR("ServerLists: data directory {} is in use by another process", datadir_.string());
      return false;
    }
  }

  favorites_.Load();
  history_.Load();
  recent_.Load();

  LOG_STORE_INFO("ServerLists: {} favorites, {} history, {} recent in {}", favorites_.Size(), history_.Size(),
                 recent_.Size(), datadir_.string());
  return true;
}

BoundedRecencyStore& ServerLists::Get(StoreKind kind) {
  switch (kind) {
  case StoreKind::Favorites:
    return favorites_;
  case StoreKind::History:
    return history_;
  case StoreKind::Recent:
    return recent_;
  }
  return recent_;
}

}  // namespace store
}  // namespace serverbook
