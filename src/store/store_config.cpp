// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/store_config.hpp"

#include "util/string_parsing.hpp"

namespace serverbook {
namespace store {

const StoreConfig& GetStoreConfig(StoreKind kind) {
  switch (kind) {
  case StoreKind::Favorites:
    return FAVORITES_CONFIG;
  case StoreKind::History:
    return HISTORY_CONFIG;
  case StoreKind::Recent:
    return RECENT_CONFIG;
  }
  return RECENT_CONFIG;
}

std::optional<StoreKind> ParseStoreKind(std::string_view name) {
  const std::string lower = util::ToLowerASCII(name);
  if (lower == "favorites" || lower == "fav") {
    return StoreKind::Favorites;
  }
  if (lower == "history" || lower == "hist") {
    return StoreKind::History;
  }
  if (lower == "recent") {
    return StoreKind::Recent;
  }
  return std::nullopt;
}

std::string_view OrderPolicyName(OrderPolicy policy) {
  return policy == OrderPolicy::Insertion ? "insertion" : "recency";
}

}  // namespace store
}  // namespace serverbook
