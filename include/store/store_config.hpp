// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace serverbook {
namespace store {

enum class OrderPolicy {
  Insertion,  // new entries append at the tail, eviction drops the head (FIFO)
  Recency,    // every touch moves to the head, eviction drops the tail (LRU)
};

// Parameters of one bounded store. The engine is the same for every list;
// only these values differ.
struct StoreConfig {
  std::string_view name;
  std::string_view file_name;
  size_t capacity;
  OrderPolicy policy;
  bool sort_on_load;  // reorder by last_contact (newest first) when loading
};

inline constexpr StoreConfig FAVORITES_CONFIG{"favorites", "server_favorites.json", 100, OrderPolicy::Insertion, false};
inline constexpr StoreConfig HISTORY_CONFIG{"history", "server_history.json", 10, OrderPolicy::Recency, true};
inline constexpr StoreConfig RECENT_CONFIG{"recent", "RecentServers.json", 5, OrderPolicy::Recency, false};

enum class StoreKind { Favorites, History, Recent };

const StoreConfig& GetStoreConfig(StoreKind kind);

// "favorites" | "history" | "recent" (also accepts "fav", "hist")
std::optional<StoreKind> ParseStoreKind(std::string_view name);

std::string_view OrderPolicyName(OrderPolicy policy);

}  // namespace store
}  // namespace serverbook
