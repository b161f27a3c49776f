// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace serverbook {
namespace store {

// One remembered server. Identity is (host, port) with the host compared
// case-insensitively; display_name and last_contact are payload.
struct ServerEntry {
  std::string host;
  uint16_t port{0};
  std::optional<std::string> display_name;
  int64_t last_contact{0};  // Unix seconds, UTC

  ServerEntry() = default;
  ServerEntry(std::string host_, uint16_t port_, std::optional<std::string> name = std::nullopt,
              int64_t contact = 0)
      : host(std::move(host_)), port(port_), display_name(std::move(name)), last_contact(contact) {}

  // display_name when non-empty, otherwise "host:port"
  std::string DisplayText() const;

  // "host:port" with IPv6 literals bracketed
  std::string Address() const;

  bool HasDisplayName() const { return display_name.has_value() && !display_name->empty(); }

  bool Matches(const std::string& other_host, uint16_t other_port) const;

  bool operator==(const ServerEntry& other) const = default;
};

}  // namespace store
}  // namespace serverbook
