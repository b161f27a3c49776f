// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "store/server_entry.hpp"

#include "util/endpoint.hpp"
#include "util/string_parsing.hpp"

namespace serverbook {
namespace store {

std::string ServerEntry::DisplayText() const {
  if (HasDisplayName()) {
    return *display_name;
  }
  return host + ":" + std::to_string(port);
}

std::string ServerEntry::Address() const {
  return util::FormatHostPort(host, port);
}

bool ServerEntry::Matches(const std::string& other_host, uint16_t other_port) const {
  return port == other_port && util::EqualsIgnoreCaseASCII(host, other_host);
}

}  // namespace store
}  // namespace serverbook
