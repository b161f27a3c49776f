// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/endpoint.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <cctype>

#include <asio/ip/address.hpp>

namespace serverbook {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }
    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool IsValidHostname(const std::string& host) {
  std::string name = host;
  if (!name.empty() && name.back() == '.') {
    name.pop_back();
  }
  if (name.empty() || name.size() > 253) {
    return false;
  }

  size_t label_start = 0;
  while (label_start <= name.size()) {
    size_t label_end = name.find('.', label_start);
    if (label_end == std::string::npos) {
      label_end = name.size();
    }
    const size_t len = label_end - label_start;
    if (len == 0 || len > 63) {
      return false;
    }
    if (name[label_start] == '-' || name[label_end - 1] == '-') {
      return false;
    }
    for (size_t i = label_start; i < label_end; ++i) {
      const unsigned char c = static_cast<unsigned char>(name[i]);
      if (!std::isalnum(c) && c != '-') {
        return false;
      }
    }
    label_start = label_end + 1;
  }
  return true;
}

bool IsValidHost(const std::string& host) {
  return IsValidIPAddress(host) || IsValidHostname(host);
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;

  if (host_port[0] == '[') {
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':') {
      return false;
    }
    host = host_port.substr(1, bracket_end - 1);
    port_str = host_port.substr(bracket_end + 2);

    // Brackets are only for IPv6 literals
    auto normalized = ValidateAndNormalizeIP(host);
    if (!normalized || host.find(':') == std::string::npos) {
      return false;
    }
    host = *normalized;
  } else {
    size_t colon = host_port.find(':');
    if (colon == std::string::npos || host_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    host = host_port.substr(0, colon);
    port_str = host_port.substr(colon + 1);

    if (auto normalized = ValidateAndNormalizeIP(host)) {
      host = *normalized;
    } else if (!IsValidHostname(host)) {
      return false;
    }
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }

  out_host = host;
  out_port = *port;
  return true;
}

std::string FormatHostPort(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

}  // namespace util
}  // namespace serverbook
