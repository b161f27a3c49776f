// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Server endpoint utilities

 Purpose:
 - Validate host and port text typed by the user before it reaches a store
 - Parse "host:port" / "[IPv6]:port" strings (CLI, quick-connect fields)
 - Format endpoints for display

 The stores themselves only require a non-empty host; everything here is for
 the input side.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace serverbook {
namespace util {

/**
 * Validate and normalize an IP address literal
 *
 * Wraps asio::ip::make_address(); IPv4-mapped IPv6 addresses are returned in
 * IPv4 form (::ffff:10.0.0.1 -> 10.0.0.1).
 *
 * @return canonical string, or std::nullopt if `address` is not an IP literal
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// RFC 1123 hostname: dot-separated labels of 1-63 letters, digits and '-',
// not starting or ending with '-', at most 253 characters, optional trailing dot.
bool IsValidHostname(const std::string& host);

// IP literal or hostname
bool IsValidHost(const std::string& host);

/**
 * Parse "host:port" into its components
 *
 * Accepts:
 * - "203.0.113.5:7777"
 * - "play.example.com:7777"
 * - "[2001:db8::1]:7777"
 *
 * Unbracketed IPv6 ("2001:db8::1:7777") is rejected as ambiguous. IP
 * literals are normalized; hostnames are returned as typed.
 *
 * @return true on success, with out_host/out_port set
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

// "host:port", with IPv6 literals bracketed
std::string FormatHostPort(const std::string& host, uint16_t port);

}  // namespace util
}  // namespace serverbook
