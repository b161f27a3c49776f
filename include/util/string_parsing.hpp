// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace serverbook {
namespace util {

// Strict decimal parsing: the whole string must be digits (optional leading '-'
// for the signed variant), no whitespace, no trailing characters, within [min, max].
std::optional<int> SafeParseInt(std::string_view str, int min, int max);

// Port in 1-65535
std::optional<uint16_t> SafeParsePort(std::string_view str);

// Copy with leading/trailing ASCII whitespace removed
std::string TrimWhitespace(std::string_view str);

// ASCII lower-case copy (hostnames compare case-insensitively)
std::string ToLowerASCII(std::string_view str);

bool EqualsIgnoreCaseASCII(std::string_view a, std::string_view b);

}  // namespace util
}  // namespace serverbook
