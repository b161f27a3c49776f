// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <charconv>

namespace serverbook {
namespace util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char LowerASCII(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // anonymous namespace

std::optional<int> SafeParseInt(std::string_view str, int min, int max) {
  if (str.empty()) {
    return std::nullopt;
  }
  // from_chars rejects '+' and whitespace already; an explicit '-' is allowed
  int value = 0;
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value, 10);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(std::string_view str) {
  auto port = SafeParseInt(str, 1, 65535);
  if (!port) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*port);
}

std::string TrimWhitespace(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && IsSpace(str[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(str[end - 1])) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::string ToLowerASCII(std::string_view str) {
  std::string out(str);
  for (char& c : out) {
    c = LowerASCII(c);
  }
  return out;
}

bool EqualsIgnoreCaseASCII(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (LowerASCII(a[i]) != LowerASCII(b[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace util
}  // namespace serverbook
