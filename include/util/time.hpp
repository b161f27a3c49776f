// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace serverbook {
namespace util {

// Current Unix time in seconds, or the mock time when one is set.
int64_t GetTime();

// Steady clock that advances with mock time while mock time is active.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (Unix seconds). 0 disables mock time.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// Human readable "YYYY-MM-DD HH:MM:SS UTC".
std::string FormatTime(int64_t unix_time);

// Largest time with a four-digit year (9999-12-31T23:59:59Z)
constexpr int64_t MAX_ISO8601_TIME = 253402300799;

// ISO-8601 UTC timestamp "YYYY-MM-DDTHH:MM:SSZ". Round-trips through
// ParseISO8601 for 0 <= unix_time <= MAX_ISO8601_TIME.
std::string FormatISO8601(int64_t unix_time);

// Parse an ISO-8601 date-time: "YYYY-MM-DDTHH:MM:SS", optional fractional
// seconds (truncated), optional "Z" or "+HH:MM"/"-HH:MM"/"+HHMM" offset.
// A timestamp without an offset is taken as UTC.
std::optional<int64_t> ParseISO8601(const std::string& text);

// Sets mock time for the lifetime of the scope and restores the previous
// value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace serverbook
