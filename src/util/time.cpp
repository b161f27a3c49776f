// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace serverbook {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Steady clock reference captured when mock time is first used
// Protected by g_steady_mutex
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the steady reference while mock time moves so offsets stay monotonic
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

namespace {

struct CivilTime {
  int year;
  unsigned month;
  unsigned day;
  int64_t hours;
  int64_t minutes;
  int64_t seconds;
};

CivilTime ToCivil(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};
  return CivilTime{static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                   hms.hours().count(), hms.minutes().count(), hms.seconds().count()};
}

// Reads exactly `width` decimal digits starting at pos
bool ReadDigits(const std::string& text, size_t& pos, size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool Expect(const std::string& text, size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

}  // anonymous namespace

std::string FormatTime(int64_t unix_time) {
  const CivilTime t = ToCivil(unix_time);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << t.year << "-" << std::setw(2) << t.month << "-" << std::setw(2) << t.day
      << " " << std::setw(2) << t.hours << ":" << std::setw(2) << t.minutes << ":" << std::setw(2) << t.seconds
      << " UTC";
  return oss.str();
}

std::string FormatISO8601(int64_t unix_time) {
  const CivilTime t = ToCivil(unix_time);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << t.year << "-" << std::setw(2) << t.month << "-" << std::setw(2) << t.day
      << "T" << std::setw(2) << t.hours << ":" << std::setw(2) << t.minutes << ":" << std::setw(2) << t.seconds << "Z";
  return oss.str();
}

std::optional<int64_t> ParseISO8601(const std::string& text) {
  size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) ||
      !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute) ||
      !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, second)) {
    return std::nullopt;
  }

  // Fractional seconds are truncated to whole seconds
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    const size_t digits_start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
    if (pos == digits_start) {
      return std::nullopt;
    }
  }

  int64_t offset_seconds = 0;
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      ++pos;
      int off_hours = 0, off_minutes = 0;
      if (!ReadDigits(text, pos, 2, off_hours)) {
        return std::nullopt;
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!ReadDigits(text, pos, 2, off_minutes) || off_hours > 23 || off_minutes > 59) {
        return std::nullopt;
      }
      offset_seconds = (off_hours * 3600 + off_minutes * 60) * (sign == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  if (hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  const int64_t days = std::chrono::sys_days{ymd}.time_since_epoch().count();
  // Local time = UTC + offset, so UTC = local - offset
  return days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
}

}  // namespace util
}  // namespace serverbook
