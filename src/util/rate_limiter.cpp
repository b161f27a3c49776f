// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace serverbook {
namespace util {

void RateLimiter::TokenBucket::Refill(std::chrono::steady_clock::time_point now, int capacity, int period_seconds) {
  const auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(now - last_refill).count();
  if (whole_seconds <= 0) {
    return;
  }
  const double per_second = static_cast<double>(capacity) / period_seconds;
  tokens = std::min(tokens + per_second * static_cast<double>(whole_seconds), static_cast<double>(capacity));
  last_refill = now;
}

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = GetSteadyTime();

  auto [it, inserted] = buckets_.try_emplace(callsite_key);
  TokenBucket& bucket = it->second;
  if (inserted) {
    // First use of a callsite starts with a full burst
    bucket.tokens = static_cast<double>(tokens_per_period);
    bucket.last_refill = now;
  } else {
    bucket.Refill(now, tokens_per_period, period_seconds);
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace serverbook
