// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for repeated log lines

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace serverbook {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Limits log messages per callsite. Each callsite gets N tokens that refill
 * over time; a message is emitted only while a token is available.
 *
 * With 200 tokens per 3600s, a store on a read-only disk logs its first 200
 * save failures, then roughly one every 18 seconds.
 */
class RateLimiter {
public:
  // Returns true if a message from callsite_key may be logged now.
  // tokens_per_period is the burst size and the number of messages allowed per
  // period_seconds. Non-positive limits disable rate limiting.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Forget all callsites (tests).
  void Reset();

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};

    void Refill(std::chrono::steady_clock::time_point now, int capacity, int period_seconds);
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace serverbook
