#pragma once

#include "store/kv_store.h"

#include <chrono>
#include <memory>
#include <string>

namespace agentfw {

struct RateDecision {
  bool allowed{true};
  // "{limit}/min" or "{limit}/hr" when denied.
  std::string reason;
};

// Fixed-window limiter over the shared store. Each agent has a minute and an
// hour counter keyed by a truncated-timestamp label, so buckets expire on
// their own and never need cleanup.
//
// Counters are read-then-written without a transaction: concurrent requests
// from one agent can both pass on a stale read and overshoot the ceiling.
class RateLimiter {
 public:
  static constexpr int kDefaultPerMinute = 30;
  static constexpr int kDefaultPerHour = 500;
  static constexpr std::chrono::seconds kMinuteTtl{120};
  static constexpr std::chrono::seconds kHourTtl{7200};

  RateLimiter(std::shared_ptr<KeyValueStore> store, int per_minute,
              int per_hour);

  RateDecision Admit(const std::string& agent_id,
                     std::chrono::system_clock::time_point now);

  // Non-positive limits fall back to the defaults.
  int PerMinute() const { return per_minute_; }
  int PerHour() const { return per_hour_; }

  static std::string MinuteKey(const std::string& agent_id,
                               std::chrono::system_clock::time_point now);
  static std::string HourKey(const std::string& agent_id,
                             std::chrono::system_clock::time_point now);

 private:
  int ReadCounter(const std::string& key) const;

  std::shared_ptr<KeyValueStore> store_;
  const int per_minute_;
  const int per_hour_;
};

}  // namespace agentfw
