#include "server/auth/rate_limiter.h"

#include "server/common/timestamps.h"

#include <stdexcept>
#include <utility>

namespace agentfw {

namespace {
int OrDefault(int value, int fallback) { return value > 0 ? value : fallback; }
}  // namespace

RateLimiter::RateLimiter(std::shared_ptr<KeyValueStore> store, int per_minute,
                         int per_hour)
    : store_(std::move(store)),
      per_minute_(OrDefault(per_minute, kDefaultPerMinute)),
      per_hour_(OrDefault(per_hour, kDefaultPerHour)) {}

std::string RateLimiter::MinuteKey(const std::string& agent_id,
                                   std::chrono::system_clock::time_point now) {
  return "rate:" + agent_id + ":min:" + MinuteLabel(now);
}

std::string RateLimiter::HourKey(const std::string& agent_id,
                                 std::chrono::system_clock::time_point now) {
  return "rate:" + agent_id + ":hr:" + HourLabel(now);
}

int RateLimiter::ReadCounter(const std::string& key) const {
  auto value = store_->Get(key);
  if (!value) {
    return 0;
  }
  try {
    return std::stoi(*value);
  } catch (const std::logic_error&) {
    return 0;
  }
}

RateDecision RateLimiter::Admit(const std::string& agent_id,
                                std::chrono::system_clock::time_point now) {
  auto min_key = MinuteKey(agent_id, now);
  auto hr_key = HourKey(agent_id, now);
  int min_count = ReadCounter(min_key);
  int hr_count = ReadCounter(hr_key);

  RateDecision decision;
  if (min_count >= per_minute_) {
    decision.allowed = false;
    decision.reason = std::to_string(per_minute_) + "/min";
    return decision;
  }
  if (hr_count >= per_hour_) {
    decision.allowed = false;
    decision.reason = std::to_string(per_hour_) + "/hr";
    return decision;
  }
  store_->Put(min_key, std::to_string(min_count + 1), kMinuteTtl);
  store_->Put(hr_key, std::to_string(hr_count + 1), kHourTtl);
  return decision;
}

}  // namespace agentfw
