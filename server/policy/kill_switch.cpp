#include "server/policy/kill_switch.h"

#include <chrono>
#include <utility>

namespace agentfw {

KillSwitch::KillSwitch(std::shared_ptr<KeyValueStore> store)
    : store_(std::move(store)) {}

bool KillSwitch::Enabled() const {
  auto value = store_->Get(kKey);
  return !(value && *value == kDisabledSentinel);
}

void KillSwitch::SetEnabled(bool enabled) {
  store_->Put(kKey, enabled ? "true" : kDisabledSentinel,
              std::chrono::seconds(0));
}

}  // namespace agentfw
