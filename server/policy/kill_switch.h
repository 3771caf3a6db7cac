#pragma once

#include "store/kv_store.h"

#include <memory>
#include <string>

namespace agentfw {

// Process-wide traffic switch persisted in the shared store. The flag is read
// on every call and never cached, so every handler instance converges on the
// stored value.
class KillSwitch {
 public:
  static constexpr const char* kKey = "ENABLED";
  static constexpr const char* kDisabledSentinel = "false";

  explicit KillSwitch(std::shared_ptr<KeyValueStore> store);

  // Absent, or anything other than "false", means traffic flows.
  bool Enabled() const;
  void SetEnabled(bool enabled);

 private:
  std::shared_ptr<KeyValueStore> store_;
};

}  // namespace agentfw
