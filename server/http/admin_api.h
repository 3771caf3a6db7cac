#pragma once

#include "server/auth/proxy_auth.h"
#include "server/policy/kill_switch.h"
#include "server/proxy/proxy_types.h"
#include "store/kv_store.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace agentfw {

// Operator endpoints under /admin/. Every call must carry X-Admin-Key equal
// to the configured admin key; with no admin key configured all calls fail.
class AdminApi {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr std::size_t kMaxBlocks = 50;
  static constexpr int kStatsWindowHours = 24;

  AdminApi(std::shared_ptr<KeyValueStore> store,
           std::shared_ptr<KillSwitch> kill_switch,
           const std::string& admin_key);
  AdminApi(std::shared_ptr<KeyValueStore> store,
           std::shared_ptr<KillSwitch> kill_switch,
           const std::string& admin_key, Clock clock);

  static bool Handles(const std::string& path);

  ProxyResponse Handle(const ProxyRequest& request) const;

  // GET /healthz, unauthenticated.
  static ProxyResponse Health();

 private:
  ProxyResponse Kill(const std::string& body) const;
  ProxyResponse Stats() const;
  ProxyResponse Blocks() const;
  ProxyResponse SelfTest() const;
  static ProxyResponse Metrics();

  std::shared_ptr<KeyValueStore> store_;
  std::shared_ptr<KillSwitch> kill_switch_;
  ProxyAuth admin_auth_;
  Clock clock_;
};

}  // namespace agentfw
