#include <catch2/catch_test_macros.hpp>

#include "server/policy/kill_switch.h"
#include "store/memory_kv_store.h"

#include <memory>

using agentfw::KillSwitch;
using agentfw::MemoryKvStore;

TEST_CASE("KillSwitch is enabled unless the flag reads false", "[killswitch]") {
  auto store = std::make_shared<MemoryKvStore>();
  KillSwitch kill_switch(store);
  REQUIRE(kill_switch.Enabled());

  store->Put("ENABLED", "anything", std::chrono::seconds(0));
  REQUIRE(kill_switch.Enabled());

  store->Put("ENABLED", "false", std::chrono::seconds(0));
  REQUIRE_FALSE(kill_switch.Enabled());
}

TEST_CASE("KillSwitch writes are visible to every reader", "[killswitch]") {
  auto store = std::make_shared<MemoryKvStore>();
  KillSwitch writer(store);
  KillSwitch reader(store);
  writer.SetEnabled(false);
  REQUIRE_FALSE(reader.Enabled());
  REQUIRE(*store->Get("ENABLED") == "false");
  writer.SetEnabled(true);
  REQUIRE(reader.Enabled());
  REQUIRE(*store->Get("ENABLED") == "true");
}
