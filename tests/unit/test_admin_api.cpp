#include <catch2/catch_test_macros.hpp>

#include "server/http/admin_api.h"
#include "store/memory_kv_store.h"
#include "tests/unit/test_support.h"

#include <nlohmann/json.hpp>

#include <memory>

using agentfw::AdminApi;
using agentfw::KillSwitch;
using agentfw::MemoryKvStore;
using agentfw::ProxyRequest;
using agentfw::testing::ManualClock;
using json = nlohmann::json;

namespace {

const char* const kAdminKey = "admin-key-123456";

struct AdminHarness {
  AdminHarness()
      : store(std::make_shared<MemoryKvStore>(clock.Fn())),
        kill_switch(std::make_shared<KillSwitch>(store)),
        admin(store, kill_switch, kAdminKey, clock.Fn()) {}

  agentfw::ProxyResponse Call(const std::string& method, const std::string& path,
                              const std::string& body = "",
                              const std::string& key = kAdminKey) const {
    ProxyRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    if (!key.empty()) {
      request.headers["x-admin-key"] = key;
    }
    return admin.Handle(request);
  }

  ManualClock clock;
  std::shared_ptr<MemoryKvStore> store;
  std::shared_ptr<KillSwitch> kill_switch;
  AdminApi admin;
};

}  // namespace

TEST_CASE("AdminApi requires the admin key", "[admin]") {
  AdminHarness h;
  REQUIRE(h.Call("POST", "/admin/test", "", "").status == 401);
  REQUIRE(h.Call("POST", "/admin/test", "", "wrong").status == 401);
  REQUIRE(h.Call("POST", "/admin/test").status == 200);

  auto store = std::make_shared<MemoryKvStore>();
  AdminApi locked(store, std::make_shared<KillSwitch>(store), "");
  ProxyRequest request;
  request.method = "POST";
  request.path = "/admin/test";
  request.headers["x-admin-key"] = "";
  REQUIRE(locked.Handle(request).status == 401);
}

TEST_CASE("AdminApi toggles the kill switch", "[admin]") {
  AdminHarness h;
  auto off = h.Call("POST", "/admin/kill", R"({"enabled": false})");
  REQUIRE(off.status == 200);
  REQUIRE(json::parse(off.body) == json({{"status", "ok"}, {"enabled", false}}));
  REQUIRE_FALSE(h.kill_switch->Enabled());

  REQUIRE(h.Call("POST", "/admin/kill", R"({"enabled": true})").status == 200);
  REQUIRE(h.kill_switch->Enabled());

  REQUIRE(h.Call("POST", "/admin/kill", R"({"enabled": "no"})").status == 400);
  REQUIRE(h.Call("POST", "/admin/kill", "not json").status == 400);
  REQUIRE(h.Call("POST", "/admin/kill", "").status == 400);
  REQUIRE(h.kill_switch->Enabled());
}

TEST_CASE("AdminApi aggregates stats for the last 24 hours", "[admin]") {
  AdminHarness h;
  auto ttl = std::chrono::seconds(0);
  h.store->Put("stats:bot-a:2023-11-14T22", "3", ttl);
  h.store->Put("stats:bot-a:2023-11-14T21", "2", ttl);
  h.store->Put("stats:bot-b:2023-11-13T23", "7", ttl);
  // Older than 24 buckets.
  h.store->Put("stats:bot-a:2023-11-13T22", "100", ttl);
  h.store->Put("stats:bot-c:2023-11-14T22", "junk", ttl);

  auto response = h.Call("GET", "/admin/stats");
  REQUIRE(response.status == 200);
  auto body = json::parse(response.body);
  REQUIRE(body["period"] == "last_24h");
  REQUIRE(body["stats"]["bot-a"]["total"] == 5);
  REQUIRE(body["stats"]["bot-a"]["hours"]["2023-11-14T21"] == 2);
  REQUIRE_FALSE(body["stats"]["bot-a"]["hours"].contains("2023-11-13T22"));
  REQUIRE(body["stats"]["bot-b"]["total"] == 7);
  REQUIRE(body["stats"]["bot-c"]["total"] == 0);
}

TEST_CASE("AdminApi lists block records and tolerates bad values", "[admin]") {
  AdminHarness h;
  auto ttl = std::chrono::seconds(0);
  h.store->Put("blocked:2023-11-14T22:13:20.000Z:bot", R"({"reason":"30/min"})", ttl);
  h.store->Put("blocked:2023-11-14T22:13:21.000Z:bot", "{oops", ttl);
  for (int i = 0; i < 60; ++i) {
    h.store->Put("blocked:2023-11-15T00:00:" + std::to_string(10 + i) + ".000Z:x",
                 "{}", ttl);
  }

  auto body = json::parse(h.Call("GET", "/admin/blocks").body);
  REQUIRE(body["count"] == 50);
  REQUIRE(body["blocks"].size() == 50);
  REQUIRE(body["blocks"][0]["reason"] == "30/min");
  REQUIRE(body["blocks"][1]["key"] == "blocked:2023-11-14T22:13:21.000Z:bot");
  REQUIRE(body["blocks"][1]["raw"] == "{oops");
}

TEST_CASE("AdminApi self-test reports state and agents", "[admin]") {
  AdminHarness h;
  h.store->Put("stats:bot-a:2023-11-14T22", "1", std::chrono::seconds(0));
  h.store->Put("stats:bot-a:2023-11-14T21", "1", std::chrono::seconds(0));
  h.store->Put("stats:bot-b:2023-11-14T22", "1", std::chrono::seconds(0));
  h.kill_switch->SetEnabled(false);

  auto body = json::parse(h.Call("POST", "/admin/test").body);
  REQUIRE(body["status"] == "ok");
  REQUIRE(body["enabled"] == false);
  REQUIRE(body["agents_seen"] == json::array({"bot-a", "bot-b"}));
  REQUIRE(body["timestamp"] == "2023-11-14T22:13:20.000Z");
}

TEST_CASE("AdminApi serves metrics and rejects unknown endpoints", "[admin]") {
  AdminHarness h;
  auto metrics = h.Call("GET", "/admin/metrics");
  REQUIRE(metrics.status == 200);
  REQUIRE(metrics.headers["content-type"].find("text/plain") == 0);
  REQUIRE(metrics.body.find("agentfw_requests_total") != std::string::npos);

  REQUIRE(h.Call("GET", "/admin/unknown").status == 404);
  REQUIRE(h.Call("GET", "/admin/kill").status == 404);

  REQUIRE(AdminApi::Handles("/admin/stats"));
  REQUIRE(AdminApi::Handles("/admin"));
  REQUIRE_FALSE(AdminApi::Handles("/administrator"));
  REQUIRE(AdminApi::Health().status == 200);
  REQUIRE(json::parse(AdminApi::Health().body)["status"] == "ok");
}
