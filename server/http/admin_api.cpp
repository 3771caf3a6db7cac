#include "server/http/admin_api.h"

#include "server/common/timestamps.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <set>
#include <utility>

using json = nlohmann::json;

namespace agentfw {

namespace {

ProxyResponse JsonReply(int status, const json& payload) {
  ProxyResponse response;
  response.status = status;
  response.headers["content-type"] = "application/json";
  response.body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
  return response;
}

// "stats:{agent}:{bucket}" -> agent, bucket. The bucket never contains ':'.
bool SplitStatsKey(const std::string& key, std::string* agent,
                   std::string* bucket) {
  static const std::string kPrefix = "stats:";
  if (key.compare(0, kPrefix.size(), kPrefix) != 0) {
    return false;
  }
  auto last = key.rfind(':');
  if (last == std::string::npos || last < kPrefix.size()) {
    return false;
  }
  *agent = key.substr(kPrefix.size(), last - kPrefix.size());
  *bucket = key.substr(last + 1);
  return !agent->empty() && !bucket->empty();
}

long long ParseCount(const std::optional<std::string>& raw) {
  if (!raw) {
    return 0;
  }
  try {
    return std::stoll(*raw);
  } catch (const std::exception&) {
    return 0;
  }
}

}  // namespace

AdminApi::AdminApi(std::shared_ptr<KeyValueStore> store,
                   std::shared_ptr<KillSwitch> kill_switch,
                   const std::string& admin_key)
    : AdminApi(std::move(store), std::move(kill_switch), admin_key,
               [] { return std::chrono::system_clock::now(); }) {}

AdminApi::AdminApi(std::shared_ptr<KeyValueStore> store,
                   std::shared_ptr<KillSwitch> kill_switch,
                   const std::string& admin_key, Clock clock)
    : store_(std::move(store)),
      kill_switch_(std::move(kill_switch)),
      admin_auth_(admin_key),
      clock_(std::move(clock)) {}

bool AdminApi::Handles(const std::string& path) {
  return path == "/admin" || path.compare(0, 7, "/admin/") == 0;
}

ProxyResponse AdminApi::Health() {
  return JsonReply(200, json{{"status", "ok"}});
}

ProxyResponse AdminApi::Handle(const ProxyRequest& request) const {
  if (!admin_auth_.IsAllowed(request.Header("x-admin-key"))) {
    log::Warn("admin", "rejected admin call", "path=" + request.path);
    return JsonReply(401, json{{"error", "Unauthorized. Provide X-Admin-Key header."}});
  }
  const auto& path = request.path;
  const auto& method = request.method;
  if (path == "/admin/kill" && method == "POST") {
    return Kill(request.body);
  }
  if (path == "/admin/stats" && method == "GET") {
    return Stats();
  }
  if (path == "/admin/blocks" && method == "GET") {
    return Blocks();
  }
  if (path == "/admin/test" && method == "POST") {
    return SelfTest();
  }
  if (path == "/admin/metrics" && method == "GET") {
    return Metrics();
  }
  return JsonReply(404, json{{"error", "Unknown admin endpoint"}});
}

ProxyResponse AdminApi::Kill(const std::string& body) const {
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object() ||
      !parsed.contains("enabled") || !parsed["enabled"].is_boolean()) {
    return JsonReply(400, json{{"error", "Body must be {\"enabled\": true/false}"}});
  }
  bool enabled = parsed["enabled"].get<bool>();
  kill_switch_->SetEnabled(enabled);
  log::Warn("admin", enabled ? "proxy enabled" : "kill switch engaged");
  return JsonReply(200, json{{"status", "ok"}, {"enabled", enabled}});
}

ProxyResponse AdminApi::Stats() const {
  auto now = clock_();
  std::set<std::string> window;
  for (int i = 0; i < kStatsWindowHours; ++i) {
    window.insert(HourLabel(now - std::chrono::hours(i)));
  }

  json stats = json::object();
  for (const auto& key : store_->List("stats:")) {
    std::string agent;
    std::string bucket;
    if (!SplitStatsKey(key, &agent, &bucket) || window.count(bucket) == 0) {
      continue;
    }
    auto count = ParseCount(store_->Get(key));
    if (!stats.contains(agent)) {
      stats[agent] = json{{"total", 0}, {"hours", json::object()}};
    }
    stats[agent]["total"] = stats[agent]["total"].get<long long>() + count;
    stats[agent]["hours"][bucket] = count;
  }
  return JsonReply(200, json{{"period", "last_24h"}, {"stats", stats}});
}

ProxyResponse AdminApi::Blocks() const {
  json blocks = json::array();
  for (const auto& key : store_->List("blocked:", kMaxBlocks)) {
    auto raw = store_->Get(key);
    if (!raw) {
      continue;  // Expired between List and Get.
    }
    json parsed = json::parse(*raw, nullptr, false);
    if (parsed.is_discarded()) {
      blocks.push_back(json{{"key", key}, {"raw", *raw}});
    } else {
      blocks.push_back(std::move(parsed));
    }
  }
  return JsonReply(200, json{{"count", blocks.size()}, {"blocks", blocks}});
}

ProxyResponse AdminApi::SelfTest() const {
  std::set<std::string> agents;
  for (const auto& key : store_->List("stats:")) {
    std::string agent;
    std::string bucket;
    if (SplitStatsKey(key, &agent, &bucket)) {
      agents.insert(agent);
    }
  }
  return JsonReply(200, json{{"status", "ok"},
                             {"enabled", kill_switch_->Enabled()},
                             {"agents_seen", agents},
                             {"timestamp", FormatIsoTimestamp(clock_())}});
}

ProxyResponse AdminApi::Metrics() {
  ProxyResponse response;
  response.headers["content-type"] = "text/plain; version=0.0.4";
  response.body = GlobalMetrics().RenderPrometheus();
  return response;
}

}  // namespace agentfw
