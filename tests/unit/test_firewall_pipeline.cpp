#include <catch2/catch_test_macros.hpp>

#include "server/http/admin_api.h"
#include "server/proxy/firewall_pipeline.h"
#include "store/memory_kv_store.h"
#include "tests/unit/test_support.h"

#include <nlohmann/json.hpp>

#include <memory>

using namespace agentfw;
using agentfw::testing::ManualClock;
using agentfw::testing::RecordingTransport;
using json = nlohmann::json;

namespace {

const char* const kProxyKey = "proxy-key-123456";
const char* const kAdminKey = "admin-key-123456";
const char* const kOpenAiKey = "sk-real-openai-credential-000";
const char* const kAnthropicKey = "anthropic-real-cred-1";
const char* const kHoneypot = "honeypot-decoy-value";
const char* const kScanPatterns = R"(["sk-[a-zA-Z0-9]{20,}", "AKIA[0-9A-Z]{16}"])";

struct Harness {
  explicit Harness(int per_minute = 30)
      : store(std::make_shared<MemoryKvStore>(clock.Fn())),
        transport(std::make_shared<RecordingTransport>()),
        dispatcher(std::make_shared<BackgroundDispatcher>(1, 256)) {
    dispatcher->Start();
    PipelineComponents c;
    c.routes = ProviderRoutes(ProviderRoutes::Defaults());
    c.kill_switch = kill_switch = std::make_shared<KillSwitch>(store);
    c.auth = std::make_shared<ProxyAuth>(kProxyKey);
    c.rate_limiter = std::make_shared<RateLimiter>(store, per_minute, 500);
    c.request_scanner = std::make_shared<RequestScanner>(kScanPatterns);
    c.response_scanner = std::make_shared<ResponseScanner>();
    c.vault = std::make_shared<ConfigCredentialVault>(
        std::map<std::string, std::string>{{"PROXY_KEY", kProxyKey},
                                           {"ADMIN_KEY", kAdminKey},
                                           {"OPENAI_API_KEY", kOpenAiKey},
                                           {"ANTHROPIC_API_KEY", kAnthropicKey},
                                           {"HONEYPOT_1", kHoneypot}},
        /*env_fallback=*/false);
    c.transport = transport;
    c.audit = std::make_shared<AuditLogger>(store);
    c.dispatcher = dispatcher;
    pipeline = std::make_unique<FirewallPipeline>(std::move(c), clock.Fn());
    transport->Respond(200, R"({"object":"list","data":[]})");
  }

  ~Harness() { dispatcher->Stop(); }

  ProxyRequest Request(const std::string& method, const std::string& path,
                       const std::string& body = "") const {
    ProxyRequest request;
    request.method = method;
    auto q = path.find('?');
    request.path = path.substr(0, q);
    if (q != std::string::npos) {
      request.query = path.substr(q + 1);
    }
    request.body = body;
    request.headers["authorization"] = std::string("Bearer ") + kProxyKey;
    request.headers["x-agent-id"] = "agent-7";
    request.headers["content-type"] = "application/json";
    return request;
  }

  ProxyResponse Handle(const ProxyRequest& request) {
    auto response = pipeline->Handle(request);
    dispatcher->WaitIdle();
    return response;
  }

  std::vector<std::string> BlockKeys() const { return store->List("blocked:"); }

  ManualClock clock;
  std::shared_ptr<MemoryKvStore> store;
  std::shared_ptr<RecordingTransport> transport;
  std::shared_ptr<BackgroundDispatcher> dispatcher;
  std::shared_ptr<KillSwitch> kill_switch;
  std::unique_ptr<FirewallPipeline> pipeline;
};

std::string CompletionWith(const std::string& content) {
  return json{{"id", "chatcmpl-1"},
              {"object", "chat.completion"},
              {"model", "gpt-4o"},
              {"choices", json::array({{{"index", 0},
                                        {"message", {{"role", "assistant"}, {"content", content}}},
                                        {"finish_reason", "stop"}}})}}
      .dump();
}

json ErrorBody(const ProxyResponse& response) { return json::parse(response.body); }

}  // namespace

TEST_CASE("Pipeline rejects unknown providers", "[pipeline]") {
  Harness h;
  auto response = h.Handle(h.Request("GET", "/nowhere/v1/models"));
  REQUIRE(response.status == 404);
  REQUIRE(ErrorBody(response)["code"] == "UNKNOWN_ROUTE");
  REQUIRE(ErrorBody(response)["error"].get<std::string>().find("/openai/*") != std::string::npos);

  auto root = h.Handle(h.Request("GET", "/"));
  REQUIRE(root.status == 404);
  REQUIRE(h.transport->CallCount() == 0);
}

TEST_CASE("Pipeline kill switch blocks every request without calling upstream", "[pipeline]") {
  Harness h;
  h.kill_switch->SetEnabled(false);

  auto authed = h.Handle(h.Request("POST", "/openai/v1/chat/completions", R"({"model":"m"})"));
  REQUIRE(authed.status == 503);
  REQUIRE(ErrorBody(authed)["code"] == "KILL_SWITCH");

  auto anonymous = h.Request("GET", "/anthropic/v1/models");
  anonymous.headers.erase("authorization");
  REQUIRE(h.Handle(anonymous).status == 503);

  REQUIRE(h.transport->CallCount() == 0);
  // Both blocks land in the same instant and are both kept.
  auto keys = h.BlockKeys();
  REQUIRE(keys.size() == 2);
  for (const auto& key : keys) {
    REQUIRE(json::parse(*h.store->Get(key))["reason"] == "kill_switch");
  }

  h.kill_switch->SetEnabled(true);
  REQUIRE(h.Handle(h.Request("GET", "/openai/v1/models")).status == 200);
}

TEST_CASE("Pipeline rejects bad proxy credentials without logging or counting", "[pipeline]") {
  Harness h(1);
  auto missing = h.Request("GET", "/openai/v1/models");
  missing.headers.erase("authorization");
  auto wrong = h.Request("GET", "/openai/v1/models");
  wrong.headers["authorization"] = "Bearer not-the-key";
  auto raw = h.Request("GET", "/openai/v1/models");
  raw.headers["authorization"] = kProxyKey;

  for (const auto& request : {missing, wrong, raw}) {
    auto response = h.Handle(request);
    REQUIRE(response.status == 401);
    REQUIRE(ErrorBody(response)["code"] == "UNAUTHORIZED");
  }
  REQUIRE(h.transport->CallCount() == 0);
  REQUIRE(h.BlockKeys().empty());
  // The single-request budget is still untouched.
  REQUIRE(h.Handle(h.Request("GET", "/openai/v1/models")).status == 200);
}

TEST_CASE("Pipeline rate limits per agent and minute", "[pipeline]") {
  Harness h(2);
  REQUIRE(h.Handle(h.Request("GET", "/openai/v1/models")).status == 200);
  REQUIRE(h.Handle(h.Request("GET", "/openai/v1/models")).status == 200);

  auto limited = h.Handle(h.Request("GET", "/openai/v1/models"));
  REQUIRE(limited.status == 429);
  REQUIRE(ErrorBody(limited)["code"] == "RATE_LIMITED");
  REQUIRE(ErrorBody(limited)["error"] == "Rate limit exceeded: 2/min");
  REQUIRE(h.transport->CallCount() == 2);

  auto record = json::parse(*h.store->Get(h.BlockKeys().front()));
  REQUIRE(record["reason"] == "2/min");
  REQUIRE(record["agent_id"] == "agent-7");

  auto other = h.Request("GET", "/openai/v1/models");
  other.headers["x-agent-id"] = "agent-8";
  REQUIRE(h.Handle(other).status == 200);

  h.clock.Advance(std::chrono::seconds(40));
  REQUIRE(h.Handle(h.Request("GET", "/openai/v1/models")).status == 200);
}

TEST_CASE("Pipeline blocks secrets in request bodies and logs them", "[pipeline]") {
  Harness h;
  AdminApi admin(h.store, h.kill_switch, kAdminKey, h.clock.Fn());

  auto body = R"({"messages":[{"role":"user","content":"use sk-abcdefghijklmnopqrstuvwxyz"}]})";
  auto response = h.Handle(h.Request("POST", "/openai/v1/chat/completions", body));
  REQUIRE(response.status == 403);
  auto error = ErrorBody(response);
  REQUIRE(error["code"] == "SECRET_DETECTED");
  REQUIRE(error["pattern"] == "sk-[a-zA-Z0-9]{20,}");
  REQUIRE(h.transport->CallCount() == 0);

  ProxyRequest blocks;
  blocks.method = "GET";
  blocks.path = "/admin/blocks";
  blocks.headers["x-admin-key"] = kAdminKey;
  auto listing = json::parse(admin.Handle(blocks).body);
  REQUIRE(listing["count"] == 1);
  REQUIRE(listing["blocks"][0]["reason"] == "secret_detected:sk-[a-zA-Z0-9]{20,}");
  REQUIRE(listing["blocks"][0]["body"] == body);
}

TEST_CASE("Pipeline forwards clean requests with the real credential", "[pipeline]") {
  Harness h;
  h.transport->SetHeader("x-request-id", "req-1");
  auto request = h.Request("GET", "/openai/v1/models?limit=5");
  request.headers["host"] = "proxy.local";
  request.headers["accept-encoding"] = "gzip";
  request.headers["connection"] = "keep-alive";
  request.headers["x-custom"] = "kept";

  auto response = h.Handle(request);
  REQUIRE(response.status == 200);
  REQUIRE(response.body == R"({"object":"list","data":[]})");
  REQUIRE(response.headers["x-request-id"] == "req-1");

  auto calls = h.transport->Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].method == "GET");
  REQUIRE(calls[0].url == "https://api.openai.com/v1/models?limit=5");
  REQUIRE(calls[0].headers.at("authorization") == std::string("Bearer ") + kOpenAiKey);
  REQUIRE(calls[0].headers.at("x-custom") == "kept");
  REQUIRE(calls[0].headers.count("host") == 0);
  REQUIRE(calls[0].headers.count("accept-encoding") == 0);
  REQUIRE(calls[0].headers.count("connection") == 0);
  REQUIRE(calls[0].body.empty());
}

TEST_CASE("Pipeline uses each provider's credential header", "[pipeline]") {
  Harness h;
  auto body = R"({"model":"claude","stream":true})";
  h.Handle(h.Request("POST", "/anthropic/v1/messages", body));

  auto calls = h.transport->Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].url == "https://api.anthropic.com/v1/messages");
  REQUIRE(calls[0].headers.at("x-api-key") == kAnthropicKey);
  REQUIRE(calls[0].headers.count("authorization") == 0);
  // Not a completion endpoint: the body is forwarded byte-for-byte.
  REQUIRE(calls[0].body == body);
}

TEST_CASE("Pipeline disables streaming on completion requests", "[pipeline]") {
  Harness h;
  h.transport->Respond(200, CompletionWith("hi"));
  auto body = R"({"model":"gpt-4o","stream":true,"stream_options":{"include_usage":true}})";
  auto response = h.Handle(h.Request("POST", "/openai/v1/chat/completions", body));
  REQUIRE(response.status == 200);

  auto forwarded = json::parse(h.transport->Calls()[0].body);
  REQUIRE(forwarded["stream"] == false);
  REQUIRE_FALSE(forwarded.contains("stream_options"));
  REQUIRE(forwarded["model"] == "gpt-4o");

  std::string plain = R"({"model":"gpt-4o","stream":false})";
  REQUIRE_FALSE(FirewallPipeline::DisableStreaming(&plain));
  REQUIRE(plain == R"({"model":"gpt-4o","stream":false})");
}

TEST_CASE("Pipeline redacts leaked credentials from completions", "[pipeline]") {
  Harness h;
  h.transport->Respond(200,
                       CompletionWith(std::string("the key is ") + kOpenAiKey +
                                      " and decoy " + kHoneypot),
                       "application/json; charset=utf-8");

  auto response = h.Handle(h.Request("POST", "/openai/v1/chat/completions", R"({"model":"gpt-4o"})"));
  REQUIRE(response.status == 200);
  REQUIRE(response.headers["content-type"] == "application/json");
  auto content = json::parse(response.body)["choices"][0]["message"]["content"].get<std::string>();
  REQUIRE(content == "the key is [REDACTED-BY-AGENTFW] and decoy [REDACTED-BY-AGENTFW]");
  REQUIRE(response.body.find(kOpenAiKey) == std::string::npos);

  auto keys = h.BlockKeys();
  REQUIRE(keys.size() == 1);
  REQUIRE(keys[0].size() > 9);
  REQUIRE(keys[0].substr(keys[0].size() - 9) == ":response");
  auto record = json::parse(*h.store->Get(keys[0]));
  REQUIRE(record["matched_patterns"].size() == 2);
}

TEST_CASE("Pipeline assembles event streams before inspection", "[pipeline]") {
  Harness h;
  h.transport->Respond(
      200,
      "data: {\"id\":\"c1\",\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n"
      "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\n"
      "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n"
      "data: {\"choices\":[{\"delta\":{},\"finish_reason\":\"stop\"}]}\n\n"
      "data: [DONE]\n\n",
      "text/event-stream");

  auto response = h.Handle(
      h.Request("POST", "/deepseek/v1/chat/completions", R"({"model":"m","stream":true})"));
  REQUIRE(response.status == 200);
  REQUIRE(response.headers["content-type"] == "application/json");
  auto body = json::parse(response.body);
  REQUIRE(body["object"] == "chat.completion");
  REQUIRE(body["choices"][0]["message"]["content"] == "Hello");
  REQUIRE(body["choices"][0]["finish_reason"] == "stop");
}

TEST_CASE("Pipeline passes upstream errors through untouched", "[pipeline]") {
  Harness h;
  std::string upstream_error = R"({"error":{"message":"overloaded"}})";
  h.transport->Respond(529, upstream_error);
  h.transport->SetHeader("content-length", "999");
  h.transport->SetHeader("connection", "close");

  auto response = h.Handle(h.Request("POST", "/openai/v1/chat/completions", R"({"model":"m"})"));
  REQUIRE(response.status == 529);
  REQUIRE(response.body == upstream_error);
  REQUIRE(response.headers.count("content-length") == 0);
  REQUIRE(response.headers.count("connection") == 0);
}

TEST_CASE("Pipeline maps transport failures to 502", "[pipeline]") {
  Harness h;
  h.transport->FailWithException(true);
  auto response = h.Handle(h.Request("GET", "/kimi/v1/models"));
  REQUIRE(response.status == 502);
  REQUIRE(ErrorBody(response)["code"] == "UPSTREAM_ERROR");
  REQUIRE(response.headers.count("x-agentfw-upstream-error") == 0);
  REQUIRE(h.store->List("stats:").empty());
}

TEST_CASE("Pipeline records usage for forwarded calls", "[pipeline]") {
  Harness h;
  h.Handle(h.Request("POST", "/openai/v1/embeddings", R"({"model":"text-embed"})"));
  auto anonymous_agent = h.Request("GET", "/openai/v1/models");
  anonymous_agent.headers.erase("x-agent-id");
  h.Handle(anonymous_agent);

  REQUIRE(*h.store->Get("stats:agent-7:2023-11-14T22") == "1");
  REQUIRE(*h.store->Get("stats:default:2023-11-14T22") == "1");
  auto logs = h.store->List("log:");
  REQUIRE(logs.size() == 2);
}

TEST_CASE("Pipeline header helpers", "[pipeline]") {
  ProviderRoute route{"openai", "https://api.openai.com", "authorization", "Bearer ", "OPENAI_API_KEY"};
  HttpHeaders inbound = {{"authorization", "Bearer proxy"},
                         {"content-length", "10"},
                         {"transfer-encoding", "chunked"},
                         {"x-agent-id", "a"}};
  auto upstream = FirewallPipeline::UpstreamHeaders(inbound, route, std::string("real"));
  REQUIRE(upstream.at("authorization") == "Bearer real");
  REQUIRE(upstream.count("content-length") == 0);
  REQUIRE(upstream.count("transfer-encoding") == 0);
  REQUIRE(upstream.at("x-agent-id") == "a");

  auto without = FirewallPipeline::UpstreamHeaders(inbound, route, std::nullopt);
  REQUIRE(without.count("authorization") == 0);

  REQUIRE(FirewallPipeline::IsCompletionEndpoint("/v1/chat/completions"));
  REQUIRE(FirewallPipeline::IsCompletionEndpoint("/api/v1/chat/completions"));
  REQUIRE_FALSE(FirewallPipeline::IsCompletionEndpoint("/v1/completions"));
}
