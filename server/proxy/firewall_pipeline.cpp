#include "server/proxy/firewall_pipeline.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/proxy/stream_assembler.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace agentfw {

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsHopByHop(const std::string& name) {
  return name == "connection" || name == "keep-alive" ||
         name == "transfer-encoding" || name == "content-length" ||
         name == "proxy-connection" || name == "upgrade" || name == "te" ||
         name == "trailer";
}

std::string UnknownRouteMessage(const ProviderRoutes& routes) {
  std::string message = "Unknown route. Use ";
  bool first = true;
  for (const auto& name : routes.Names()) {
    message += (first ? "/" : ", /") + name + "/*";
    first = false;
  }
  return first ? "Unknown route. No providers configured." : message;
}

double MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

FirewallPipeline::FirewallPipeline(PipelineComponents components)
    : FirewallPipeline(std::move(components),
                       [] { return std::chrono::system_clock::now(); }) {}

FirewallPipeline::FirewallPipeline(PipelineComponents components, Clock clock)
    : components_(std::move(components)), clock_(std::move(clock)) {
  if (!components_.kill_switch || !components_.auth ||
      !components_.rate_limiter || !components_.request_scanner ||
      !components_.response_scanner || !components_.vault ||
      !components_.transport || !components_.audit ||
      !components_.dispatcher) {
    throw std::invalid_argument("FirewallPipeline requires every component");
  }
}

bool FirewallPipeline::IsCompletionEndpoint(const std::string& rest_path) {
  return EndsWith(rest_path, "/chat/completions");
}

bool FirewallPipeline::DisableStreaming(std::string* body) {
  if (!body || body->empty()) {
    return false;
  }
  json parsed;
  try {
    parsed = json::parse(*body);
  } catch (const json::exception&) {
    return false;  // Not JSON: forwarded as-is.
  }
  if (!parsed.is_object() || !parsed.contains("stream")) {
    return false;
  }
  const auto& stream = parsed["stream"];
  bool truthy = (stream.is_boolean() && stream.get<bool>()) ||
                (stream.is_number() && stream.get<double>() != 0.0) ||
                (stream.is_string() && !stream.get<std::string>().empty()) ||
                stream.is_object() || stream.is_array();
  if (!truthy) {
    return false;
  }
  parsed["stream"] = false;
  parsed.erase("stream_options");
  *body = parsed.dump(-1, ' ', false, json::error_handler_t::replace);
  return true;
}

HttpHeaders FirewallPipeline::UpstreamHeaders(
    const HttpHeaders& inbound, const ProviderRoute& route,
    const std::optional<std::string>& credential) {
  HttpHeaders headers;
  for (const auto& [name, value] : inbound) {
    auto lowered = ToLowerAscii(name);
    // The proxy token never leaves this process. accept-encoding is dropped
    // so the upstream answers in a form the response scanner can read.
    if (lowered == "authorization" || lowered == "host" ||
        lowered == "accept-encoding" || IsHopByHop(lowered)) {
      continue;
    }
    headers[lowered] = value;
  }
  if (credential) {
    headers[route.key_header] = route.key_prefix + *credential;
  }
  return headers;
}

HttpHeaders FirewallPipeline::PassthroughHeaders(
    const std::map<std::string, std::string>& upstream) {
  HttpHeaders headers;
  for (const auto& [name, value] : upstream) {
    auto lowered = ToLowerAscii(name);
    if (IsHopByHop(lowered)) {
      continue;
    }
    headers[lowered] = value;
  }
  return headers;
}

std::vector<std::string> FirewallPipeline::KnownSecretNames() const {
  auto names = components_.extra_secret_names;
  auto route_keys = components_.routes.KeyNames();
  names.insert(names.end(), route_keys.begin(), route_keys.end());
  return names;
}

ProxyResponse FirewallPipeline::Handle(const ProxyRequest& request) {
  auto started = std::chrono::steady_clock::now();
  auto& metrics = GlobalMetrics();
  auto finish = [&](ProxyResponse response, const std::string& outcome,
                    const std::string& provider) {
    metrics.RecordOutcome(outcome, provider);
    metrics.RecordLatency(MillisSince(started));
    return response;
  };

  auto routed = SplitProviderPath(request.path);
  auto route = components_.routes.Find(routed.provider);
  if (!route) {
    return finish(JsonError(404, UnknownRouteMessage(components_.routes), "UNKNOWN_ROUTE"),
                  "unknown_route", "none");
  }
  const auto& provider = route->name;

  auto agent_id = request.Header(kAgentHeader);
  if (agent_id.empty()) {
    agent_id = kDefaultAgentId;
  }
  const std::string body = request.method != "GET" ? request.body : std::string();
  auto now = clock_();

  if (!components_.kill_switch->Enabled()) {
    DispatchBlock(agent_id, provider, "kill_switch", body, now);
    return finish(JsonError(503,
                            "Kill switch is active. All requests are blocked.",
                            "KILL_SWITCH"),
                  "kill_switch", provider);
  }

  if (!components_.auth->CheckHeader(request.Header("authorization"))) {
    return finish(JsonError(401,
                            "Unauthorized. Provide Authorization: Bearer <proxy key>",
                            "UNAUTHORIZED"),
                  "unauthorized", provider);
  }

  auto decision = components_.rate_limiter->Admit(agent_id, now);
  if (!decision.allowed) {
    DispatchBlock(agent_id, provider, decision.reason, body, now);
    return finish(JsonError(429, "Rate limit exceeded: " + decision.reason,
                            "RATE_LIMITED"),
                  "rate_limited", provider);
  }

  if (!body.empty()) {
    if (auto pattern = components_.request_scanner->Scan(body)) {
      DispatchBlock(agent_id, provider, "secret_detected:" + *pattern, body, now);
      auto response = JsonError(
          403, "Request blocked: potential secret detected in request body",
          "SECRET_DETECTED");
      auto payload = json::parse(response.body);
      payload["pattern"] = *pattern;
      response.body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
      return finish(std::move(response), "secret_detected", provider);
    }
  }

  auto response = Forward(request, *route, routed.rest, agent_id, body, now);
  bool upstream_failed = response.status == 502 &&
                         response.headers.count("x-agentfw-upstream-error") > 0;
  if (upstream_failed) {
    response.headers.erase("x-agentfw-upstream-error");
  }
  return finish(std::move(response),
                upstream_failed ? "upstream_error" : "forwarded", provider);
}

ProxyResponse FirewallPipeline::Forward(
    const ProxyRequest& request, const ProviderRoute& route,
    const std::string& rest, const std::string& agent_id,
    const std::string& body, std::chrono::system_clock::time_point now) {
  const bool completion = IsCompletionEndpoint(rest);
  std::string forward_body = body;
  if (completion && request.method == "POST" &&
      DisableStreaming(&forward_body)) {
    log::Debug("pipeline", "streaming disabled for inspection",
               "agent=" + agent_id + " provider=" + route.name);
  }

  auto credential = components_.vault->Get(route.key_name);
  if (!credential) {
    log::Warn("pipeline", "no credential configured for provider",
              "provider=" + route.name + " key=" + route.key_name);
  }
  auto headers = UpstreamHeaders(request.headers, route, credential);
  std::string url = route.upstream + rest;
  if (!request.query.empty()) {
    url += "?" + request.query;
  }
  const bool bodyless = request.method == "GET" || request.method == "HEAD";

  HttpResponse upstream;
  auto upstream_started = std::chrono::steady_clock::now();
  try {
    upstream = components_.transport->Forward(request.method, url, headers,
                                              bodyless ? std::string() : forward_body);
  } catch (const std::exception& ex) {
    log::Warn("pipeline", "upstream request failed",
              "provider=" + route.name + " error=" + ex.what());
    auto failure = JsonError(502, "Upstream request failed", "UPSTREAM_ERROR");
    failure.headers["x-agentfw-upstream-error"] = "1";
    return failure;
  }
  GlobalMetrics().RecordUpstreamLatency(MillisSince(upstream_started));

  DispatchUsage(agent_id, route.name, body, now);

  if (completion && upstream.status >= 200 && upstream.status < 300) {
    return InspectCompletion(upstream, route.name, agent_id, now);
  }

  ProxyResponse passthrough;
  passthrough.status = upstream.status;
  passthrough.headers = PassthroughHeaders(upstream.headers);
  passthrough.body = std::move(upstream.body);
  return passthrough;
}

ProxyResponse FirewallPipeline::InspectCompletion(
    const HttpResponse& upstream, const std::string& provider,
    const std::string& agent_id, std::chrono::system_clock::time_point now) {
  std::string text;
  if (IsEventStream(upstream.Header("content-type"))) {
    // The upstream ignored stream:false.
    text = AssembleEventStream(upstream.body);
    GlobalMetrics().RecordStreamAssembled();
    log::Debug("pipeline", "assembled event-stream response",
               "bytes=" + std::to_string(text.size()));
  } else {
    text = upstream.body;
  }

  auto secrets = CollectKnownSecrets(*components_.vault, KnownSecretNames());
  auto scan = components_.response_scanner->Scan(text, secrets);

  ProxyResponse response;
  response.status = upstream.status;
  response.headers = PassthroughHeaders(upstream.headers);
  response.headers["content-type"] = "application/json";
  if (scan.Redacted()) {
    GlobalMetrics().RecordRedaction(provider);
    DispatchLeak(agent_id, provider, scan.matched, now);
    response.body = std::move(scan.text);
  } else {
    response.body = std::move(text);
  }
  return response;
}

void FirewallPipeline::DispatchBlock(const std::string& agent_id,
                                     const std::string& provider,
                                     const std::string& reason,
                                     const std::string& body,
                                     std::chrono::system_clock::time_point now) {
  auto audit = components_.audit;
  components_.dispatcher->Dispatch(
      {"block", [audit, agent_id, provider, reason, body, now] {
         audit->LogBlock(agent_id, provider, reason, body, now);
       }});
}

void FirewallPipeline::DispatchUsage(const std::string& agent_id,
                                     const std::string& provider,
                                     const std::string& body,
                                     std::chrono::system_clock::time_point now) {
  auto audit = components_.audit;
  components_.dispatcher->Dispatch(
      {"usage", [audit, agent_id, provider, body, now] {
         audit->LogUsage(agent_id, provider, body, now);
       }});
}

void FirewallPipeline::DispatchLeak(const std::string& agent_id,
                                    const std::string& provider,
                                    const std::vector<std::string>& matched,
                                    std::chrono::system_clock::time_point now) {
  auto audit = components_.audit;
  components_.dispatcher->Dispatch(
      {"leak", [audit, agent_id, provider, matched, now] {
         audit->LogResponseLeak(agent_id, provider, matched, now);
       }});
}

}  // namespace agentfw
