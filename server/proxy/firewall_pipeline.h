#pragma once

#include "io/background_dispatcher.h"
#include "net/upstream_transport.h"
#include "server/auth/proxy_auth.h"
#include "server/auth/rate_limiter.h"
#include "server/logging/audit_logger.h"
#include "server/policy/credential_vault.h"
#include "server/policy/kill_switch.h"
#include "server/policy/request_scanner.h"
#include "server/policy/response_scanner.h"
#include "server/proxy/provider_routes.h"
#include "server/proxy/proxy_types.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentfw {

// Everything the pipeline consults. Shared ownership because background
// side effects may outlive the request that scheduled them.
struct PipelineComponents {
  ProviderRoutes routes;
  std::shared_ptr<KillSwitch> kill_switch;
  std::shared_ptr<ProxyAuth> auth;
  std::shared_ptr<RateLimiter> rate_limiter;
  std::shared_ptr<RequestScanner> request_scanner;
  std::shared_ptr<ResponseScanner> response_scanner;
  std::shared_ptr<CredentialVault> vault;
  std::shared_ptr<UpstreamTransport> transport;
  std::shared_ptr<AuditLogger> audit;
  std::shared_ptr<BackgroundDispatcher> dispatcher;
  // Vault names whose values must never appear in a response, in addition
  // to every route's credential and the honeypots.
  std::vector<std::string> extra_secret_names{"PROXY_KEY", "ADMIN_KEY"};
};

// Per-request firewall. Guard order is fixed:
//   route -> kill switch -> auth -> rate limit -> inbound scan -> forward
//   -> (stream assembly) -> outbound scan.
// A disabled kill switch short-circuits before any credential is read, and
// unauthenticated calls never touch an agent's rate budget.
class FirewallPipeline {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr const char* kDefaultAgentId = "default";
  static constexpr const char* kAgentHeader = "x-agent-id";

  explicit FirewallPipeline(PipelineComponents components);
  FirewallPipeline(PipelineComponents components, Clock clock);

  ProxyResponse Handle(const ProxyRequest& request);

  const ProviderRoutes& Routes() const { return components_.routes; }

  static bool IsCompletionEndpoint(const std::string& rest_path);
  // Turns {"stream": true, ...} into {"stream": false} without
  // stream_options. Returns false (body untouched) when nothing changed.
  static bool DisableStreaming(std::string* body);
  static HttpHeaders UpstreamHeaders(const HttpHeaders& inbound,
                                     const ProviderRoute& route,
                                     const std::optional<std::string>& credential);
  static HttpHeaders PassthroughHeaders(const std::map<std::string, std::string>& upstream);

 private:
  ProxyResponse Forward(const ProxyRequest& request, const ProviderRoute& route,
                        const std::string& rest, const std::string& agent_id,
                        const std::string& body,
                        std::chrono::system_clock::time_point now);
  ProxyResponse InspectCompletion(const HttpResponse& upstream,
                                  const std::string& provider,
                                  const std::string& agent_id,
                                  std::chrono::system_clock::time_point now);

  void DispatchBlock(const std::string& agent_id, const std::string& provider,
                     const std::string& reason, const std::string& body,
                     std::chrono::system_clock::time_point now);
  void DispatchUsage(const std::string& agent_id, const std::string& provider,
                     const std::string& body,
                     std::chrono::system_clock::time_point now);
  void DispatchLeak(const std::string& agent_id, const std::string& provider,
                    const std::vector<std::string>& matched,
                    std::chrono::system_clock::time_point now);

  std::vector<std::string> KnownSecretNames() const;

  PipelineComponents components_;
  Clock clock_;
};

}  // namespace agentfw
