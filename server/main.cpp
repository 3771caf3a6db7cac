#include "io/background_dispatcher.h"
#include "net/http_client.h"
#include "server/auth/proxy_auth.h"
#include "server/auth/rate_limiter.h"
#include "server/config/server_config.h"
#include "server/http/admin_api.h"
#include "server/http/http_server.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/notify/notifier.h"
#include "server/policy/credential_vault.h"
#include "server/policy/kill_switch.h"
#include "server/policy/request_scanner.h"
#include "server/policy/response_scanner.h"
#include "server/proxy/firewall_pipeline.h"
#include "server/proxy/provider_routes.h"
#include "store/memory_kv_store.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void PrintUsage() {
  std::cerr << "Usage: agentfwd [--config <path>]\n"
            << "Environment overrides use the AGENTFW_ prefix, e.g.\n"
            << "  AGENTFW_PORT, AGENTFW_PROXY_KEY, AGENTFW_ADMIN_KEY,\n"
            << "  AGENTFW_SCAN_PATTERNS, AGENTFW_LOG_FORMAT=json\n";
}

agentfw::log::Level ParseLevel(const std::string& level) {
  if (level == "debug") return agentfw::log::Level::DEBUG;
  if (level == "warn") return agentfw::log::Level::WARN;
  if (level == "error") return agentfw::log::Level::ERROR;
  return agentfw::log::Level::INFO;
}

std::shared_ptr<agentfw::Notifier> MakeNotifier(
    const std::string& url, std::shared_ptr<agentfw::UpstreamTransport> transport) {
  if (url.empty()) {
    return nullptr;
  }
  return std::make_shared<agentfw::WebhookNotifier>(url, std::move(transport));
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/agentfw.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }

  agentfw::ServerConfig config;
  try {
    config = agentfw::LoadServerConfig(config_path);
  } catch (const agentfw::ConfigError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  agentfw::ApplyEnvOverrides(&config);

  agentfw::log::SetJsonMode(config.log_format == "json");
  agentfw::log::SetMinLevel(ParseLevel(config.log_level));

  if (config.proxy_key.empty()) {
    agentfw::log::Warn("main", "no proxy key configured; every proxied request will be rejected");
  }
  if (config.admin_key.empty()) {
    agentfw::log::Warn("main", "no admin key configured; admin API is locked");
  }

  auto store = std::make_shared<agentfw::MemoryKvStore>();
  auto vault = std::make_shared<agentfw::ConfigCredentialVault>(config.VaultEntries());
  auto transport = std::make_shared<agentfw::HttpClient>();

  auto audit = std::make_shared<agentfw::AuditLogger>(store, config.audit_path);
  audit->SetNotifiers(MakeNotifier(config.BlockWebhookUrl(), transport),
                      MakeNotifier(config.LeakWebhookUrl(), transport));

  auto dispatcher = std::make_shared<agentfw::BackgroundDispatcher>(
      config.side_effect_workers, config.side_effect_queue_depth);
  dispatcher->Start();

  agentfw::PipelineComponents components;
  components.routes = agentfw::ProviderRoutes::WithOverrides(config.providers);
  components.kill_switch = std::make_shared<agentfw::KillSwitch>(store);
  components.auth = std::make_shared<agentfw::ProxyAuth>(config.proxy_key);
  components.rate_limiter = std::make_shared<agentfw::RateLimiter>(
      store, config.rate_per_minute, config.rate_per_hour);
  components.request_scanner =
      std::make_shared<agentfw::RequestScanner>(config.scan_patterns_json);
  components.response_scanner = std::make_shared<agentfw::ResponseScanner>();
  components.vault = vault;
  components.transport = transport;
  components.audit = audit;
  components.dispatcher = dispatcher;

  agentfw::log::Info("main", "configuration loaded",
                     "providers=" + std::to_string(components.routes.Size()) +
                         " rate_per_minute=" +
                         std::to_string(components.rate_limiter->PerMinute()) +
                         " rate_per_hour=" +
                         std::to_string(components.rate_limiter->PerHour()) +
                         " inbound_scan=" +
                         (components.request_scanner->Enabled() ? "on" : "off") +
                         " audit_mirror=" + (audit->MirrorEnabled() ? "on" : "off"));

  auto kill_switch = components.kill_switch;
  agentfw::FirewallPipeline pipeline(std::move(components));
  agentfw::AdminApi admin(store, kill_switch, config.admin_key);

  agentfw::HttpServer::TlsConfig tls;
  tls.enabled = config.tls_enabled;
  tls.cert_path = config.tls_cert_path;
  tls.key_path = config.tls_key_path;
  agentfw::HttpServer server(config.host, config.port, &pipeline, &admin, tls,
                             config.workers);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  server.Start();
  agentfw::log::Info("main", "agentfw listening",
                     "host=" + config.host + " port=" + std::to_string(config.port) +
                         (server.TlsEnabled() ? " tls=on" : ""));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  // Flush pending audit records before the store goes away.
  dispatcher->Stop();
  agentfw::log::Info("main", "agentfw shutting down");
  return 0;
}
