#pragma once

#include "server/proxy/provider_routes.h"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace agentfw {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8787};
  int workers{4};
  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;

  std::string proxy_key;
  std::string admin_key;
  // Provider credentials by vault name, e.g. OPENAI_API_KEY.
  std::map<std::string, std::string> credentials;
  // Decoy values, exposed to the vault as HONEYPOT_1..HONEYPOT_n.
  std::vector<std::string> honeypots;

  int rate_per_minute{30};
  int rate_per_hour{500};
  // JSON array of regex sources. Empty disables inbound scanning.
  std::string scan_patterns_json;
  // Merged over the built-in provider table by name.
  std::vector<ProviderRoute> providers;

  std::string alert_webhook_url;
  std::string block_webhook_url;
  std::string audit_path;

  std::string log_format{"text"};
  std::string log_level{"info"};

  std::size_t side_effect_workers{2};
  std::size_t side_effect_queue_depth{1024};

  // Everything the credential vault should resolve: credentials plus
  // PROXY_KEY, ADMIN_KEY and HONEYPOT_n.
  std::map<std::string, std::string> VaultEntries() const;

  // Block alerts only go to block_webhook_url. Leak alerts prefer
  // alert_webhook_url and fall back to block_webhook_url.
  const std::string& BlockWebhookUrl() const { return block_webhook_url; }
  const std::string& LeakWebhookUrl() const {
    return alert_webhook_url.empty() ? block_webhook_url : alert_webhook_url;
  }
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> ProcessEnv(const std::string& name);

// Throws ConfigError when the document is not valid YAML or a value has the
// wrong type.
ServerConfig ParseServerConfig(const YAML::Node& root);
ServerConfig ParseServerConfigText(const std::string& yaml_text);
// A missing file yields the defaults.
ServerConfig LoadServerConfig(const std::string& path);

// AGENTFW_* variables win over file values. Unparsable numbers are ignored
// with a warning.
void ApplyEnvOverrides(ServerConfig* config, const EnvLookup& env = ProcessEnv);

}  // namespace agentfw
