#include "server/config/server_config.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

using json = nlohmann::json;

namespace agentfw {

namespace {

bool ParseBool(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

void OverrideInt(const EnvLookup& env, const char* name, int* target) {
  auto raw = env(name);
  if (!raw || raw->empty()) {
    return;
  }
  try {
    *target = std::stoi(*raw);
  } catch (const std::exception&) {
    log::Warn("config", "ignoring non-numeric override",
              std::string("name=") + name + " value=" + *raw);
  }
}

void OverrideString(const EnvLookup& env, const char* name, std::string* target) {
  auto raw = env(name);
  if (raw && !raw->empty()) {
    *target = *raw;
  }
}

std::string ScanPatternsFromNode(const YAML::Node& node) {
  if (node.IsScalar()) {
    return node.as<std::string>();  // Already a JSON array string.
  }
  if (!node.IsSequence()) {
    throw ConfigError("scan_patterns must be a list or a JSON string");
  }
  json patterns = json::array();
  for (const auto& item : node) {
    patterns.push_back(item.as<std::string>());
  }
  return patterns.dump();
}

ProviderRoute ProviderFromNode(const YAML::Node& node) {
  if (!node.IsMap() || !node["name"] || !node["upstream"]) {
    throw ConfigError("providers entries need at least name and upstream");
  }
  ProviderRoute route;
  route.name = node["name"].as<std::string>();
  route.upstream = node["upstream"].as<std::string>();
  route.key_header = node["key_header"] ? node["key_header"].as<std::string>()
                                        : "authorization";
  route.key_prefix = node["key_prefix"] ? node["key_prefix"].as<std::string>()
                                        : "Bearer ";
  route.key_name = node["key_name"] ? node["key_name"].as<std::string>() : "";
  if (route.key_name.empty()) {
    std::string upper = route.name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    route.key_name = upper + "_API_KEY";
  }
  std::transform(route.key_header.begin(), route.key_header.end(),
                 route.key_header.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return route;
}

}  // namespace

std::map<std::string, std::string> ServerConfig::VaultEntries() const {
  auto entries = credentials;
  if (!proxy_key.empty()) {
    entries["PROXY_KEY"] = proxy_key;
  }
  if (!admin_key.empty()) {
    entries["ADMIN_KEY"] = admin_key;
  }
  for (std::size_t i = 0; i < honeypots.size(); ++i) {
    entries["HONEYPOT_" + std::to_string(i + 1)] = honeypots[i];
  }
  return entries;
}

std::optional<std::string> ProcessEnv(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

ServerConfig ParseServerConfig(const YAML::Node& root) {
  ServerConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("config root must be a mapping");
  }
  try {
    if (auto server = root["server"]) {
      if (server["host"]) config.host = server["host"].as<std::string>();
      if (server["http_port"]) config.port = server["http_port"].as<int>();
      if (server["workers"]) config.workers = server["workers"].as<int>();
      if (auto tls = server["tls"]) {
        if (tls["enabled"]) config.tls_enabled = tls["enabled"].as<bool>();
        if (tls["cert_path"]) config.tls_cert_path = tls["cert_path"].as<std::string>();
        if (tls["key_path"]) config.tls_key_path = tls["key_path"].as<std::string>();
      }
    }

    if (auto auth = root["auth"]) {
      if (auth["proxy_key"]) config.proxy_key = auth["proxy_key"].as<std::string>();
      if (auth["admin_key"]) config.admin_key = auth["admin_key"].as<std::string>();
    }

    if (auto credentials = root["credentials"]) {
      if (!credentials.IsMap()) {
        throw ConfigError("credentials must be a mapping of NAME: value");
      }
      for (const auto& entry : credentials) {
        config.credentials[entry.first.as<std::string>()] =
            entry.second.as<std::string>();
      }
    }

    if (auto honeypots = root["honeypots"]) {
      if (!honeypots.IsSequence()) {
        throw ConfigError("honeypots must be a list");
      }
      for (const auto& item : honeypots) {
        config.honeypots.push_back(item.as<std::string>());
      }
    }

    if (auto rate = root["rate_limit"]) {
      if (rate["per_minute"]) config.rate_per_minute = rate["per_minute"].as<int>();
      if (rate["per_hour"]) config.rate_per_hour = rate["per_hour"].as<int>();
    }

    if (root["scan_patterns"]) {
      config.scan_patterns_json = ScanPatternsFromNode(root["scan_patterns"]);
    }

    if (auto providers = root["providers"]) {
      if (!providers.IsSequence()) {
        throw ConfigError("providers must be a list");
      }
      for (const auto& node : providers) {
        config.providers.push_back(ProviderFromNode(node));
      }
    }

    if (auto alerts = root["alerts"]) {
      if (alerts["webhook_url"]) config.alert_webhook_url = alerts["webhook_url"].as<std::string>();
      if (alerts["block_webhook_url"]) config.block_webhook_url = alerts["block_webhook_url"].as<std::string>();
    }

    if (root["audit"] && root["audit"]["path"]) {
      config.audit_path = root["audit"]["path"].as<std::string>();
    }

    if (auto logging = root["logging"]) {
      if (logging["format"]) config.log_format = logging["format"].as<std::string>();
      if (logging["level"]) config.log_level = logging["level"].as<std::string>();
    }

    if (auto effects = root["side_effects"]) {
      if (effects["workers"]) config.side_effect_workers = effects["workers"].as<std::size_t>();
      if (effects["queue_depth"]) config.side_effect_queue_depth = effects["queue_depth"].as<std::size_t>();
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }
  return config;
}

ServerConfig ParseServerConfigText(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("config is not valid YAML: ") + e.what());
  }
  return ParseServerConfig(root);
}

ServerConfig LoadServerConfig(const std::string& path) {
  if (path.empty() || !std::filesystem::exists(path)) {
    log::Warn("config", "config file not found, using defaults", "path=" + path);
    return ServerConfig{};
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("error parsing config file " + path + ": " + e.what());
  }
  return ParseServerConfig(root);
}

void ApplyEnvOverrides(ServerConfig* config, const EnvLookup& env) {
  OverrideString(env, "AGENTFW_HOST", &config->host);
  OverrideInt(env, "AGENTFW_PORT", &config->port);
  OverrideString(env, "AGENTFW_PROXY_KEY", &config->proxy_key);
  OverrideString(env, "AGENTFW_ADMIN_KEY", &config->admin_key);
  OverrideInt(env, "AGENTFW_RATE_LIMIT_PER_MIN", &config->rate_per_minute);
  OverrideInt(env, "AGENTFW_RATE_LIMIT_PER_HOUR", &config->rate_per_hour);
  OverrideString(env, "AGENTFW_SCAN_PATTERNS", &config->scan_patterns_json);
  OverrideString(env, "AGENTFW_ALERT_WEBHOOK_URL", &config->alert_webhook_url);
  OverrideString(env, "AGENTFW_BLOCK_WEBHOOK_URL", &config->block_webhook_url);
  OverrideString(env, "AGENTFW_AUDIT_LOG", &config->audit_path);
  OverrideString(env, "AGENTFW_LOG_FORMAT", &config->log_format);
  OverrideString(env, "AGENTFW_LOG_LEVEL", &config->log_level);
  if (auto tls = env("AGENTFW_TLS_ENABLED")) {
    config->tls_enabled = ParseBool(*tls);
  }
  OverrideString(env, "AGENTFW_TLS_CERT_PATH", &config->tls_cert_path);
  OverrideString(env, "AGENTFW_TLS_KEY_PATH", &config->tls_key_path);
  OverrideInt(env, "AGENTFW_HTTP_WORKERS", &config->workers);
}

}  // namespace agentfw
