#include "server/policy/credential_vault.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace agentfw {

ConfigCredentialVault::ConfigCredentialVault(
    std::map<std::string, std::string> values, bool env_fallback)
    : values_(std::move(values)), env_fallback_(env_fallback) {}

std::optional<std::string> ConfigCredentialVault::Get(
    const std::string& name) const {
  auto it = values_.find(name);
  if (it != values_.end() && !it->second.empty()) {
    return it->second;
  }
  if (env_fallback_) {
    if (const char* env = std::getenv(name.c_str())) {
      if (*env != '\0') {
        return std::string(env);
      }
    }
  }
  return std::nullopt;
}

std::vector<SecretDescriptor> CollectKnownSecrets(
    const CredentialVault& vault,
    const std::vector<std::string>& credential_names) {
  std::vector<SecretDescriptor> secrets;
  std::vector<std::string> seen;
  for (const auto& name : credential_names) {
    if (std::find(seen.begin(), seen.end(), name) != seen.end()) {
      continue;
    }
    seen.push_back(name);
    auto value = vault.Get(name);
    if (value && value->size() >= kMinKnownSecretLength) {
      secrets.push_back({name, *value});
    }
  }
  for (int i = 1; i <= kMaxHoneypots; ++i) {
    std::string name = "HONEYPOT_" + std::to_string(i);
    auto value = vault.Get(name);
    if (value) {
      secrets.push_back({name, *value});
    }
  }
  return secrets;
}

}  // namespace agentfw
