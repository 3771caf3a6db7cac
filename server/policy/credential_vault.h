#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentfw {

struct SecretDescriptor {
  std::string name;
  std::string value;
};

// Read-only lookup of provider keys and the proxy's own shared secrets.
class CredentialVault {
 public:
  virtual ~CredentialVault() = default;
  virtual std::optional<std::string> Get(const std::string& name) const = 0;
};

// Values from the `credentials:` config map; a name missing there falls back
// to the environment variable of the same name. Empty values are absent.
class ConfigCredentialVault : public CredentialVault {
 public:
  ConfigCredentialVault() = default;
  explicit ConfigCredentialVault(std::map<std::string, std::string> values,
                                 bool env_fallback = true);

  std::optional<std::string> Get(const std::string& name) const override;

 private:
  std::map<std::string, std::string> values_;
  bool env_fallback_{true};
};

constexpr int kMaxHoneypots = 10;
// Credentials shorter than this are too generic to match literally.
constexpr std::size_t kMinKnownSecretLength = 8;

// Every value the response firewall must never let through: the proxy and
// admin keys and provider credentials (length >= 8) followed by honeypot
// decoys HONEYPOT_1..HONEYPOT_10 (any non-empty value).
std::vector<SecretDescriptor> CollectKnownSecrets(
    const CredentialVault& vault,
    const std::vector<std::string>& credential_names);

}  // namespace agentfw
