#pragma once

#include <string>

namespace agentfw {

// Single shared-secret bearer auth. Every agent presents the same proxy
// token; agent identity is a separate, unauthenticated header.
class ProxyAuth {
 public:
  ProxyAuth() = default;
  explicit ProxyAuth(const std::string& proxy_key);

  // Token as presented in "Authorization: Bearer <token>".
  bool IsAllowed(const std::string& token) const;
  // Full Authorization header value; anything but a non-empty Bearer token
  // is rejected.
  bool CheckHeader(const std::string& authorization) const;

  static std::string ExtractBearer(const std::string& authorization);
  static std::string HashKey(const std::string& key);

 private:
  // Empty when no key is configured; every token is then rejected.
  std::string key_hash_;
};

}  // namespace agentfw
