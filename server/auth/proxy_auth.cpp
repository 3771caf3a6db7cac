#include "server/auth/proxy_auth.h"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace agentfw {

namespace {
constexpr char kBearerPrefix[] = "Bearer ";
}  // namespace

ProxyAuth::ProxyAuth(const std::string& proxy_key)
    : key_hash_(proxy_key.empty() ? std::string() : HashKey(proxy_key)) {}

std::string ProxyAuth::HashKey(const std::string& key) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string ProxyAuth::ExtractBearer(const std::string& authorization) {
  if (authorization.rfind(kBearerPrefix, 0) != 0) {
    return {};
  }
  return authorization.substr(sizeof(kBearerPrefix) - 1);
}

bool ProxyAuth::IsAllowed(const std::string& token) const {
  if (token.empty() || key_hash_.empty()) {
    return false;
  }
  auto candidate = HashKey(token);
  return CRYPTO_memcmp(candidate.data(), key_hash_.data(), key_hash_.size()) ==
         0;
}

bool ProxyAuth::CheckHeader(const std::string& authorization) const {
  return IsAllowed(ExtractBearer(authorization));
}

}  // namespace agentfw
