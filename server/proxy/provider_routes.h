#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentfw {

struct ProviderRoute {
  std::string name;
  std::string upstream;          // base URL, no trailing slash
  std::string key_header;        // lower-case header carrying the credential
  std::string key_prefix;        // e.g. "Bearer ", may be empty
  std::string key_name;          // credential vault lookup key
};

// Immutable path-prefix -> upstream table. Built once at startup.
class ProviderRoutes {
 public:
  ProviderRoutes() = default;
  explicit ProviderRoutes(const std::vector<ProviderRoute>& routes);

  // anthropic, openrouter, openai, deepseek, kimi.
  static std::vector<ProviderRoute> Defaults();

  // Later entries with the same name replace earlier ones.
  static ProviderRoutes WithOverrides(const std::vector<ProviderRoute>& overrides);

  std::optional<ProviderRoute> Find(const std::string& provider) const;
  std::vector<std::string> Names() const;
  // Credential vault keys across all routes, in table order.
  std::vector<std::string> KeyNames() const;
  std::size_t Size() const { return routes_.size(); }

 private:
  std::map<std::string, ProviderRoute> routes_;
};

struct RoutedPath {
  std::string provider;
  // Remainder after the provider segment, always starting with '/'.
  std::string rest{"/"};
};

// "/openai/v1/chat/completions" -> {"openai", "/v1/chat/completions"}.
// Empty segments are dropped, as a split on '/' would.
RoutedPath SplitProviderPath(const std::string& path);

}  // namespace agentfw
