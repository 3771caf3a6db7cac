#include "server/proxy/provider_routes.h"

#include <sstream>

namespace agentfw {

ProviderRoutes::ProviderRoutes(const std::vector<ProviderRoute>& routes) {
  for (const auto& route : routes) {
    if (route.name.empty() || route.upstream.empty()) {
      continue;
    }
    auto normalized = route;
    while (!normalized.upstream.empty() && normalized.upstream.back() == '/') {
      normalized.upstream.pop_back();
    }
    routes_[normalized.name] = normalized;
  }
}

std::vector<ProviderRoute> ProviderRoutes::Defaults() {
  return {
      {"anthropic", "https://api.anthropic.com", "x-api-key", "", "ANTHROPIC_API_KEY"},
      {"openrouter", "https://openrouter.ai/api", "authorization", "Bearer ",
       "OPENROUTER_API_KEY"},
      {"openai", "https://api.openai.com", "authorization", "Bearer ", "OPENAI_API_KEY"},
      {"deepseek", "https://api.deepseek.com", "authorization", "Bearer ",
       "DEEPSEEK_API_KEY"},
      {"kimi", "https://api.moonshot.ai", "authorization", "Bearer ", "KIMI_API_KEY"},
  };
}

ProviderRoutes ProviderRoutes::WithOverrides(
    const std::vector<ProviderRoute>& overrides) {
  auto routes = Defaults();
  routes.insert(routes.end(), overrides.begin(), overrides.end());
  return ProviderRoutes(routes);
}

std::optional<ProviderRoute> ProviderRoutes::Find(
    const std::string& provider) const {
  auto it = routes_.find(provider);
  if (it == routes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> ProviderRoutes::Names() const {
  std::vector<std::string> names;
  names.reserve(routes_.size());
  for (const auto& entry : routes_) {
    names.push_back(entry.first);
  }
  return names;
}

std::vector<std::string> ProviderRoutes::KeyNames() const {
  std::vector<std::string> names;
  for (const auto& entry : routes_) {
    if (!entry.second.key_name.empty()) {
      names.push_back(entry.second.key_name);
    }
  }
  return names;
}

RoutedPath SplitProviderPath(const std::string& path) {
  RoutedPath routed;
  std::vector<std::string> segments;
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  if (segments.empty()) {
    return routed;
  }
  routed.provider = segments.front();
  std::string rest;
  for (std::size_t i = 1; i < segments.size(); ++i) {
    rest += "/" + segments[i];
  }
  routed.rest = rest.empty() ? "/" : rest;
  return routed;
}

}  // namespace agentfw
