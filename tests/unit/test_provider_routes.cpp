#include <catch2/catch_test_macros.hpp>

#include "server/proxy/provider_routes.h"

using agentfw::ProviderRoute;
using agentfw::ProviderRoutes;
using agentfw::SplitProviderPath;

TEST_CASE("ProviderRoutes defaults cover the built-in providers", "[routes]") {
  ProviderRoutes routes(ProviderRoutes::Defaults());
  REQUIRE(routes.Size() == 5);

  auto anthropic = routes.Find("anthropic");
  REQUIRE(anthropic.has_value());
  REQUIRE(anthropic->upstream == "https://api.anthropic.com");
  REQUIRE(anthropic->key_header == "x-api-key");
  REQUIRE(anthropic->key_prefix.empty());

  auto openai = routes.Find("openai");
  REQUIRE(openai.has_value());
  REQUIRE(openai->key_header == "authorization");
  REQUIRE(openai->key_prefix == "Bearer ");
  REQUIRE(openai->key_name == "OPENAI_API_KEY");

  REQUIRE_FALSE(routes.Find("unknown").has_value());
  REQUIRE(routes.KeyNames().size() == 5);
}

TEST_CASE("ProviderRoutes overrides replace by name and add new providers", "[routes]") {
  auto routes = ProviderRoutes::WithOverrides({
      {"openai", "http://127.0.0.1:9000/", "authorization", "Bearer ", "LOCAL_OPENAI"},
      {"local", "http://127.0.0.1:11434", "authorization", "Bearer ", "LOCAL_API_KEY"},
      {"", "http://ignored", "", "", ""},
  });
  REQUIRE(routes.Size() == 6);
  REQUIRE(routes.Find("openai")->upstream == "http://127.0.0.1:9000");
  REQUIRE(routes.Find("openai")->key_name == "LOCAL_OPENAI");
  REQUIRE(routes.Find("local").has_value());
}

TEST_CASE("SplitProviderPath separates the provider segment", "[routes]") {
  auto routed = SplitProviderPath("/openai/v1/chat/completions");
  REQUIRE(routed.provider == "openai");
  REQUIRE(routed.rest == "/v1/chat/completions");

  auto bare = SplitProviderPath("/anthropic");
  REQUIRE(bare.provider == "anthropic");
  REQUIRE(bare.rest == "/");

  auto doubled = SplitProviderPath("//kimi//v1/models");
  REQUIRE(doubled.provider == "kimi");
  REQUIRE(doubled.rest == "/v1/models");

  REQUIRE(SplitProviderPath("/").provider.empty());
  REQUIRE(SplitProviderPath("").provider.empty());
}
