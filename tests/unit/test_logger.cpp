#include <catch2/catch_test_macros.hpp>

#include "server/logging/logger.h"


TEST_CASE("Logger defaults to plain-text mode", "[logger]") {
  agentfw::log::SetJsonMode(false);
  REQUIRE_FALSE(agentfw::log::IsJsonMode());
}

TEST_CASE("Logger can be switched to JSON mode", "[logger]") {
  agentfw::log::SetJsonMode(true);
  REQUIRE(agentfw::log::IsJsonMode());
  agentfw::log::SetJsonMode(false);
}

TEST_CASE("Logger does not throw in either mode", "[logger]") {
  agentfw::log::SetJsonMode(false);
  REQUIRE_NOTHROW(agentfw::log::Info("test", "hello from text mode"));
  REQUIRE_NOTHROW(agentfw::log::Warn("test", "warn in text mode", "agent=bot"));
  agentfw::log::SetJsonMode(true);
  REQUIRE_NOTHROW(agentfw::log::Error("test", "error in json mode", "detail=\"quoted\""));
  // Invalid UTF-8 must not escape the logger as an exception.
  REQUIRE_NOTHROW(agentfw::log::Warn("test", std::string("bad \xff byte")));
  agentfw::log::SetJsonMode(false);
}

TEST_CASE("Logger minimum level filters lower levels", "[logger]") {
  auto previous = agentfw::log::MinLevel();
  agentfw::log::SetMinLevel(agentfw::log::Level::WARN);
  REQUIRE(agentfw::log::MinLevel() == agentfw::log::Level::WARN);
  REQUIRE_NOTHROW(agentfw::log::Debug("test", "dropped"));
  REQUIRE_NOTHROW(agentfw::log::Info("test", "dropped"));
  agentfw::log::SetMinLevel(previous);
  REQUIRE(agentfw::log::MinLevel() == previous);
}
