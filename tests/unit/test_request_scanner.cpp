#include <catch2/catch_test_macros.hpp>

#include "server/policy/request_scanner.h"

using agentfw::RequestScanner;

TEST_CASE("RequestScanner reports the first matching pattern", "[scanner]") {
  RequestScanner scanner(R"(["AKIA[0-9A-Z]{16}", "sk-[a-zA-Z0-9]{20,}"])");
  REQUIRE(scanner.Enabled());

  auto hit = scanner.Scan(R"({"messages":[{"content":"key sk-abcdefghijklmnopqrstuvwx"}]})");
  REQUIRE(hit.has_value());
  REQUIRE(*hit == "sk-[a-zA-Z0-9]{20,}");

  REQUIRE_FALSE(scanner.Scan(R"({"messages":[{"content":"hello"}]})").has_value());
}

TEST_CASE("RequestScanner matches case-insensitively", "[scanner]") {
  RequestScanner scanner(R"(["password\\s*=\\s*\\S+"])");
  REQUIRE(scanner.Scan("PASSWORD = hunter2").has_value());
}

TEST_CASE("RequestScanner with no usable configuration never matches", "[scanner]") {
  RequestScanner unset;
  REQUIRE_FALSE(unset.Enabled());
  REQUIRE_FALSE(unset.Scan("sk-abcdefghijklmnopqrstuvwx").has_value());

  RequestScanner empty("");
  REQUIRE_FALSE(empty.Enabled());

  RequestScanner not_json("[not json");
  REQUIRE_FALSE(not_json.Enabled());
  REQUIRE_FALSE(not_json.Scan("anything").has_value());

  RequestScanner not_array(R"({"pattern":"x"})");
  REQUIRE_FALSE(not_array.Scan("x").has_value());
}

TEST_CASE("RequestScanner skips malformed and non-string patterns", "[scanner]") {
  RequestScanner scanner(R"(["([unclosed", 42, "secret-[0-9]+"])");
  REQUIRE(scanner.Enabled());
  auto hit = scanner.Scan("here is secret-12345");
  REQUIRE(hit.has_value());
  REQUIRE(*hit == "secret-[0-9]+");
}

TEST_CASE("RequestScanner handles a very long credential-shaped token", "[scanner]") {
  RequestScanner scanner(R"(["AKIA[0-9A-Z]{16}", "sk-[a-zA-Z0-9]{20,}"])");
  std::string body = R"({"messages":[{"content":"key: sk-)" +
                     std::string(200000, 'a') + R"("}]})";
  auto hit = scanner.Scan(body);
  REQUIRE(hit.has_value());
  REQUIRE(*hit == "sk-[a-zA-Z0-9]{20,}");

  std::string clean(200000, 'b');
  REQUIRE_FALSE(scanner.Scan(clean).has_value());
}

TEST_CASE("RequestScanner patterns keep their order", "[scanner]") {
  RequestScanner scanner(R"(["beta", "alpha"])");
  REQUIRE(scanner.Scan("alpha beta") == std::optional<std::string>("beta"));
  REQUIRE(scanner.Scan("ALPHA") == std::optional<std::string>("alpha"));
}
