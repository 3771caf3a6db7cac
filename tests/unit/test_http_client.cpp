#include <catch2/catch_test_macros.hpp>

#include "net/http_client.h"

#include <stdexcept>

using agentfw::HttpClient;

TEST_CASE("HttpClient parses status, headers and body", "[http_client]") {
  auto response = HttpClient::ParseResponse(
      "HTTP/1.1 201 Created\r\n"
      "Content-Type: application/json\r\n"
      "Set-Cookie: a=1\r\n"
      "set-cookie: b=2\r\n"
      "\r\n"
      "{\"ok\":true}");
  REQUIRE(response.status == 201);
  REQUIRE(response.Header("content-type") == "application/json");
  REQUIRE(response.Header("Content-Type") == "application/json");
  REQUIRE(response.headers["set-cookie"] == "a=1, b=2");
  REQUIRE(response.body == "{\"ok\":true}");
}

TEST_CASE("HttpClient decodes chunked bodies", "[http_client]") {
  REQUIRE(HttpClient::DecodeChunked("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n") ==
          "Wikipedia");

  auto response = HttpClient::ParseResponse(
      "HTTP/1.1 200 OK\r\n"
      "Transfer-Encoding: chunked\r\n"
      "\r\n"
      "3\r\nabc\r\n0\r\n\r\n");
  REQUIRE(response.body == "abc");
  REQUIRE(response.headers.count("transfer-encoding") == 0);
}

TEST_CASE("HttpClient rejects malformed responses", "[http_client]") {
  REQUIRE_THROWS_AS(HttpClient::ParseResponse("garbage"), std::runtime_error);
  REQUIRE_THROWS_AS(HttpClient::ParseResponse("SMTP ready\r\n\r\n"), std::runtime_error);
  REQUIRE_THROWS_AS(HttpClient::DecodeChunked("zz\r\nabc\r\n"), std::runtime_error);
  REQUIRE_THROWS_AS(HttpClient::DecodeChunked("10\r\nshort\r\n"), std::runtime_error);
}

TEST_CASE("HttpClient surfaces connection failures as exceptions", "[http_client]") {
  HttpClient client;
  // Port 1 on loopback is essentially never listening.
  REQUIRE_THROWS_AS(client.Forward("GET", "http://127.0.0.1:1/v1/models", {}, ""),
                    std::runtime_error);
}
