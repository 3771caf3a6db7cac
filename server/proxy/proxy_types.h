#pragma once

#include <map>
#include <string>

namespace agentfw {

// Header names are stored lower-cased; HTTP header names are
// case-insensitive and every lookup in this project uses lower case.
using HttpHeaders = std::map<std::string, std::string>;

std::string ToLowerAscii(std::string value);

struct ProxyRequest {
  std::string method{"GET"};
  // Path without the query string, e.g. "/openai/v1/chat/completions".
  std::string path;
  // Raw query string without the leading '?', empty when absent.
  std::string query;
  HttpHeaders headers;
  std::string body;

  std::string Header(const std::string& name) const;
};

struct ProxyResponse {
  int status{200};
  HttpHeaders headers;
  std::string body;
};

// {"error": message, "code": code} with a JSON content type.
ProxyResponse JsonError(int status, const std::string& message,
                        const std::string& code);

std::string StatusText(int status);

}  // namespace agentfw
