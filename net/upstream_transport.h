#pragma once

#include <map>
#include <string>

namespace agentfw {

struct HttpResponse {
  int status{0};
  // Lower-cased header names. Repeated headers are joined with ", ".
  std::map<std::string, std::string> headers;
  std::string body;

  std::string Header(const std::string &name) const;
};

// Forwards one request upstream and waits for the complete response.
// Throws std::runtime_error when no HTTP response could be obtained.
class UpstreamTransport {
public:
  virtual ~UpstreamTransport() = default;

  virtual HttpResponse
  Forward(const std::string &method, const std::string &url,
          const std::map<std::string, std::string> &headers,
          const std::string &body) const = 0;
};

} // namespace agentfw
