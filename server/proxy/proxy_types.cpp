#include "server/proxy/proxy_types.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace agentfw {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string ProxyRequest::Header(const std::string& name) const {
  auto it = headers.find(ToLowerAscii(name));
  return it == headers.end() ? std::string() : it->second;
}

ProxyResponse JsonError(int status, const std::string& message,
                        const std::string& code) {
  ProxyResponse response;
  response.status = status;
  response.headers["content-type"] = "application/json";
  response.body = json({{"error", message}, {"code", code}}).dump();
  return response;
}

std::string StatusText(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    case 529: return "Site Overloaded";
    default: return status < 400 ? "OK" : "Error";
  }
}

}  // namespace agentfw
