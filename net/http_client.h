#pragma once

#include "net/upstream_transport.h"

#include <map>
#include <string>

#include <openssl/ssl.h>

namespace agentfw {

// Blocking HTTP/1.1 client, one connection per request ("Connection: close").
// https URLs go through OpenSSL with peer and host-name verification.
class HttpClient : public UpstreamTransport {
public:
  HttpClient();
  ~HttpClient() override;
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;

  HttpResponse Forward(const std::string &method, const std::string &url,
                       const std::map<std::string, std::string> &headers,
                       const std::string &body) const override;

  // Decodes a "Transfer-Encoding: chunked" body. Throws on malformed input.
  static std::string DecodeChunked(const std::string &body);
  // Splits a raw HTTP response into status, lower-cased headers and body.
  static HttpResponse ParseResponse(const std::string &raw);

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace agentfw
