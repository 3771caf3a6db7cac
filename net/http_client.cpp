#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace agentfw {
namespace {
struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
  bool explicit_port{false};
};

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = Lower(url.substr(0, scheme_pos));
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find_first_of("/?");
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);
  if (!parsed.path.empty() && parsed.path.front() == '?') {
    parsed.path = "/" + parsed.path;
  }

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::logic_error &) {
      throw std::runtime_error("invalid URL port");
    }
    parsed.explicit_port = true;
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

int CreateSocket(const ParsedUrl &parsed) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw std::runtime_error("failed to resolve host " + parsed.host);
  }
  int sock = -1;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + parsed.host);
  struct timeval tv;
  tv.tv_sec = 30;
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

bool CarriesBody(const std::string &method, const std::string &body) {
  return !body.empty() || (method != "GET" && method != "HEAD");
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host;
  if (parsed.explicit_port) {
    request << ":" << parsed.port;
  }
  request << "\r\n";
  bool has_content_type = false;
  for (const auto &[key, value] : headers) {
    auto lowered = Lower(key);
    // Framing headers are owned by this client.
    if (lowered == "host" || lowered == "content-length" ||
        lowered == "connection" || lowered == "transfer-encoding") {
      continue;
    }
    if (lowered == "content-type") {
      has_content_type = true;
    }
    request << key << ": " << value << "\r\n";
  }
  if (CarriesBody(method, body)) {
    request << "Content-Length: " << body.size() << "\r\n";
    if (!has_content_type && !body.empty()) {
      request << "Content-Type: application/json\r\n";
    }
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}
} // namespace

std::string HttpResponse::Header(const std::string &name) const {
  auto it = headers.find(Lower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient() {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpResponse
HttpClient::Forward(const std::string &method, const std::string &url,
                    const std::map<std::string, std::string> &headers,
                    const std::string &body) const {
  return Send(method, url, body, headers);
}

std::string HttpClient::DecodeChunked(const std::string &body) {
  std::string decoded;
  std::size_t pos = 0;
  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) {
      throw std::runtime_error("truncated chunk header");
    }
    std::string size_line = body.substr(pos, line_end - pos);
    auto ext = size_line.find(';');
    if (ext != std::string::npos) {
      size_line = size_line.substr(0, ext);
    }
    std::size_t chunk_size = 0;
    try {
      chunk_size = std::stoul(Trim(size_line), nullptr, 16);
    } catch (const std::logic_error &) {
      throw std::runtime_error("invalid chunk size");
    }
    pos = line_end + 2;
    if (chunk_size == 0) {
      break;
    }
    if (pos + chunk_size > body.size()) {
      throw std::runtime_error("truncated chunk body");
    }
    decoded.append(body, pos, chunk_size);
    pos += chunk_size + 2;
  }
  return decoded;
}

HttpResponse HttpClient::ParseResponse(const std::string &raw) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    throw std::runtime_error("malformed upstream response");
  }
  std::string header = raw.substr(0, header_end);
  std::string body_str = raw.substr(header_end + 4);

  HttpResponse http_response;
  std::istringstream lines(header);
  std::string status_line;
  std::getline(lines, status_line);
  auto status_pos = status_line.find(' ');
  if (status_line.rfind("HTTP/", 0) != 0 || status_pos == std::string::npos) {
    throw std::runtime_error("malformed upstream status line");
  }
  try {
    http_response.status = std::stoi(status_line.substr(status_pos + 1));
  } catch (const std::logic_error &) {
    throw std::runtime_error("malformed upstream status code");
  }

  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    auto key = Lower(Trim(line.substr(0, colon)));
    auto value = Trim(line.substr(colon + 1));
    auto existing = http_response.headers.find(key);
    if (existing != http_response.headers.end()) {
      existing->second += ", " + value;
    } else {
      http_response.headers.emplace(std::move(key), std::move(value));
    }
  }

  if (Lower(http_response.Header("transfer-encoding")).find("chunked") !=
      std::string::npos) {
    body_str = DecodeChunked(body_str);
    http_response.headers.erase("transfer-encoding");
  }
  http_response.body = std::move(body_str);
  return http_response;
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  int sock = CreateSocket(parsed);
  auto payload = BuildRequest(parsed, method, body, headers);
  std::string response;

  auto close_socket = [&]() {
    if (sock != -1) {
      ::close(sock);
      sock = -1;
    }
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_socket();
      throw std::runtime_error("TLS not available in HttpClient");
    }
    SSL *ssl = SSL_new(ssl_ctx_);
    if (!ssl) {
      close_socket();
      throw std::runtime_error("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(ssl, parsed.host.c_str());
#endif
    SSL_set_fd(ssl, sock);
    if (SSL_connect(ssl) != 1) {
      SSL_free(ssl);
      close_socket();
      throw std::runtime_error("TLS handshake failed");
    }
    if (SSL_get_verify_result(ssl) != X509_V_OK) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
      close_socket();
      throw std::runtime_error("TLS certificate verification failed");
    }
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      int sent = SSL_write(ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        SSL_shutdown(ssl);
        SSL_free(ssl);
        close_socket();
        throw std::runtime_error("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[4096];
    int read_bytes = 0;
    while ((read_bytes = SSL_read(ssl, buffer, sizeof(buffer))) > 0) {
      response.append(buffer, buffer + read_bytes);
    }
    SSL_shutdown(ssl);
    SSL_free(ssl);
  } else {
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      ssize_t sent = ::send(sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        close_socket();
        throw std::runtime_error("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[4096];
    ssize_t read_bytes = 0;
    while ((read_bytes = ::recv(sock, buffer, sizeof(buffer), 0)) > 0) {
      response.append(buffer, buffer + read_bytes);
    }
  }

  close_socket();
  return ParseResponse(response);
}

} // namespace agentfw
