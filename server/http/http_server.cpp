#include "server/http/http_server.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace agentfw {

namespace {

std::string Trim(const std::string& value) {
  auto s = value.find_first_not_of(" \t");
  auto e = value.find_last_not_of(" \t\r\n");
  return (s == std::string::npos) ? "" : value.substr(s, e - s + 1);
}

ProxyResponse CorsPreflight() {
  ProxyResponse response;
  response.status = 204;
  response.headers["access-control-allow-origin"] = "*";
  response.headers["access-control-allow-methods"] =
      "GET, POST, PUT, PATCH, DELETE, OPTIONS";
  response.headers["access-control-allow-headers"] = "*";
  return response;
}

// Title-Case for the wire: "content-type" -> "Content-Type".
std::string CanonicalHeaderName(const std::string& name) {
  std::string out = name;
  bool upper = true;
  for (auto& c : out) {
    if (upper && c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
    upper = (c == '-');
  }
  return out;
}

}  // namespace

HttpServer::HttpServer(std::string host, int port, FirewallPipeline* pipeline,
                       AdminApi* admin, TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), pipeline_(pipeline), admin_(admin),
      num_workers_(num_workers > 0 ? num_workers : 4) {
  if (!tls_config.enabled) {
    return;
  }
  if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
    log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    return;
  }
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_server_method());
  if (!ssl_ctx_) {
    log::Error("http", "failed to initialize TLS context");
    return;
  }
  SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
  if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                   SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS certificate",
               "path=" + tls_config.cert_path);
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls_config.key_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS key", "path=" + tls_config.key_path);
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  } else {
    tls_enabled_ = true;
    log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Closing the listener unblocks accept() in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  addr.sin_addr.s_addr = inet_addr(host_.c_str());

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               "host=" + host_ + " port=" + std::to_string(port_) +
                   " error=" + std::strerror(errno));
    ::close(fd);
    return;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return;
  }

  server_fd_.store(fd);
  log::Info("http", "listening",
            "host=" + host_ + " port=" + std::to_string(port_) +
                " workers=" + std::to_string(num_workers_));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      break;  // Listener closed by Stop().
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL* ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

bool HttpServer::ParseRequestHead(const std::string& head,
                                  ProxyRequest* request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos || method_end == 0) {
    return false;
  }
  auto target_end = first_line.find(' ', method_end + 1);
  if (target_end == std::string::npos) {
    target_end = first_line.size();
  }
  std::string target =
      first_line.substr(method_end + 1, target_end - method_end - 1);
  if (target.empty() || target[0] != '/') {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  auto query_pos = target.find('?');
  if (query_pos == std::string::npos) {
    request->path = target;
    request->query.clear();
  } else {
    request->path = target.substr(0, query_pos);
    request->query = target.substr(query_pos + 1);
  }

  request->headers.clear();
  std::size_t pos = first_line_end == std::string::npos
                        ? head.size()
                        : first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    pos = end + 2;
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    auto name = ToLowerAscii(Trim(line.substr(0, colon)));
    auto value = Trim(line.substr(colon + 1));
    auto existing = request->headers.find(name);
    if (existing != request->headers.end()) {
      existing->second += ", " + value;
    } else {
      request->headers.emplace(std::move(name), std::move(value));
    }
  }
  return true;
}

std::string HttpServer::SerializeResponse(const ProxyResponse& response) {
  std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                    StatusText(response.status) + "\r\n";
  for (const auto& [name, value] : response.headers) {
    // Framing is ours; the body may have been rewritten.
    if (name == "content-length" || name == "transfer-encoding" ||
        name == "connection") {
      continue;
    }
    out += CanonicalHeaderName(name) + ": " + value + "\r\n";
  }
  if (response.headers.count("access-control-allow-origin") == 0) {
    out += "Access-Control-Allow-Origin: *\r\n";
  }
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  return out + response.body;
}

ProxyResponse HttpServer::Dispatch(const ProxyRequest& request) {
  if (request.method == "OPTIONS") {
    return CorsPreflight();
  }
  if (request.method == "GET" && request.path == "/healthz") {
    return AdminApi::Health();
  }
  if (AdminApi::Handles(request.path)) {
    if (!admin_) {
      return JsonError(404, "Admin API disabled", "NOT_FOUND");
    }
    return admin_->Handle(request);
  }
  if (!pipeline_) {
    return JsonError(503, "Proxy pipeline not configured", "UNAVAILABLE");
  }
  return pipeline_->Handle(request);
}

void HttpServer::HandleClient(ClientSession& session) {
  auto& metrics = GlobalMetrics();
  metrics.IncrementConnections();
  struct ConnectionGuard {
    MetricsRegistry* metrics;
    ~ConnectionGuard() { metrics->DecrementConnections(); }
  } guard{&metrics};

  auto too_large = [&] {
    SendAll(session, SerializeResponse(JsonError(413, "Request body too large",
                                                 "PAYLOAD_TOO_LARGE")));
  };

  constexpr std::size_t kInitialBuf = 4096;
  std::string raw;
  raw.resize(kInitialBuf);
  std::size_t total = 0;
  std::size_t header_end_pos = std::string::npos;

  // Phase 1: read until the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    if (total >= raw.size()) {
      if (raw.size() >= kMaxRequestBytes) {
        too_large();
        return;
      }
      raw.resize(std::min(raw.size() * 2, kMaxRequestBytes));
    }
    ssize_t bytes = Receive(session, &raw[total], raw.size() - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
    raw.resize(total);
    header_end_pos = raw.find("\r\n\r\n");
    if (header_end_pos == std::string::npos) {
      raw.resize(std::max(total + kInitialBuf, total * 2));
    }
  }

  ProxyRequest request;
  if (!ParseRequestHead(raw.substr(0, header_end_pos), &request)) {
    SendAll(session, SerializeResponse(
                         JsonError(400, "Malformed request line", "BAD_REQUEST")));
    return;
  }

  // Phase 2: read the Content-Length body.
  std::size_t content_length = 0;
  auto length_header = request.Header("content-length");
  if (!length_header.empty()) {
    try {
      content_length = std::stoull(length_header);
    } catch (const std::exception&) {
      SendAll(session, SerializeResponse(JsonError(
                           400, "Invalid Content-Length", "BAD_REQUEST")));
      return;
    }
  }
  if (content_length > kMaxRequestBytes) {
    too_large();
    return;
  }

  std::size_t body_start = header_end_pos + 4;
  std::size_t needed = body_start + content_length;
  if (needed > total) {
    raw.resize(needed);
    while (total < needed) {
      ssize_t bytes = Receive(session, &raw[total], needed - total);
      if (bytes <= 0) {
        return;
      }
      total += static_cast<std::size_t>(bytes);
    }
  }
  request.body = raw.substr(body_start, content_length);

  ProxyResponse response;
  try {
    response = Dispatch(request);
  } catch (const std::exception& ex) {
    log::Error("http", "request handling failed",
               "method=" + request.method + " path=" + request.path +
                   " error=" + ex.what());
    response = JsonError(500, "Internal error", "INTERNAL_ERROR");
  }
  if (!SendAll(session, SerializeResponse(response))) {
    log::Debug("http", "client went away before response was sent",
               "path=" + request.path);
  }
}

bool HttpServer::SendAll(ClientSession& session, const std::string& payload) {
  const char* data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession& session, char* buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession& session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

}  // namespace agentfw
