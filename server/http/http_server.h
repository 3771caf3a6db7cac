#pragma once

#include "server/http/admin_api.h"
#include "server/proxy/firewall_pipeline.h"
#include "server/proxy/proxy_types.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace agentfw {

class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  static constexpr std::size_t kMaxRequestBytes = 16 * 1024 * 1024;

  // `pipeline` and `admin` are borrowed and must outlive the server.
  HttpServer(std::string host, int port, FirewallPipeline* pipeline,
             AdminApi* admin, TlsConfig tls_config, int num_workers = 4);
  ~HttpServer();

  void Start();
  void Stop();
  bool TlsEnabled() const { return tls_enabled_; }

  // Routes one parsed request: OPTIONS preflight, /healthz, /admin/*, then
  // the firewall pipeline.
  ProxyResponse Dispatch(const ProxyRequest& request);

  // Parses "METHOD /path?query HTTP/1.1\r\nName: value..." (no trailing
  // blank line). Header names are lower-cased.
  static bool ParseRequestHead(const std::string& head, ProxyRequest* request);
  // Status line, headers, recalculated Content-Length and Connection: close.
  static std::string SerializeResponse(const ProxyResponse& response);

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession& session);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  std::string host_;
  int port_;
  FirewallPipeline* pipeline_;
  AdminApi* admin_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace agentfw
