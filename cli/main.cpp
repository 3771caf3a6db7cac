#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

std::string BuildUrl(const std::string &host, int port,
                     const std::string &path) {
  return "http://" + host + ":" + std::to_string(port) + path;
}

std::map<std::string, std::string> AdminHeaders(const std::string &admin_key) {
  std::map<std::string, std::string> headers;
  if (!admin_key.empty()) {
    headers["x-admin-key"] = admin_key;
  }
  return headers;
}

void PrintUsage() {
  std::cout << "Usage: agentfwctl <command> [options]\n"
            << "Commands:\n"
            << "  status              Check that the proxy is up\n"
            << "  kill --off|--on     Engage (--off) or release (--on) the kill switch\n"
            << "  stats               Forwarded calls per agent, last 24h\n"
            << "  blocks              Most recent block records\n"
            << "  test                Admin self-test\n"
            << "  metrics             Prometheus metrics\n"
            << "Options:\n"
            << "  --host <host>       default 127.0.0.1\n"
            << "  --port <port>       default 8787\n"
            << "  --admin-key <key>   or AGENTFW_ADMIN_KEY\n";
}

// Pretty-prints JSON bodies; anything else is echoed. Non-2xx exits 1.
int Report(const agentfw::HttpResponse &response) {
  auto parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    std::cout << response.body;
    if (!response.body.empty() && response.body.back() != '\n') {
      std::cout << "\n";
    }
  } else {
    std::cout << parsed.dump(2) << "\n";
  }
  if (response.status < 200 || response.status >= 300) {
    std::cerr << "HTTP " << response.status << "\n";
    return 1;
  }
  return 0;
}

int CmdKill(const agentfw::HttpClient &client, const std::string &url,
            const std::string &admin_key, int enabled_flag) {
  if (enabled_flag < 0) {
    std::cerr << "Usage: agentfwctl kill --off|--on\n";
    return 1;
  }
  json body = {{"enabled", enabled_flag == 1}};
  return Report(client.Post(url, body.dump(), AdminHeaders(admin_key)));
}

int CmdStats(const agentfw::HttpClient &client, const std::string &url,
             const std::string &admin_key) {
  auto response = client.Get(url, AdminHeaders(admin_key));
  auto parsed = json::parse(response.body, nullptr, false);
  if (response.status != 200 || parsed.is_discarded() ||
      !parsed.contains("stats")) {
    return Report(response);
  }
  const auto &stats = parsed["stats"];
  if (stats.empty()) {
    std::cout << "No forwarded calls in the last 24h\n";
    return 0;
  }
  for (auto it = stats.begin(); it != stats.end(); ++it) {
    std::cout << it.key() << ": " << it.value().value("total", 0) << " calls\n";
  }
  return 0;
}

int CmdBlocks(const agentfw::HttpClient &client, const std::string &url,
              const std::string &admin_key) {
  auto response = client.Get(url, AdminHeaders(admin_key));
  auto parsed = json::parse(response.body, nullptr, false);
  if (response.status != 200 || parsed.is_discarded() ||
      !parsed.contains("blocks")) {
    return Report(response);
  }
  std::cout << parsed.value("count", 0) << " block record(s)\n";
  for (const auto &block : parsed["blocks"]) {
    if (block.contains("raw")) {
      std::cout << "  " << block.value("key", std::string()) << " (unparsable)\n";
      continue;
    }
    std::cout << "  " << block.value("timestamp", std::string()) << " "
              << block.value("agent_id", std::string()) << " "
              << block.value("provider", std::string()) << " "
              << block.value("reason", std::string()) << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage();
    return 0;
  }
  std::string host = "127.0.0.1";
  int port = 8787;
  std::string admin_key;
  int enabled_flag = -1;
  if (const char *env_key = std::getenv("AGENTFW_ADMIN_KEY")) {
    admin_key = env_key;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--host" || arg == "-H") && i + 1 < argc) {
      host = argv[++i];
    } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
      try {
        port = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "Invalid port: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--admin-key" && i + 1 < argc) {
      admin_key = argv[++i];
    } else if (arg == "--on") {
      enabled_flag = 1;
    } else if (arg == "--off") {
      enabled_flag = 0;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }

  try {
    agentfw::HttpClient client;
    if (command == "status") {
      return Report(client.Get(BuildUrl(host, port, "/healthz")));
    }
    if (command == "kill") {
      return CmdKill(client, BuildUrl(host, port, "/admin/kill"), admin_key,
                     enabled_flag);
    }
    if (command == "stats") {
      return CmdStats(client, BuildUrl(host, port, "/admin/stats"), admin_key);
    }
    if (command == "blocks") {
      return CmdBlocks(client, BuildUrl(host, port, "/admin/blocks"), admin_key);
    }
    if (command == "test") {
      return Report(client.Post(BuildUrl(host, port, "/admin/test"), "{}",
                                AdminHeaders(admin_key)));
    }
    if (command == "metrics") {
      return Report(client.Get(BuildUrl(host, port, "/admin/metrics"),
                               AdminHeaders(admin_key)));
    }
  } catch (const std::exception &ex) {
    std::cerr << "Request failed: " << ex.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << command << "\n";
  PrintUsage();
  return 1;
}
