#include "server/logging/audit_logger.h"

#include "server/common/timestamps.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace agentfw {

namespace {
std::string Dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JoinComma(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += values[i];
  }
  return out;
}
}  // namespace

AuditLogger::AuditLogger(std::shared_ptr<KeyValueStore> store,
                         const std::string& mirror_path)
    : store_(std::move(store)) {
  if (!mirror_path.empty()) {
    stream_.open(mirror_path, std::ios::app);
    if (!stream_.is_open()) {
      log::Warn("audit", "could not open audit mirror file", mirror_path);
    }
  }
}

void AuditLogger::SetNotifiers(std::shared_ptr<Notifier> block_notifier,
                               std::shared_ptr<Notifier> leak_notifier) {
  block_notifier_ = std::move(block_notifier);
  leak_notifier_ = std::move(leak_notifier);
}

std::string AuditLogger::Truncate(const std::string& text, std::size_t max) {
  if (text.size() <= max) {
    return text;
  }
  return text.substr(0, max) + "...[truncated]";
}

void AuditLogger::Mirror(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_.is_open()) {
    return;
  }
  stream_ << line << "\n";
  stream_.flush();
}

void AuditLogger::PutUnique(const std::string& key, const std::string& value,
                            std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(keys_mutex_);
  std::string candidate = key;
  for (int n = 2; store_->Get(candidate); ++n) {
    candidate = key + "#" + std::to_string(n);
  }
  store_->Put(candidate, value, ttl);
}

void AuditLogger::LogBlock(const std::string& agent_id,
                           const std::string& provider,
                           const std::string& reason, const std::string& body,
                           std::chrono::system_clock::time_point now) {
  auto ts = FormatIsoTimestamp(now);
  json record;
  record["timestamp"] = ts;
  record["agent_id"] = agent_id;
  record["provider"] = provider;
  record["reason"] = reason;
  record["body"] = Truncate(body);
  auto line = Dump(record);
  PutUnique("blocked:" + ts + ":" + agent_id, line, kBlockTtl);
  Mirror(line);
  log::Info("audit", "request blocked",
            "agent=" + agent_id + " provider=" + provider + " reason=" + reason);

  if (block_notifier_) {
    block_notifier_->Send("**AGENTFW BLOCK** | Agent: `" + agent_id +
                          "` | Provider: `" + provider + "` | Reason: `" +
                          reason + "` | Time: " + ts);
  }
}

void AuditLogger::LogResponseLeak(const std::string& agent_id,
                                  const std::string& provider,
                                  const std::vector<std::string>& matched,
                                  std::chrono::system_clock::time_point now) {
  auto ts = FormatIsoTimestamp(now);
  json record;
  record["timestamp"] = ts;
  record["agent_id"] = agent_id;
  record["provider"] = provider;
  record["reason"] = "response_secret_redacted";
  record["matched_patterns"] = matched;
  auto line = Dump(record);
  PutUnique("blocked:" + ts + ":" + agent_id + ":response", line, kBlockTtl);
  Mirror(line);
  log::Warn("audit", "response redacted",
            "agent=" + agent_id + " provider=" + provider +
                " patterns=" + JoinComma(matched));

  if (leak_notifier_) {
    leak_notifier_->Send("**AGENTFW RESPONSE REDACTION** | Agent: `" + agent_id +
                         "` | Provider: `" + provider + "` | Patterns: `" +
                         JoinComma(matched) + "` | Time: " + ts);
  }
}

void AuditLogger::LogUsage(const std::string& agent_id,
                           const std::string& provider, const std::string& body,
                           std::chrono::system_clock::time_point now) {
  auto stats_key = "stats:" + agent_id + ":" + HourLabel(now);
  int current = 0;
  if (auto value = store_->Get(stats_key)) {
    try {
      current = std::stoi(*value);
    } catch (const std::logic_error&) {
      current = 0;
    }
  }
  store_->Put(stats_key, std::to_string(current + 1), kUsageTtl);

  std::string model = "unknown";
  try {
    auto parsed = json::parse(body);
    if (parsed.is_object() && parsed.contains("model") &&
        parsed["model"].is_string() && !parsed["model"].get<std::string>().empty()) {
      model = parsed["model"].get<std::string>();
    }
  } catch (const json::exception&) {
    // Not JSON; model stays unknown.
  }

  auto ts = FormatIsoTimestamp(now);
  json record;
  record["timestamp"] = ts;
  record["agent_id"] = agent_id;
  record["provider"] = provider;
  record["model"] = model;
  record["status"] = "passed";
  auto line = Dump(record);
  PutUnique("log:" + ts + ":" + agent_id, line, kUsageTtl);
  Mirror(line);
}

}  // namespace agentfw
