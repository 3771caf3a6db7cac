#pragma once

#include "server/notify/notifier.h"
#include "store/kv_store.h"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentfw {

// Write-once audit records in the shared store, optionally mirrored to a
// JSON-lines file. Record keys:
//   blocked:{ts}:{agent}            policy block
//   blocked:{ts}:{agent}:response   outbound redaction
//   stats:{agent}:{hour}            hourly forwarded-call counter
//   log:{ts}:{agent}                per-call usage entry
// A record whose key is already taken gets a "#2", "#3", ... suffix.
class AuditLogger {
 public:
  static constexpr std::chrono::seconds kBlockTtl{86400 * 7};
  static constexpr std::chrono::seconds kUsageTtl{86400 * 2};
  static constexpr std::size_t kMaxBodyChars = 4096;

  AuditLogger(std::shared_ptr<KeyValueStore> store,
              const std::string& mirror_path = "");

  // Alerts for policy blocks and for response redactions. Either may be null.
  void SetNotifiers(std::shared_ptr<Notifier> block_notifier,
                    std::shared_ptr<Notifier> leak_notifier);

  bool MirrorEnabled() const { return stream_.is_open(); }

  void LogBlock(const std::string& agent_id, const std::string& provider,
                const std::string& reason, const std::string& body,
                std::chrono::system_clock::time_point now);

  void LogResponseLeak(const std::string& agent_id, const std::string& provider,
                       const std::vector<std::string>& matched,
                       std::chrono::system_clock::time_point now);

  // `body` is the original request body; its "model" field is recorded.
  void LogUsage(const std::string& agent_id, const std::string& provider,
                const std::string& body,
                std::chrono::system_clock::time_point now);

  static std::string Truncate(const std::string& text,
                              std::size_t max = kMaxBodyChars);

 private:
  void Mirror(const std::string& line);
  // Writes under `key`, or the first free `key#n`.
  void PutUnique(const std::string& key, const std::string& value,
                        std::chrono::seconds ttl);

  std::shared_ptr<KeyValueStore> store_;
  std::shared_ptr<Notifier> block_notifier_;
  std::shared_ptr<Notifier> leak_notifier_;
  std::ofstream stream_;
  std::mutex mutex_;
  std::mutex keys_mutex_;
};

}  // namespace agentfw
