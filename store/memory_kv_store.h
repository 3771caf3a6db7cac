#pragma once

#include "store/kv_store.h"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace agentfw {

class MemoryKvStore : public KeyValueStore {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  MemoryKvStore();
  explicit MemoryKvStore(Clock clock);

  std::optional<std::string> Get(const std::string& key) const override;
  void Put(const std::string& key, const std::string& value,
           std::chrono::seconds ttl) override;
  std::vector<std::string> List(const std::string& prefix,
                                std::size_t limit = 0) const override;
  std::string Name() const override { return "memory"; }

  // Drops every expired entry. Reads already hide them; this only frees memory.
  std::size_t Purge();
  std::size_t Size() const;

 private:
  struct Entry {
    std::string value;
    std::chrono::system_clock::time_point expires_at;
    bool expires{false};
  };

  bool Expired(const Entry& entry,
               std::chrono::system_clock::time_point now) const;

  Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  std::size_t puts_since_purge_{0};
};

}  // namespace agentfw
