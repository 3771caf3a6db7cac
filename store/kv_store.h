#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agentfw {

// KeyValueStore is the interface for the shared, eventually-consistent state
// every handler reads: rate counters, the kill-switch flag and audit records.
//
// Implementations give no read-modify-write atomicity. Callers read, compute
// and write back; two concurrent writers may both win with stale values.
//
// Thread safety: all methods must be safe to call concurrently.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) const = 0;

  // ttl of zero stores the value without expiry.
  virtual void Put(const std::string& key, const std::string& value,
                   std::chrono::seconds ttl) = 0;

  // Live keys starting with `prefix`, in lexicographic order. A limit of zero
  // returns every match.
  virtual std::vector<std::string> List(const std::string& prefix,
                                        std::size_t limit = 0) const = 0;

  virtual std::string Name() const = 0;
};

}  // namespace agentfw
