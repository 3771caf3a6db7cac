#include "store/memory_kv_store.h"

#include <utility>

namespace agentfw {

namespace {
constexpr std::size_t kPurgeEvery = 1024;
}  // namespace

MemoryKvStore::MemoryKvStore()
    : clock_([] { return std::chrono::system_clock::now(); }) {}

MemoryKvStore::MemoryKvStore(Clock clock) : clock_(std::move(clock)) {}

bool MemoryKvStore::Expired(const Entry& entry,
                            std::chrono::system_clock::time_point now) const {
  return entry.expires && now >= entry.expires_at;
}

std::optional<std::string> MemoryKvStore::Get(const std::string& key) const {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end() || Expired(it->second, now)) {
    return std::nullopt;
  }
  return it->second.value;
}

void MemoryKvStore::Put(const std::string& key, const std::string& value,
                        std::chrono::seconds ttl) {
  auto now = clock_();
  Entry entry;
  entry.value = value;
  if (ttl.count() > 0) {
    entry.expires = true;
    entry.expires_at = now + ttl;
  }
  bool purge = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = std::move(entry);
    purge = ++puts_since_purge_ >= kPurgeEvery;
  }
  if (purge) {
    Purge();
  }
}

std::vector<std::string> MemoryKvStore::List(const std::string& prefix,
                                             std::size_t limit) const {
  auto now = clock_();
  std::vector<std::string> keys;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    if (Expired(it->second, now)) {
      continue;
    }
    keys.push_back(it->first);
    if (limit > 0 && keys.size() >= limit) {
      break;
    }
  }
  return keys;
}

std::size_t MemoryKvStore::Purge() {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (Expired(it->second, now)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  puts_since_purge_ = 0;
  return removed;
}

std::size_t MemoryKvStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace agentfw
