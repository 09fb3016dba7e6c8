#include "memory_cache.hpp"

#include <algorithm>
#include <mutex>

namespace availability::cache {

MemoryCache::MemoryCache(std::size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {
}

MemoryCache::Table& MemoryCache::TableFor(CacheNamespace ns) {
  return tables_[static_cast<std::size_t>(ns)];
}

const MemoryCache::Table& MemoryCache::TableFor(CacheNamespace ns) const {
  return tables_[static_cast<std::size_t>(ns)];
}

std::optional<std::string> MemoryCache::Get(CacheNamespace ns, const std::string& key) {
  std::shared_lock lock(mutex_);
  const auto&      table = TableFor(ns);
  auto             it    = table.find(key);
  if (it == table.end() || it->second.expires_at <= util::Now()) {
    return std::nullopt;
  }
  return it->second.value;
}

void MemoryCache::Set(CacheNamespace ns, const std::string& key, std::string value, std::chrono::seconds ttl) {
  const auto now = util::Now();

  std::unique_lock lock(mutex_);
  auto&            table = TableFor(ns);
  if (!table.contains(key) && table.size() >= max_entries_) {
    EvictOne(table, now);
  }
  table[key] = Entry{std::move(value), now + ttl};
}

void MemoryCache::Invalidate(CacheNamespace ns, const std::string& key) {
  std::unique_lock lock(mutex_);
  TableFor(ns).erase(key);
}

std::size_t MemoryCache::Size(CacheNamespace ns) const {
  std::shared_lock lock(mutex_);
  return TableFor(ns).size();
}

void MemoryCache::EvictOne(Table& table, util::TimePoint now) {
  const auto expired = std::erase_if(table, [now](const auto& entry) { return entry.second.expires_at <= now; });
  if (expired > 0 || table.empty()) {
    return;
  }

  auto oldest = std::min_element(table.begin(), table.end(),
                                 [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
  table.erase(oldest);
}

} // namespace availability::cache
