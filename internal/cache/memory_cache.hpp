#pragma once

#include <array>
#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

#include "availability_cache.hpp"
#include "internal/util/time.hpp"

namespace availability::cache {

/*
  In-process TTL cache.

  Thread-safe. Each namespace holds at most max_entries; inserting into a
  full namespace first drops expired entries, then the entry closest to
  expiry.
*/
class MemoryCache final : public AvailabilityCache {
 public:
  explicit MemoryCache(std::size_t max_entries = 10000);

  std::optional<std::string> Get(CacheNamespace ns, const std::string& key) override;
  void Set(CacheNamespace ns, const std::string& key, std::string value, std::chrono::seconds ttl) override;
  void Invalidate(CacheNamespace ns, const std::string& key) override;

  std::size_t Size(CacheNamespace ns) const;

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  using Table = std::unordered_map<std::string, Entry>;

  Table&       TableFor(CacheNamespace ns);
  const Table& TableFor(CacheNamespace ns) const;
  void         EvictOne(Table& table, util::TimePoint now);

  std::size_t              max_entries_;
  mutable std::shared_mutex mutex_;
  std::array<Table, 2>     tables_;
};

} // namespace availability::cache
