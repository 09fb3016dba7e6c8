#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "availability_cache.hpp"

namespace availability::cache {

/*
  Nil-safe facade the engine talks to.

  - A null backend behaves as an always-missing cache.
  - Backend exceptions are logged and counted, never propagated; a failed
    Get is a miss, a failed Set or Invalidate is dropped.
*/
class SafeCache {
 public:
  SafeCache() = default;
  explicit SafeCache(std::shared_ptr<AvailabilityCache> backend);

  bool Enabled() const {
    return static_cast<bool>(backend_);
  }

  std::optional<std::string> Get(CacheNamespace ns, const std::string& key) const;
  void Set(CacheNamespace ns, const std::string& key, std::string value, std::chrono::seconds ttl) const;
  void Invalidate(CacheNamespace ns, const std::string& key) const;

 private:
  std::shared_ptr<AvailabilityCache> backend_;
};

} // namespace availability::cache
