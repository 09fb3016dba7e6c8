#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/date.hpp"

namespace availability::cache {

/*
  Two logical namespaces share one backend:

    kWeek  composite week view (serialized WeekSnapshot)
    kDay   raw packed day bits (6 bytes)

  Implementations may throw on backend failure; callers go through
  SafeCache, which absorbs those errors.
*/

enum class CacheNamespace {
  kWeek,
  kDay,
};

std::string_view NamespaceName(CacheNamespace ns);

std::string WeekKey(const std::string& instructor_id, util::Date week_start);
std::string DayKey(const std::string& instructor_id, util::Date date);

class AvailabilityCache {
 public:
  virtual ~AvailabilityCache() = default;

  virtual std::optional<std::string> Get(CacheNamespace ns, const std::string& key) = 0;

  virtual void Set(CacheNamespace ns, const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

  virtual void Invalidate(CacheNamespace ns, const std::string& key) = 0;
};

} // namespace availability::cache
