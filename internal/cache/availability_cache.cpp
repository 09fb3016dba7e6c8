#include "availability_cache.hpp"

namespace availability::cache {

std::string_view NamespaceName(CacheNamespace ns) {
  switch (ns) {
    case CacheNamespace::kWeek:
      return "week";
    case CacheNamespace::kDay:
      return "day";
  }
  return "unknown";
}

std::string WeekKey(const std::string& instructor_id, util::Date week_start) {
  return "avail:week:" + instructor_id + ":" + util::FormatIsoDate(week_start);
}

std::string DayKey(const std::string& instructor_id, util::Date date) {
  return "avail:day:" + instructor_id + ":" + util::FormatIsoDate(date);
}

} // namespace availability::cache
