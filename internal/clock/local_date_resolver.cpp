#include "local_date_resolver.hpp"

#include <stdexcept>

namespace availability::clock {

namespace {

// UTC-12:00 .. UTC+14:00
constexpr std::chrono::minutes kMinOffset{-12 * 60};
constexpr std::chrono::minutes kMaxOffset{14 * 60};

void CheckOffset(std::chrono::minutes offset, const std::string& who) {
  if (offset < kMinOffset || offset > kMaxOffset) {
    throw std::invalid_argument("utc offset out of range for " + who + ": " + std::to_string(offset.count()) + " minutes");
  }
}

} // namespace

FixedOffsetResolver::FixedOffsetResolver(std::chrono::minutes default_offset,
                                         std::unordered_map<std::string, std::chrono::minutes> instructor_offsets, NowFn now)
    : default_offset_(default_offset), instructor_offsets_(std::move(instructor_offsets)), now_(std::move(now)) {
  CheckOffset(default_offset_, "default");
  for (const auto& [instructor_id, offset] : instructor_offsets_) {
    CheckOffset(offset, instructor_id);
  }
  if (!now_) {
    now_ = &util::Now;
  }
}

std::chrono::minutes FixedOffsetResolver::OffsetFor(const std::string& instructor_id) const {
  auto it = instructor_offsets_.find(instructor_id);
  return it == instructor_offsets_.end() ? default_offset_ : it->second;
}

util::Date FixedOffsetResolver::Today(const std::string& instructor_id) const {
  return util::LocalDate(now_(), OffsetFor(instructor_id));
}

} // namespace availability::clock
