#pragma once

#include <memory>
#include <string>

#include "internal/util/date.hpp"

namespace availability::core {

class AvailabilityEngine;

enum class AdmissionReason {
  kAvailable,
  // The instructor has nothing set on the requested day(s).
  kNoAvailability,
  // Some requested slot is not set.
  kSlotUnavailable,
};

struct AdmissionResult {
  bool            available = false;
  AdmissionReason reason    = AdmissionReason::kNoAvailability;
};

/*
  BookingAdmission

  Read-only gate consulted by the booking workflow right before it commits.
  A negative answer is a result, not an error; only a malformed interval
  throws (util::ValidationFailure).

  An end at or before the start (other than equal) crosses midnight and
  needs the tail of `date` plus the head of the following day.
*/
class BookingAdmission {
 public:
  explicit BookingAdmission(std::shared_ptr<const AvailabilityEngine> engine);

  AdmissionResult Check(const std::string& instructor_id, util::Date date, const std::string& start_time,
                        const std::string& end_time) const;

 private:
  std::shared_ptr<const AvailabilityEngine> engine_;
};

} // namespace availability::core
