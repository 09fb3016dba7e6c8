#include "booking_admission.hpp"

#include <stdexcept>

#include "internal/bitmap/bit_codec.hpp"
#include "internal/core/availability_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace availability::core {

namespace {

AdmissionResult Decide(bool any_set, bool covered) {
  AdmissionResult result;
  result.available = covered;
  if (covered) {
    result.reason = AdmissionReason::kAvailable;
  } else {
    result.reason = any_set ? AdmissionReason::kSlotUnavailable : AdmissionReason::kNoAvailability;
  }
  return result;
}

} // namespace

BookingAdmission::BookingAdmission(std::shared_ptr<const AvailabilityEngine> engine) : engine_(std::move(engine)) {
  if (!engine_) {
    throw std::invalid_argument("BookingAdmission requires an engine");
  }
}

AdmissionResult BookingAdmission::Check(const std::string& instructor_id, util::Date date, const std::string& start_time,
                                        const std::string& end_time) const {
  if (instructor_id.empty()) {
    throw util::ValidationFailure("instructor_id is required");
  }

  const int start = bitmap::ParseTimeOfDay(start_time, false);
  const int end   = bitmap::ParseTimeOfDay(end_time, true);
  if (start == end) {
    throw util::ValidationFailure("empty booking interval " + start_time + "-" + end_time);
  }

  AdmissionResult result;
  if (start < end) {
    const auto required = bitmap::WindowBits(bitmap::Window{start, end});
    const auto bits     = engine_->GetDayBits(instructor_id, date);
    result              = Decide(bits.any(), bitmap::Covers(bits, required));
  } else {
    const auto next          = date + std::chrono::days{1};
    const auto first_needed  = bitmap::WindowBits(bitmap::Window{start, bitmap::kMinutesPerDay});
    const auto first_bits    = engine_->GetDayBits(instructor_id, date);
    const auto second_needed = end == 0 ? bitmap::DayBits{} : bitmap::WindowBits(bitmap::Window{0, end});
    const auto second_bits   = engine_->GetDayBits(instructor_id, next);
    result = Decide(first_bits.any() || second_bits.any(),
                    bitmap::Covers(first_bits, first_needed) && bitmap::Covers(second_bits, second_needed));
  }

  observability::Metrics::Instance().RecordAdmission(result.available);
  AVAILABILITY_LOG_DEBUG("admission checked", {observability::StringField("instructor_id", instructor_id),
                                               observability::DateField("date", date), observability::StringField("start", start_time),
                                               observability::StringField("end", end_time),
                                               observability::BoolField("available", result.available)});
  return result;
}

} // namespace availability::core
