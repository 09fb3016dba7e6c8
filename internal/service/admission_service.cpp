#include "admission_service.hpp"

#include <stdexcept>

#include "internal/core/booking_admission.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/date.hpp"

namespace availability::service {

using namespace availability::engine::v1;

namespace {

AdmissionReason ToProto(core::AdmissionReason reason) {
  switch (reason) {
    case core::AdmissionReason::kAvailable:
      return ADMISSION_REASON_AVAILABLE;
    case core::AdmissionReason::kNoAvailability:
      return ADMISSION_REASON_NO_AVAILABILITY;
    case core::AdmissionReason::kSlotUnavailable:
      return ADMISSION_REASON_SLOT_UNAVAILABLE;
  }
  return ADMISSION_REASON_UNSPECIFIED;
}

} // namespace

AdmissionService::AdmissionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.admission) {
    throw std::invalid_argument("AdmissionService requires a booking admission check");
  }
}

CheckAdmissionResponse AdmissionService::CheckAdmission(const CheckAdmissionRequest& req) {
  return ObserveRpc("BookingAdmissionService.CheckAdmission", req.instructor_id(), [&] {
    const auto result =
        ctx_.admission->Check(req.instructor_id(), util::ParseIsoDate(req.date()), req.start_time(), req.end_time());

    CheckAdmissionResponse resp;
    resp.set_available(result.available);
    resp.set_reason(ToProto(result.reason));
    return resp;
  });
}

} // namespace availability::service
