#pragma once

#include "availability/engine/v1.hpp"
#include "service_context.hpp"

namespace availability::service {

class AdmissionService {
 public:
  explicit AdmissionService(ServiceContext ctx);

  availability::engine::v1::CheckAdmissionResponse CheckAdmission(const availability::engine::v1::CheckAdmissionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace availability::service
