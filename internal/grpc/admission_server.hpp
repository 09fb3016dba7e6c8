#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "availability/engine/v1.hpp"
#include "internal/service/admission_service.hpp"

namespace availability::grpc {

class AdmissionServer final : public availability::engine::v1::BookingAdmissionService::Service {
 public:
  explicit AdmissionServer(std::shared_ptr<availability::service::AdmissionService> svc);

  ::grpc::Status CheckAdmission(::grpc::ServerContext*, const availability::engine::v1::CheckAdmissionRequest*,
                                availability::engine::v1::CheckAdmissionResponse*) override;

 private:
  std::shared_ptr<availability::service::AdmissionService> service_;
};

} // namespace availability::grpc
