#include "admission_server.hpp"

#include "grpc_error.hpp"

namespace availability::grpc {

AdmissionServer::AdmissionServer(std::shared_ptr<availability::service::AdmissionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdmissionServer::CheckAdmission(::grpc::ServerContext*, const availability::engine::v1::CheckAdmissionRequest* req,
                                               availability::engine::v1::CheckAdmissionResponse* resp) {
  try {
    *resp = service_->CheckAdmission(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace availability::grpc
