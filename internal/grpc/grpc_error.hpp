#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace availability::grpc {

/*
  Converts engine exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace availability::grpc
