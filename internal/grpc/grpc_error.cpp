#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace availability::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace availability::util;

  if (dynamic_cast<const ValidationFailure*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const OverlapConflict*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (const auto* conflict = dynamic_cast<const VersionConflict*>(&e)) {
    // Clients read the current token from the details to refetch.
    return {::grpc::StatusCode::ABORTED, e.what(), conflict->Current()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace availability::grpc
