#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace sessionkeeper::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace sessionkeeper::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e) || dynamic_cast<const DriverSpinFailure*>(&e) ||
      dynamic_cast<const ResumeFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sessionkeeper::grpc
