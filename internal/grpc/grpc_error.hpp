#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace sessionkeeper::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Retryable conditions (store or driver unavailable) map to UNAVAILABLE so
  clients can back off and retry.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace sessionkeeper::grpc
