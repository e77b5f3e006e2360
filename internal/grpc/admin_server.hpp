#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "sessionkeeper/v1/admin_service.grpc.pb.h"

namespace sessionkeeper::grpc {

class AdminServer final : public sessionkeeper::v1::SessionAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<sessionkeeper::service::AdminService> svc);

  ::grpc::Status RunRecovery(::grpc::ServerContext*, const sessionkeeper::v1::RunRecoveryRequest*,
                             sessionkeeper::v1::RunRecoveryResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const sessionkeeper::v1::StatsRequest*, sessionkeeper::v1::StatsResponse*) override;

 private:
  std::shared_ptr<sessionkeeper::service::AdminService> service_;
};

} // namespace sessionkeeper::grpc
