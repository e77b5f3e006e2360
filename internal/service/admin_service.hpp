#pragma once

#include "service_context.hpp"
#include "sessionkeeper/v1/admin_service.pb.h"

namespace sessionkeeper::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  sessionkeeper::v1::RunRecoveryResponse RunRecovery(const sessionkeeper::v1::RunRecoveryRequest& req);

  sessionkeeper::v1::StatsResponse Stats(const sessionkeeper::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sessionkeeper::service
