#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace sessionkeeper::grpc {

AdminServer::AdminServer(std::shared_ptr<sessionkeeper::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RunRecovery(::grpc::ServerContext*, const sessionkeeper::v1::RunRecoveryRequest* req,
                                        sessionkeeper::v1::RunRecoveryResponse* resp) {
  try {
    *resp = service_->RunRecovery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const sessionkeeper::v1::StatsRequest* req, sessionkeeper::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sessionkeeper::grpc
