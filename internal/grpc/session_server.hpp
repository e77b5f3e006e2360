#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/session_service.hpp"
#include "sessionkeeper/v1/session_service.grpc.pb.h"

namespace sessionkeeper::grpc {

class SessionServer final : public sessionkeeper::v1::SessionService::Service {
 public:
  explicit SessionServer(std::shared_ptr<sessionkeeper::service::SessionService> svc);

  ::grpc::Status StartSession(::grpc::ServerContext*, const sessionkeeper::v1::StartSessionRequest*,
                              sessionkeeper::v1::StartSessionResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const sessionkeeper::v1::HeartbeatRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*, const sessionkeeper::v1::GetStatusRequest*,
                           sessionkeeper::v1::GetStatusResponse*) override;

  ::grpc::Status GetSession(::grpc::ServerContext*, const sessionkeeper::v1::GetSessionRequest*,
                            sessionkeeper::v1::GetSessionResponse*) override;

  ::grpc::Status ListSessions(::grpc::ServerContext*, const sessionkeeper::v1::ListSessionsRequest*,
                              sessionkeeper::v1::ListSessionsResponse*) override;

  ::grpc::Status UpdateResumeToken(::grpc::ServerContext*, const sessionkeeper::v1::UpdateResumeTokenRequest*,
                                   google::protobuf::Empty*) override;

  ::grpc::Status Terminate(::grpc::ServerContext*, const sessionkeeper::v1::TerminateRequest*,
                           sessionkeeper::v1::TerminateResponse*) override;

 private:
  std::shared_ptr<sessionkeeper::service::SessionService> service_;
};

} // namespace sessionkeeper::grpc
