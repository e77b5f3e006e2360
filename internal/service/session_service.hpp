#pragma once

#include "service_context.hpp"
#include "sessionkeeper/v1/session_service.pb.h"

namespace sessionkeeper::service {

/*
  Protobuf-level facade over SessionManager. Validates wire input and
  converts between records and sessionkeeper.v1 messages.
*/
class SessionService {
 public:
  explicit SessionService(ServiceContext ctx);

  sessionkeeper::v1::StartSessionResponse StartSession(const sessionkeeper::v1::StartSessionRequest& req);

  void Heartbeat(const sessionkeeper::v1::HeartbeatRequest& req);

  sessionkeeper::v1::GetStatusResponse GetStatus(const sessionkeeper::v1::GetStatusRequest& req);

  sessionkeeper::v1::GetSessionResponse GetSession(const sessionkeeper::v1::GetSessionRequest& req);

  sessionkeeper::v1::ListSessionsResponse ListSessions(const sessionkeeper::v1::ListSessionsRequest& req);

  void UpdateResumeToken(const sessionkeeper::v1::UpdateResumeTokenRequest& req);

  sessionkeeper::v1::TerminateResponse Terminate(const sessionkeeper::v1::TerminateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sessionkeeper::service
