#include "session_server.hpp"

#include "grpc_error.hpp"

namespace sessionkeeper::grpc {

using namespace sessionkeeper::v1;

SessionServer::SessionServer(std::shared_ptr<sessionkeeper::service::SessionService> svc) : service_(std::move(svc)) {
}

::grpc::Status SessionServer::StartSession(::grpc::ServerContext*, const StartSessionRequest* req, StartSessionResponse* resp) {
  try {
    *resp = service_->StartSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::Heartbeat(::grpc::ServerContext*, const HeartbeatRequest* req, google::protobuf::Empty*) {
  try {
    service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::GetSession(::grpc::ServerContext*, const GetSessionRequest* req, GetSessionResponse* resp) {
  try {
    *resp = service_->GetSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::ListSessions(::grpc::ServerContext*, const ListSessionsRequest* req, ListSessionsResponse* resp) {
  try {
    *resp = service_->ListSessions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::UpdateResumeToken(::grpc::ServerContext*, const UpdateResumeTokenRequest* req, google::protobuf::Empty*) {
  try {
    service_->UpdateResumeToken(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SessionServer::Terminate(::grpc::ServerContext*, const TerminateRequest* req, TerminateResponse* resp) {
  try {
    *resp = service_->Terminate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sessionkeeper::grpc
