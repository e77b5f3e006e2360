#include "session_service.hpp"

#include <stdexcept>

#include "internal/core/session_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace sessionkeeper::service {

using namespace sessionkeeper::v1;
using sessionkeeper::model::SessionStatus;

namespace {

// Rejects ids that are not canonical UUIDs before they reach the store.
std::string RequireId(const SessionID& id) {
  if (id.value().empty()) {
    throw util::InvalidArgument("session id is required");
  }
  try {
    util::FromString(id.value());
  } catch (const std::invalid_argument&) {
    throw util::InvalidArgument("malformed session id: " + id.value());
  }
  return id.value();
}

sessionkeeper::v1::SessionStatus ToProto(SessionStatus status) {
  switch (status) {
    case SessionStatus::kActive:
      return SESSION_STATUS_ACTIVE;
    case SessionStatus::kResuming:
      return SESSION_STATUS_RESUMING;
    case SessionStatus::kCompleted:
      return SESSION_STATUS_COMPLETED;
    case SessionStatus::kFailed:
      return SESSION_STATUS_FAILED;
    case SessionStatus::kAbandoned:
      return SESSION_STATUS_ABANDONED;
    default:
      return SESSION_STATUS_UNSPECIFIED;
  }
}

SessionStatus FromProto(TerminateOutcome outcome) {
  switch (outcome) {
    case TERMINATE_OUTCOME_COMPLETED:
      return SessionStatus::kCompleted;
    case TERMINATE_OUTCOME_FAILED:
      return SessionStatus::kFailed;
    default:
      throw util::InvalidArgument("terminate: outcome must be COMPLETED or FAILED");
  }
}

void ToProto(const core::SessionView& view, Session* out) {
  const auto& record = view.record;
  out->mutable_id()->set_value(record.id);
  out->set_owner(record.owner);
  out->set_target_url(record.target_url);
  if (record.resume_token) {
    out->set_resume_token(*record.resume_token);
  }
  out->set_status(ToProto(record.status));
  *out->mutable_created_at()        = util::MillisToProto(record.created_at_ms);
  *out->mutable_last_active_at()    = util::MillisToProto(record.last_active_at_ms);
  *out->mutable_status_changed_at() = util::MillisToProto(record.status_changed_at_ms);
  if (view.view_url) {
    out->set_view_url(*view.view_url);
  }
}

} // namespace

SessionService::SessionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartSessionResponse SessionService::StartSession(const StartSessionRequest& req) {
  return ObserveRpc("SessionService.StartSession", "", [&] {
    StartSessionResponse resp;
    ToProto(ctx_.manager->StartSession(req.owner(), req.target_url()), resp.mutable_session());
    return resp;
  });
}

void SessionService::Heartbeat(const HeartbeatRequest& req) {
  ObserveRpc("SessionService.Heartbeat", req.id().value(), [&] {
    ctx_.manager->Heartbeat(RequireId(req.id()));
  });
}

GetStatusResponse SessionService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("SessionService.GetStatus", req.id().value(), [&] {
    GetStatusResponse resp;
    resp.set_status(ToProto(ctx_.manager->GetStatus(RequireId(req.id()))));
    return resp;
  });
}

GetSessionResponse SessionService::GetSession(const GetSessionRequest& req) {
  return ObserveRpc("SessionService.GetSession", req.id().value(), [&] {
    GetSessionResponse resp;
    ToProto(ctx_.manager->GetSession(RequireId(req.id())), resp.mutable_session());
    return resp;
  });
}

ListSessionsResponse SessionService::ListSessions(const ListSessionsRequest& req) {
  return ObserveRpc("SessionService.ListSessions", "", [&] {
    ListSessionsResponse resp;
    for (const auto& view : ctx_.manager->ListSessions(req.owner())) {
      ToProto(view, resp.add_sessions());
    }
    return resp;
  });
}

void SessionService::UpdateResumeToken(const UpdateResumeTokenRequest& req) {
  ObserveRpc("SessionService.UpdateResumeToken", req.id().value(), [&] {
    ctx_.manager->UpdateResumeToken(RequireId(req.id()), req.resume_token());
  });
}

TerminateResponse SessionService::Terminate(const TerminateRequest& req) {
  return ObserveRpc("SessionService.Terminate", req.id().value(), [&] {
    const auto id      = RequireId(req.id());
    const auto outcome = FromProto(req.outcome());

    TerminateResponse resp;
    const auto result = ctx_.manager->Terminate(id, outcome);
    if (result == core::TerminateResult::kTerminated) {
      resp.set_status(ToProto(outcome));
    } else {
      resp.set_already_terminated(true);
      resp.set_status(ToProto(ctx_.manager->GetStatus(id)));
    }
    return resp;
  });
}

} // namespace sessionkeeper::service
