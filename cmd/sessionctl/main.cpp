#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "sessionkeeper/v1.hpp"

using namespace sessionkeeper::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sessionctl <addr> start <owner> <target_url>\n"
            << "  sessionctl <addr> heartbeat <session_id>\n"
            << "  sessionctl <addr> status <session_id>\n"
            << "  sessionctl <addr> get <session_id>\n"
            << "  sessionctl <addr> list <owner>\n"
            << "  sessionctl <addr> token <session_id> <resume_token>\n"
            << "  sessionctl <addr> terminate <session_id> [completed|failed]\n"
            << "  sessionctl <addr> recover [--repair-stale]\n"
            << "  sessionctl <addr> stats\n";
}

static SessionID MakeID(const std::string& s) {
  SessionID id;
  id.set_value(s);
  return id;
}

static std::string StatusName(SessionStatus status) {
  switch (status) {
    case SESSION_STATUS_ACTIVE:
      return "active";
    case SESSION_STATUS_RESUMING:
      return "resuming";
    case SESSION_STATUS_COMPLETED:
      return "completed";
    case SESSION_STATUS_FAILED:
      return "failed";
    case SESSION_STATUS_ABANDONED:
      return "abandoned";
    default:
      return "unspecified";
  }
}

static std::optional<TerminateOutcome> ParseOutcome(const std::string& value) {
  if (value == "completed") {
    return TERMINATE_OUTCOME_COMPLETED;
  }
  if (value == "failed") {
    return TERMINATE_OUTCOME_FAILED;
  }
  return std::nullopt;
}

static void PrintSession(const Session& session) {
  std::cout << "id=" << session.id().value() << " owner=" << session.owner() << " status=" << StatusName(session.status())
            << " target_url=" << session.target_url();
  if (!session.view_url().empty()) {
    std::cout << " view_url=" << session.view_url();
  }
  std::cout << "\n";
}

static void PrintReport(const RecoveryReport& report) {
  std::cout << "candidates=" << report.candidates() << "\n";
  std::cout << "claimed=" << report.claimed() << "\n";
  std::cout << "resumed=" << report.resumed() << "\n";
  std::cout << "failed=" << report.failed() << "\n";
  std::cout << "claims_lost=" << report.claims_lost() << "\n";
  std::cout << "skipped=" << report.skipped() << "\n";
  std::cout << "store_errors=" << report.store_errors() << "\n";
  std::cout << "repaired=" << report.repaired() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto session_stub = SessionService::NewStub(channel);
  auto admin_stub   = SessionAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 5) return 1;

    StartSessionRequest req;
    req.set_owner(argv[3]);
    req.set_target_url(argv[4]);

    StartSessionResponse resp;

    auto status = session_stub->StartSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "heartbeat") {
    if (argc < 4) return 1;

    HeartbeatRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    google::protobuf::Empty resp;

    auto status = session_stub->Heartbeat(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ok\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetStatusRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    GetStatusResponse resp;

    auto status = session_stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << StatusName(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetSessionRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    GetSessionResponse resp;

    auto status = session_stub->GetSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    if (resp.session().has_resume_token()) {
      std::cout << "resume_token=" << resp.session().resume_token() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 4) return 1;

    ListSessionsRequest req;
    req.set_owner(argv[3]);

    ListSessionsResponse resp;

    auto status = session_stub->ListSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& session : resp.sessions()) {
      PrintSession(session);
    }
    std::cout << "count=" << resp.sessions_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "token") {
    if (argc < 5) return 1;

    UpdateResumeTokenRequest req;
    *req.mutable_id() = MakeID(argv[3]);
    req.set_resume_token(argv[4]);

    google::protobuf::Empty resp;

    auto status = session_stub->UpdateResumeToken(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "terminate") {
    if (argc < 4) return 1;

    TerminateOutcome outcome = TERMINATE_OUTCOME_COMPLETED;
    if (argc >= 5) {
      auto parsed = ParseOutcome(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported outcome: " << argv[4] << "\n";
        return 1;
      }
      outcome = parsed.value();
    }

    TerminateRequest req;
    *req.mutable_id() = MakeID(argv[3]);
    req.set_outcome(outcome);

    TerminateResponse resp;

    auto status = session_stub->Terminate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.already_terminated()) {
      std::cout << "already terminated ";
    }
    std::cout << "status=" << StatusName(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recover") {
    RunRecoveryRequest req;
    req.set_repair_stale(argc >= 4 && std::string(argv[3]) == "--repair-stale");

    RunRecoveryResponse resp;

    auto status = admin_stub->RunRecovery(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintReport(resp.report());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "live_sessions=" << resp.live_sessions() << "\n";
    std::cout << "recovery_runs=" << resp.recovery_runs() << "\n";
    PrintReport(resp.recovery_totals());
    return 0;
  }

  Usage();
  return 1;
}
