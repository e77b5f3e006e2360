#include "admin_service.hpp"

#include "internal/core/session_manager.hpp"
#include "internal/recovery/recovery_coordinator.hpp"
#include "internal/service/observe_rpc.hpp"

namespace sessionkeeper::service {

using namespace sessionkeeper::v1;

namespace {

void ToProto(const recovery::RecoveryReport& report, sessionkeeper::v1::RecoveryReport* out) {
  out->set_candidates(static_cast<uint32_t>(report.candidates));
  out->set_claimed(static_cast<uint32_t>(report.claimed));
  out->set_resumed(static_cast<uint32_t>(report.resumed));
  out->set_failed(static_cast<uint32_t>(report.failed));
  out->set_claims_lost(static_cast<uint32_t>(report.claims_lost));
  out->set_skipped(static_cast<uint32_t>(report.skipped));
  out->set_store_errors(static_cast<uint32_t>(report.store_errors));
  out->set_repaired(static_cast<uint32_t>(report.repaired));
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RunRecoveryResponse AdminService::RunRecovery(const RunRecoveryRequest& req) {
  return ObserveRpc("AdminService.RunRecovery", "", [&] {
    std::size_t repaired = 0;
    if (req.repair_stale()) {
      repaired = ctx_.coordinator->RepairStaleResuming();
    }
    auto report     = ctx_.coordinator->RunOnce();
    report.repaired = repaired;

    RunRecoveryResponse resp;
    ToProto(report, resp.mutable_report());
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;
    resp.set_live_sessions(ctx_.manager->LiveCount());

    const auto stats = ctx_.coordinator->Stats();
    resp.set_recovery_runs(stats.runs);
    ToProto(stats.totals, resp.mutable_recovery_totals());
    return resp;
  });
}

} // namespace sessionkeeper::service
