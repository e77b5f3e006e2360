#include "internal/heartbeat/heartbeat_monitor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sessionkeeper::heartbeat {

using sessionkeeper::model::SessionStatus;

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                                   std::shared_ptr<core::SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                                   HeartbeatOptions options)
    : store_(std::move(store)),
      driver_(std::move(driver)),
      registry_(std::move(registry)),
      events_(std::move(events)),
      options_(options) {
  if (!store_ || !driver_ || !registry_ || !events_) {
    throw util::InvalidArgument("heartbeat monitor: store, driver, registry and event sink are required");
  }
  if (options_.timeout.count() <= 0) {
    throw util::InvalidArgument("heartbeat monitor: timeout must be positive");
  }
  if (options_.sweep_interval.count() <= 0 || options_.sweep_interval >= options_.timeout) {
    throw util::InvalidArgument("heartbeat monitor: sweep_interval must be positive and shorter than timeout");
  }
}

HeartbeatMonitor::~HeartbeatMonitor() {
  Stop();
}

const char* HeartbeatMonitor::ExpiryReason(const core::LiveSession& session, uint64_t now_ms) const {
  const auto timeout_ms = static_cast<uint64_t>(options_.timeout.count());
  if (now_ms > session.record.last_active_at_ms + timeout_ms) {
    return "heartbeat timeout";
  }
  const auto max_age_ms = static_cast<uint64_t>(options_.max_session_age.count());
  if (max_age_ms > 0 && now_ms > session.record.created_at_ms + max_age_ms) {
    return "max session age";
  }
  return nullptr;
}

SweepReport HeartbeatMonitor::SweepOnce(uint64_t now_ms) {
  SweepReport report;

  for (const auto& candidate : registry_->Snapshot()) {
    ++report.scanned;
    if (!ExpiryReason(candidate, now_ms)) continue;

    const auto& id   = candidate.record.id;
    auto        lock = registry_->Lock(id);

    // re-check: a heartbeat or terminate may have landed since the snapshot
    auto live = registry_->Find(id);
    if (!live) continue;
    const char* reason = ExpiryReason(*live, now_ms);
    if (!reason) continue;

    auto result = store_->UpdateStatus(id, SessionStatus::kActive, SessionStatus::kAbandoned, now_ms);
    if (result) {
      registry_->Erase(id);
      driver_->Release(live->handle);
      events_->Emit(events::TransitionEvent{events::TransitionKind::kAbandoned, id, SessionStatus::kActive,
                                            SessionStatus::kAbandoned, now_ms, reason});
      ++report.abandoned;
      continue;
    }

    if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
      // the record moved on without us; our handle is no longer authoritative
      registry_->Erase(id);
      driver_->Release(live->handle);
      SESSIONKEEPER_LOG_WARN("heartbeat sweep lost ownership", {observability::StringField("session_id", id),
                                                                observability::StringField("error", result.message)});
      ++report.claims_lost;
      continue;
    }

    ++report.store_errors;
    SESSIONKEEPER_LOG_WARN("heartbeat sweep could not abandon session; will retry",
                           {observability::StringField("session_id", id), observability::StringField("error", result.message)});
  }

  if (report.abandoned > 0 || report.claims_lost > 0 || report.store_errors > 0) {
    SESSIONKEEPER_LOG_INFO("heartbeat sweep", {observability::IntField("scanned", static_cast<int64_t>(report.scanned)),
                                               observability::IntField("abandoned", static_cast<int64_t>(report.abandoned)),
                                               observability::IntField("claims_lost", static_cast<int64_t>(report.claims_lost)),
                                               observability::IntField("store_errors", static_cast<int64_t>(report.store_errors))});
  }
  return report;
}

void HeartbeatMonitor::Start() {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (thread_.joinable()) return;
  stop_requested_ = false;
  thread_         = std::thread(&HeartbeatMonitor::Loop, this);
}

void HeartbeatMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    stop_requested_ = true;
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void HeartbeatMonitor::Loop() {
  std::unique_lock<std::mutex> lock(loop_mutex_);
  while (!stop_requested_) {
    if (loop_cv_.wait_for(lock, options_.sweep_interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    try {
      SweepOnce(util::NowMillis());
    } catch (const std::exception& e) {
      SESSIONKEEPER_LOG_ERROR("heartbeat sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace sessionkeeper::heartbeat
