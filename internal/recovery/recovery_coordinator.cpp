#include "internal/recovery/recovery_coordinator.hpp"

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recovery/recovery_queue.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sessionkeeper::recovery {

using sessionkeeper::model::SessionStatus;

namespace {

bool IsLostPrecondition(const db::Result& result) {
  return result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound;
}

int64_t AsInt(std::size_t value) {
  return static_cast<int64_t>(value);
}

} // namespace

RecoveryReport& RecoveryReport::operator+=(const RecoveryReport& other) {
  candidates += other.candidates;
  claimed += other.claimed;
  resumed += other.resumed;
  failed += other.failed;
  claims_lost += other.claims_lost;
  skipped += other.skipped;
  store_errors += other.store_errors;
  repaired += other.repaired;
  return *this;
}

RecoveryCoordinator::RecoveryCoordinator(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                                         std::shared_ptr<core::SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                                         std::shared_ptr<notify::OwnerNotifier> notifier, RecoveryOptions options)
    : store_(std::move(store)),
      driver_(std::move(driver)),
      registry_(std::move(registry)),
      events_(std::move(events)),
      notifier_(std::move(notifier)),
      options_(options) {
  if (!store_ || !driver_ || !registry_ || !events_ || !notifier_) {
    throw util::InvalidArgument("recovery coordinator: store, driver, registry, event sink and notifier are required");
  }
  if (options_.parallelism == 0) {
    throw util::InvalidArgument("recovery coordinator: parallelism must be at least 1");
  }
  if (options_.resume_timeout.count() <= 0) {
    throw util::InvalidArgument("recovery coordinator: resume_timeout must be positive");
  }
  if (options_.interval.count() > 0 && options_.min_idle.count() <= 0) {
    throw util::InvalidArgument("recovery coordinator: periodic recovery requires a positive min_idle");
  }
  if (options_.stale_resuming_after.count() > 0 && options_.stale_resuming_after <= options_.resume_timeout) {
    throw util::InvalidArgument("recovery coordinator: stale_resuming_after must exceed resume_timeout");
  }
  options_.write_retry_attempts = std::max(1, options_.write_retry_attempts);
}

RecoveryCoordinator::~RecoveryCoordinator() {
  Stop();
}

db::Result RecoveryCoordinator::WriteWithRetry(const std::function<db::Result()>& write) const {
  util::Backoff backoff(options_.write_retry_backoff, options_.write_retry_backoff * 8);
  for (int attempt = 1;; ++attempt) {
    auto result = write();
    if (result || !db::IsRetryable(result.code) || attempt >= options_.write_retry_attempts) {
      return result;
    }
    backoff.Wait();
  }
}

RecoveryReport RecoveryCoordinator::RunOnce() {
  std::lock_guard<std::mutex> run_lock(run_mutex_);
  observability::SpanScope    span("recovery.run");

  RecoveryReport report;
  const auto     now      = util::NowMillis();
  const auto     min_idle = static_cast<uint64_t>(options_.min_idle.count());

  std::vector<db::model::SessionRecord> candidates;
  for (auto& record : store_->QueryByStatus(SessionStatus::kActive)) {
    if (registry_->Contains(record.id)) {
      ++report.skipped;
      continue;
    }
    if (min_idle > 0 && record.last_active_at_ms + min_idle > now) {
      ++report.skipped;
      continue;
    }
    candidates.push_back(std::move(record));
  }
  report.candidates = candidates.size();

  if (!candidates.empty()) {
    RecoveryQueue queue;
    for (auto& record : candidates) {
      queue.Enqueue(RecoveryTask{std::move(record)});
    }
    queue.Shutdown();

    const auto                  workers = std::min(options_.parallelism, report.candidates);
    std::vector<RecoveryReport> partials(workers);
    std::vector<std::thread>    threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back([this, &queue, &span, &partial = partials[i]] {
        while (auto task = queue.Dequeue()) {
          try {
            Attempt(task->record, partial, span);
          } catch (const std::exception& e) {
            ++partial.store_errors;
            SESSIONKEEPER_LOG_ERROR("recovery attempt aborted", {observability::StringField("session_id", task->record.id),
                                                                 observability::StringField("error", e.what())});
          }
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    for (const auto& partial : partials) {
      report += partial;
    }
  }

  span.SetAttribute("candidates", AsInt(report.candidates));
  span.SetAttribute("resumed", AsInt(report.resumed));
  span.SetAttribute("failed", AsInt(report.failed));

  SESSIONKEEPER_LOG_INFO("recovery run finished",
                         {observability::IntField("candidates", AsInt(report.candidates)),
                          observability::IntField("claimed", AsInt(report.claimed)),
                          observability::IntField("resumed", AsInt(report.resumed)), observability::IntField("failed", AsInt(report.failed)),
                          observability::IntField("claims_lost", AsInt(report.claims_lost)),
                          observability::IntField("skipped", AsInt(report.skipped)),
                          observability::IntField("store_errors", AsInt(report.store_errors))});

  Accumulate(report, true);
  return report;
}

void RecoveryCoordinator::Attempt(const db::model::SessionRecord& candidate, RecoveryReport& report, observability::SpanScope& span) {
  const auto& id   = candidate.id;
  auto        lock = registry_->Lock(id);

  // another pass in this process may have resumed it meanwhile
  if (registry_->Contains(id)) {
    ++report.skipped;
    return;
  }

  const auto claimed_at = util::NowMillis();
  auto       claim      = store_->UpdateStatus(id, SessionStatus::kActive, SessionStatus::kResuming, claimed_at);
  if (!claim) {
    if (IsLostPrecondition(claim)) {
      ++report.claims_lost;
      span.AddSessionEvent("claim.lost", id);
    } else {
      ++report.store_errors;
      SESSIONKEEPER_LOG_WARN("recovery claim failed", {observability::StringField("session_id", id),
                                                       observability::StringField("error", claim.message)});
    }
    return;
  }

  ++report.claimed;
  span.AddSessionEvent("claim.won", id);
  events_->Emit(events::TransitionEvent{events::TransitionKind::kResumeClaimed, id, SessionStatus::kActive, SessionStatus::kResuming,
                                        claimed_at, {}});

  auto record                 = candidate;
  record.status               = SessionStatus::kResuming;
  record.status_changed_at_ms = claimed_at;

  const auto max_age_ms = static_cast<uint64_t>(options_.max_recovery_age.count());
  if (!record.resume_token || record.resume_token->empty()) {
    FailClaimed(record, "no resume token", report);
    return;
  }
  if (max_age_ms > 0 && claimed_at > record.created_at_ms + max_age_ms) {
    FailClaimed(record, "older than max recovery age", report);
    return;
  }

  driver::DriverHandle handle;
  std::string          failure;
  const auto           started = std::chrono::steady_clock::now();
  try {
    handle = driver_->Resume(*record.resume_token, options_.resume_timeout);
  } catch (const std::exception& e) {
    failure = e.what();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  if (failure.empty() && !handle.Valid()) {
    failure = "driver returned an empty handle";
  }
  if (failure.empty() && elapsed > options_.resume_timeout) {
    // a handle arriving after the deadline is not trusted
    driver_->Release(handle);
    failure = "resume deadline exceeded";
  }
  observability::Metrics::Instance().ObserveResumeDurationMs(failure.empty() ? "resumed" : "failed", static_cast<double>(elapsed.count()));

  if (!failure.empty()) {
    span.AddSessionEvent("resume.failed", id);
    FailClaimed(record, failure, report);
    return;
  }

  const auto resumed_at = util::NowMillis();
  auto       settle     = WriteWithRetry([&] {
    return store_->UpdateStatus(id, SessionStatus::kResuming, SessionStatus::kActive, resumed_at);
  });
  if (!settle) {
    driver_->Release(handle);
    if (IsLostPrecondition(settle)) {
      ++report.claims_lost;
      span.AddSessionEvent("settle.lost", id);
      SESSIONKEEPER_LOG_WARN("resumed session was claimed by someone else; discarding handle",
                             {observability::StringField("session_id", id)});
    } else {
      ++report.store_errors;
      SESSIONKEEPER_LOG_ERROR("could not settle resumed session; left for stale repair",
                              {observability::StringField("session_id", id), observability::StringField("error", settle.message)});
    }
    return;
  }

  record.status               = SessionStatus::kActive;
  record.status_changed_at_ms = resumed_at;
  record.last_active_at_ms    = std::max(record.last_active_at_ms, resumed_at);
  registry_->Put(core::LiveSession{record, handle});

  auto touched = WriteWithRetry([&] {
    return store_->Touch(id, resumed_at);
  });
  if (!touched) {
    SESSIONKEEPER_LOG_WARN("resumed session not touched", {observability::StringField("session_id", id),
                                                           observability::StringField("error", touched.message)});
  }

  ++report.resumed;
  span.AddSessionEvent("resumed", id);
  events_->Emit(events::TransitionEvent{events::TransitionKind::kResumed, id, SessionStatus::kResuming, SessionStatus::kActive,
                                        resumed_at, {}});
}

void RecoveryCoordinator::FailClaimed(const db::model::SessionRecord& record, const std::string& reason, RecoveryReport& report) {
  const auto failed_at = util::NowMillis();
  auto       result    = WriteWithRetry([&] {
    return store_->UpdateStatus(record.id, SessionStatus::kResuming, SessionStatus::kFailed, failed_at);
  });

  if (!result) {
    if (IsLostPrecondition(result)) {
      ++report.claims_lost;
    } else {
      ++report.store_errors;
      SESSIONKEEPER_LOG_ERROR("could not fail claimed session; left for stale repair",
                              {observability::StringField("session_id", record.id),
                               observability::StringField("error", result.message)});
    }
    return;
  }

  ++report.failed;
  events_->Emit(events::TransitionEvent{events::TransitionKind::kResumeFailed, record.id, SessionStatus::kResuming,
                                        SessionStatus::kFailed, failed_at, reason});
  notifier_->NotifyRecoveryFailed(record.owner, record.id, reason);
}

std::size_t RecoveryCoordinator::RepairStaleResuming() {
  const auto stale_ms = static_cast<uint64_t>(options_.stale_resuming_after.count());
  if (stale_ms == 0) return 0;

  std::lock_guard<std::mutex> run_lock(run_mutex_);
  observability::SpanScope    span("recovery.repair_stale");
  const auto                  now = util::NowMillis();

  RecoveryReport report;
  for (const auto& record : store_->QueryByStatus(SessionStatus::kResuming)) {
    if (record.status_changed_at_ms + stale_ms >= now) continue;

    // waits out an attempt of this process still holding the claim
    auto lock = registry_->Lock(record.id);
    auto result = store_->UpdateStatus(record.id, SessionStatus::kResuming, SessionStatus::kFailed, now);
    if (!result) {
      if (!IsLostPrecondition(result)) {
        ++report.store_errors;
        SESSIONKEEPER_LOG_WARN("stale resuming repair failed", {observability::StringField("session_id", record.id),
                                                                observability::StringField("error", result.message)});
      }
      continue;
    }

    ++report.repaired;
    span.AddSessionEvent("repaired", record.id);
    events_->Emit(events::TransitionEvent{events::TransitionKind::kResumeFailed, record.id, SessionStatus::kResuming,
                                          SessionStatus::kFailed, now, "stale resuming claim"});
    notifier_->NotifyRecoveryFailed(record.owner, record.id, "recovery did not finish");
  }

  span.SetAttribute("repaired", AsInt(report.repaired));
  if (report.repaired > 0 || report.store_errors > 0) {
    SESSIONKEEPER_LOG_INFO("stale resuming repair", {observability::IntField("repaired", AsInt(report.repaired)),
                                                     observability::IntField("store_errors", AsInt(report.store_errors))});
  }
  Accumulate(report, false);
  return report.repaired;
}

void RecoveryCoordinator::Accumulate(const RecoveryReport& report, bool completed_run) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (completed_run) ++stats_.runs;
  stats_.totals += report;
}

RecoveryStats RecoveryCoordinator::Stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void RecoveryCoordinator::Start() {
  if (options_.interval.count() <= 0) {
    SESSIONKEEPER_LOG_INFO("periodic recovery disabled");
    return;
  }
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (thread_.joinable()) return;
  stop_requested_ = false;
  thread_         = std::thread(&RecoveryCoordinator::Loop, this);
}

void RecoveryCoordinator::Stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    stop_requested_ = true;
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RecoveryCoordinator::Loop() {
  std::unique_lock<std::mutex> lock(loop_mutex_);
  while (!stop_requested_) {
    if (loop_cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    try {
      RepairStaleResuming();
      RunOnce();
    } catch (const std::exception& e) {
      SESSIONKEEPER_LOG_ERROR("periodic recovery failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace sessionkeeper::recovery
