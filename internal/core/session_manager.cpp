#include "internal/core/session_manager.hpp"

#include <algorithm>

#include "internal/core/store_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace sessionkeeper::core {

using sessionkeeper::model::SessionStatus;

namespace {

// Releases the capacity reservation taken by StartSession on every exit path.
class PendingStart {
 public:
  PendingStart(std::mutex& mutex, std::size_t& pending) : mutex_(mutex), pending_(pending) {
  }
  ~PendingStart() {
    std::lock_guard<std::mutex> lock(mutex_);
    --pending_;
  }

  PendingStart(const PendingStart&)            = delete;
  PendingStart& operator=(const PendingStart&) = delete;

 private:
  std::mutex&  mutex_;
  std::size_t& pending_;
};

events::TransitionEvent MakeEvent(events::TransitionKind kind, const std::string& id, SessionStatus from, SessionStatus to,
                                  uint64_t at_ms) {
  return events::TransitionEvent{kind, id, from, to, at_ms, {}};
}

} // namespace

SessionManager::SessionManager(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                               std::shared_ptr<SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                               SessionManagerOptions options)
    : store_(std::move(store)),
      driver_(std::move(driver)),
      registry_(std::move(registry)),
      events_(std::move(events)),
      options_(options) {
  if (!store_ || !driver_ || !registry_ || !events_) {
    throw util::InvalidArgument("session manager: store, driver, registry and event sink are required");
  }
  options_.spin_attempts = std::max(1, options_.spin_attempts);
}

driver::DriverHandle SessionManager::SpinWithRetry(const std::string& target_url) {
  util::Backoff backoff(options_.spin_backoff, options_.spin_backoff * 8);
  std::string   last_error;

  for (int attempt = 1; attempt <= options_.spin_attempts; ++attempt) {
    try {
      return driver_->Spin(target_url, options_.spin_timeout);
    } catch (const util::DriverSpinFailure& e) {
      last_error = e.what();
      SESSIONKEEPER_LOG_WARN("driver spin attempt failed", {observability::IntField("attempt", attempt),
                                                            observability::IntField("max_attempts", options_.spin_attempts),
                                                            observability::StringField("error", last_error)});
    }
    if (attempt < options_.spin_attempts) {
      backoff.Wait();
    }
  }

  throw util::DriverSpinFailure("start session: driver spin failed after " + std::to_string(options_.spin_attempts) +
                                " attempts: " + last_error);
}

SessionView SessionManager::StartSession(const std::string& owner, const std::string& target_url) {
  if (owner.empty()) throw util::InvalidArgument("start session: owner is required");
  if (target_url.empty()) throw util::InvalidArgument("start session: target_url is required");

  {
    std::lock_guard<std::mutex> lock(capacity_mutex_);
    if (options_.max_sessions > 0 && registry_->Size() + pending_starts_ >= options_.max_sessions) {
      throw util::ResourceExhausted("start session: maximum of " + std::to_string(options_.max_sessions) +
                                    " concurrent sessions reached");
    }
    ++pending_starts_;
  }
  PendingStart reservation(capacity_mutex_, pending_starts_);

  auto handle = SpinWithRetry(target_url);

  const auto now = util::NowMillis();

  db::model::SessionRecord record;
  record.id                   = util::GenerateSessionId();
  record.owner                = owner;
  record.target_url           = target_url;
  record.status               = SessionStatus::kActive;
  record.created_at_ms        = now;
  record.last_active_at_ms    = now;
  record.status_changed_at_ms = now;

  auto lock   = registry_->Lock(record.id);
  auto result = store_->Create(record);
  if (!result) {
    // no record means nobody will ever reclaim this browser
    driver_->Release(handle);
    ThrowIfStoreError(result, "start session");
  }

  registry_->Put(LiveSession{record, handle});
  events_->Emit(MakeEvent(events::TransitionKind::kCreated, record.id, SessionStatus::kUnspecified, SessionStatus::kActive, now));

  SESSIONKEEPER_LOG_INFO("session started", {observability::StringField("session_id", record.id),
                                             observability::StringField("owner", owner)});
  return SessionView{record, handle.view_url};
}

void SessionManager::Heartbeat(const std::string& id) {
  auto lock = registry_->Lock(id);
  if (!registry_->Contains(id)) {
    throw util::NotFound("heartbeat: session not live in this process: " + id);
  }

  const auto now = util::NowMillis();
  registry_->Touch(id, now);
  ThrowIfStoreError(store_->Touch(id, now), "heartbeat");

  events_->Emit(MakeEvent(events::TransitionKind::kHeartbeat, id, SessionStatus::kActive, SessionStatus::kActive, now));
}

void SessionManager::UpdateResumeToken(const std::string& id, const std::string& token) {
  if (token.empty()) throw util::InvalidArgument("update resume token: token is required");

  auto lock = registry_->Lock(id);
  if (!registry_->SetResumeToken(id, token)) {
    throw util::NotFound("update resume token: session not live in this process: " + id);
  }

  auto result = store_->SetResumeToken(id, token);
  if (!result) {
    SESSIONKEEPER_LOG_WARN("resume token not persisted", {observability::StringField("session_id", id),
                                                          observability::StringField("error", result.message)});
  }
}

SessionStatus SessionManager::GetStatus(const std::string& id) {
  if (registry_->Contains(id)) {
    return SessionStatus::kActive;
  }
  auto record = store_->Get(id);
  if (!record) throw util::NotFound("get status: session not found: " + id);
  return record->status;
}

SessionView SessionManager::GetSession(const std::string& id) {
  if (auto live = registry_->Find(id)) {
    return SessionView{live->record, live->handle.view_url};
  }
  auto record = store_->Get(id);
  if (!record) throw util::NotFound("get session: session not found: " + id);
  return SessionView{*record, std::nullopt};
}

std::vector<SessionView> SessionManager::ListSessions(const std::string& owner) {
  if (owner.empty()) throw util::InvalidArgument("list sessions: owner is required");

  std::vector<SessionView> out;
  for (auto& record : store_->ListByOwner(owner)) {
    SessionView view{std::move(record), std::nullopt};
    if (auto live = registry_->Find(view.record.id)) {
      view.record.last_active_at_ms = std::max(view.record.last_active_at_ms, live->record.last_active_at_ms);
      view.record.resume_token      = live->record.resume_token;
      view.view_url                 = live->handle.view_url;
    }
    out.push_back(std::move(view));
  }
  return out;
}

TerminateResult SessionManager::Terminate(const std::string& id, SessionStatus outcome) {
  if (outcome != SessionStatus::kCompleted && outcome != SessionStatus::kFailed) {
    throw util::InvalidArgument("terminate: outcome must be completed or failed");
  }

  auto       lock   = registry_->Lock(id);
  const auto now    = util::NowMillis();
  auto       result = store_->UpdateStatus(id, SessionStatus::kActive, outcome, now);

  if (result) {
    // the record is terminal before the browser goes away
    if (auto live = registry_->Erase(id)) {
      driver_->Release(live->handle);
    }
    const auto kind = outcome == SessionStatus::kCompleted ? events::TransitionKind::kCompleted : events::TransitionKind::kFailed;
    events_->Emit(MakeEvent(kind, id, SessionStatus::kActive, outcome, now));
    return TerminateResult::kTerminated;
  }

  if (result.code != db::ErrorCode::Conflict) {
    ThrowIfStoreError(result, "terminate");
  }

  auto record = store_->Get(id);
  if (!record) throw util::NotFound("terminate: session not found: " + id);

  if (model::IsTerminal(record->status)) {
    if (auto stale = registry_->Erase(id)) {
      SESSIONKEEPER_LOG_WARN("dropping local handle of a session terminated elsewhere",
                             {observability::StringField("session_id", id),
                              observability::StringField("status", model::ToString(record->status))});
      driver_->Release(stale->handle);
    }
    return TerminateResult::kAlreadyTerminated;
  }

  throw util::InvalidState("terminate: session " + id + " is " + std::string(model::ToString(record->status)) +
                           "; retry once recovery settles");
}

std::size_t SessionManager::LiveCount() const {
  return registry_->Size();
}

} // namespace sessionkeeper::core
