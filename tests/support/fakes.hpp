#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "internal/db/api/session_store.hpp"
#include "internal/db/memory/memory_session_store.hpp"
#include "internal/driver/browser_driver.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/notify/owner_notifier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sessionkeeper::testing {

/*
  Scriptable driver. Counts every call and remembers released handles.
*/
class FakeDriver final : public driver::BrowserDriver {
 public:
  driver::DriverHandle Spin(const std::string& target_url, std::chrono::milliseconds) override {
    ++spin_calls;
    if (spin_failures_remaining.load() > 0) {
      --spin_failures_remaining;
      throw util::DriverSpinFailure("spin refused for " + target_url);
    }
    return NextHandle();
  }

  driver::DriverHandle Resume(const std::string& resume_token, std::chrono::milliseconds) override {
    ++resume_calls;
    if (on_resume) on_resume(resume_token);
    if (resume_delay.count() > 0) std::this_thread::sleep_for(resume_delay);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failing_tokens_.count(resume_token) > 0) {
        throw util::ResumeFailure("checkpoint rejected: " + resume_token);
      }
    }
    return NextHandle();
  }

  void Release(const driver::DriverHandle& handle) noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    released_.push_back(handle.handle_id);
  }

  void FailResumeFor(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_tokens_.insert(token);
  }

  std::vector<std::string> Released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
  }

  std::size_t ReleaseCount(const std::string& handle_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 n = 0;
    for (const auto& released : released_) {
      if (released == handle_id) ++n;
    }
    return n;
  }

  std::atomic<int>          spin_calls{0};
  std::atomic<int>          resume_calls{0};
  std::atomic<int>          spin_failures_remaining{0};
  std::chrono::milliseconds resume_delay{0};

  // Runs inside Resume before it returns; tests use it to hold a resume open.
  std::function<void(const std::string&)> on_resume;

 private:
  driver::DriverHandle NextHandle() {
    const auto n = ++next_handle_;
    return driver::DriverHandle{"handle-" + std::to_string(n), "https://view.local/" + std::to_string(n)};
  }

  mutable std::mutex              mutex_;
  std::atomic<int>                next_handle_{0};
  std::unordered_set<std::string> failing_tokens_;
  std::vector<std::string>        released_;
};

class RecordingEventSink final : public events::EventSink {
 public:
  void Emit(const events::TransitionEvent& event) noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::size_t Count(events::TransitionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 n = 0;
    for (const auto& event : events_) {
      if (event.kind == kind) ++n;
    }
    return n;
  }

  std::vector<events::TransitionEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex                   mutex_;
  std::vector<events::TransitionEvent> events_;
};

struct Notification {
  std::string owner;
  std::string session_id;
  std::string reason;
};

class RecordingNotifier final : public notify::OwnerNotifier {
 public:
  void NotifyRecoveryFailed(const std::string& owner, const std::string& session_id, const std::string& reason) noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    notifications_.push_back(Notification{owner, session_id, reason});
  }

  std::vector<Notification> Notifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifications_;
  }

 private:
  mutable std::mutex        mutex_;
  std::vector<Notification> notifications_;
};

/*
  Delegating store with injectable failures. Every injected failure is
  consumed by exactly one call.
*/
class FlakyStore final : public db::SessionStore {
 public:
  explicit FlakyStore(std::shared_ptr<db::SessionStore> inner = std::make_shared<db::memory::MemorySessionStore>())
      : inner_(std::move(inner)) {
  }

  db::Result Create(const db::model::SessionRecord& record) override {
    if (create_failures > 0) {
      --create_failures;
      return db::Result::Err(failure_code, "injected create failure");
    }
    return inner_->Create(record);
  }

  db::Result UpdateStatus(const std::string& id, model::SessionStatus from, model::SessionStatus to, uint64_t at_ms) override {
    if (update_failures > 0) {
      --update_failures;
      return db::Result::Err(failure_code, "injected update failure");
    }
    ++update_calls;
    return inner_->UpdateStatus(id, from, to, at_ms);
  }

  db::Result Touch(const std::string& id, uint64_t at_ms) override {
    if (touch_failures > 0) {
      --touch_failures;
      return db::Result::Err(failure_code, "injected touch failure");
    }
    return inner_->Touch(id, at_ms);
  }

  db::Result SetResumeToken(const std::string& id, const std::string& token) override {
    return inner_->SetResumeToken(id, token);
  }

  std::optional<db::model::SessionRecord> Get(const std::string& id) override {
    if (reads_unavailable) throw util::StoreUnavailable("injected read failure");
    return inner_->Get(id);
  }

  std::vector<db::model::SessionRecord> QueryByStatus(model::SessionStatus status) override {
    if (reads_unavailable) throw util::StoreUnavailable("injected read failure");
    if (on_query) on_query(status);
    return inner_->QueryByStatus(status);
  }

  std::vector<db::model::SessionRecord> ListByOwner(const std::string& owner) override {
    if (reads_unavailable) throw util::StoreUnavailable("injected read failure");
    return inner_->ListByOwner(owner);
  }

  db::SessionStore& Inner() {
    return *inner_;
  }

  db::ErrorCode     failure_code = db::ErrorCode::Busy;
  std::atomic<int>  create_failures{0};
  std::atomic<int>  update_failures{0};
  std::atomic<int>  touch_failures{0};
  std::atomic<bool> reads_unavailable{false};
  std::atomic<int>  update_calls{0};

  // Runs before QueryByStatus delegates; used to line up racing readers.
  std::function<void(model::SessionStatus)> on_query;

 private:
  std::shared_ptr<db::SessionStore> inner_;
};

inline db::model::SessionRecord MakeRecord(const std::string& id, const std::string& owner, model::SessionStatus status,
                                           std::optional<std::string> token = std::nullopt, uint64_t at_ms = util::NowMillis()) {
  db::model::SessionRecord record;
  record.id                   = id;
  record.owner                = owner;
  record.target_url           = "https://example.test/" + id;
  record.resume_token         = std::move(token);
  record.status               = status;
  record.created_at_ms        = at_ms;
  record.last_active_at_ms    = at_ms;
  record.status_changed_at_ms = at_ms;
  return record;
}

} // namespace sessionkeeper::testing
