#include "internal/core/session_manager.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/fakes.hpp"

namespace {

using sessionkeeper::core::SessionManager;
using sessionkeeper::core::SessionManagerOptions;
using sessionkeeper::core::SessionRegistry;
using sessionkeeper::core::TerminateResult;
using sessionkeeper::events::TransitionKind;
using sessionkeeper::model::SessionStatus;
using sessionkeeper::testing::FakeDriver;
using sessionkeeper::testing::FlakyStore;
using sessionkeeper::testing::MakeRecord;
using sessionkeeper::testing::RecordingEventSink;

struct Harness {
  std::shared_ptr<FlakyStore>         store    = std::make_shared<FlakyStore>();
  std::shared_ptr<FakeDriver>         driver   = std::make_shared<FakeDriver>();
  std::shared_ptr<SessionRegistry>    registry = std::make_shared<SessionRegistry>();
  std::shared_ptr<RecordingEventSink> events   = std::make_shared<RecordingEventSink>();
  std::shared_ptr<SessionManager>     manager;

  explicit Harness(SessionManagerOptions options = {}) {
    options.spin_backoff = std::chrono::milliseconds(1);
    manager              = std::make_shared<SessionManager>(store, driver, registry, events, options);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestStartSessionPersistsActiveRecord() {
  Harness h;
  auto    view = h.manager->StartSession("u1", "https://x");

  assert(sessionkeeper::util::ToString(sessionkeeper::util::FromString(view.record.id)) == view.record.id);
  assert(view.record.status == SessionStatus::kActive);
  assert(view.view_url.has_value());
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kActive);

  auto stored = h.store->Inner().Get(view.record.id);
  assert(stored.has_value());
  assert(stored->owner == "u1");
  assert(stored->target_url == "https://x");
  assert(stored->status == SessionStatus::kActive);
  assert(!stored->resume_token.has_value());
  assert(stored->created_at_ms == stored->last_active_at_ms);

  assert(h.manager->LiveCount() == 1);
  assert(h.events->Count(TransitionKind::kCreated) == 1);
}

void TestStartSessionRejectsMissingArguments() {
  Harness h;
  assert(Throws<sessionkeeper::util::InvalidArgument>([&] { h.manager->StartSession("", "https://x"); }));
  assert(Throws<sessionkeeper::util::InvalidArgument>([&] { h.manager->StartSession("u1", ""); }));
  assert(h.driver->spin_calls.load() == 0);
}

void TestSpinIsRetriedBeforeGivingUp() {
  Harness h;
  h.driver->spin_failures_remaining = 2;

  auto view = h.manager->StartSession("u1", "https://x");
  assert(h.driver->spin_calls.load() == 3);
  assert(view.record.status == SessionStatus::kActive);

  Harness failing;
  failing.driver->spin_failures_remaining = 3;
  assert(Throws<sessionkeeper::util::DriverSpinFailure>([&] { failing.manager->StartSession("u1", "https://x"); }));
  assert(failing.driver->spin_calls.load() == 3);
  assert(failing.store->Inner().ListByOwner("u1").empty());
  assert(failing.manager->LiveCount() == 0);
}

void TestCapacityLimitRejectsBeforeSpinning() {
  SessionManagerOptions options;
  options.max_sessions = 1;
  Harness h(options);

  auto first = h.manager->StartSession("u1", "https://x");
  assert(Throws<sessionkeeper::util::ResourceExhausted>([&] { h.manager->StartSession("u1", "https://y"); }));
  assert(h.driver->spin_calls.load() == 1);

  h.manager->Terminate(first.record.id, SessionStatus::kCompleted);
  auto second = h.manager->StartSession("u1", "https://y");
  assert(second.record.status == SessionStatus::kActive);
}

void TestConcurrentStartsRespectCapacity() {
  SessionManagerOptions options;
  options.max_sessions = 4;
  Harness h(options);

  std::atomic<int>         started{0};
  std::atomic<int>         rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 12; ++i) {
    threads.emplace_back([&] {
      try {
        h.manager->StartSession("u1", "https://x");
        ++started;
      } catch (const sessionkeeper::util::ResourceExhausted&) {
        ++rejected;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(started.load() == 4);
  assert(rejected.load() == 8);
  assert(h.manager->LiveCount() == 4);
}

void TestStoreFailureOnCreateReleasesHandle() {
  Harness h;
  h.store->create_failures = 1;

  assert(Throws<sessionkeeper::util::StoreUnavailable>([&] { h.manager->StartSession("u1", "https://x"); }));
  assert(h.driver->Released().size() == 1);
  assert(h.manager->LiveCount() == 0);
  assert(h.events->Count(TransitionKind::kCreated) == 0);
}

void TestHeartbeatRequiresLiveSession() {
  Harness h;
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->Heartbeat("missing"); }));

  auto view = h.manager->StartSession("u1", "https://x");
  h.manager->Heartbeat(view.record.id);
  assert(h.events->Count(TransitionKind::kHeartbeat) == 1);

  auto stored = h.store->Inner().Get(view.record.id);
  assert(stored->last_active_at_ms >= view.record.last_active_at_ms);
  assert(stored->status == SessionStatus::kActive);

  h.manager->Terminate(view.record.id, SessionStatus::kFailed);
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->Heartbeat(view.record.id); }));
}

void TestHeartbeatStoreOutageNeverTransitions() {
  Harness h;
  auto    view = h.manager->StartSession("u1", "https://x");

  h.store->touch_failures = 1;

  assert(Throws<sessionkeeper::util::StoreUnavailable>([&] { h.manager->Heartbeat(view.record.id); }));
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kActive);
  assert(h.store->Inner().Get(view.record.id)->status == SessionStatus::kActive);

  h.manager->Heartbeat(view.record.id);
}

void TestTerminateIsIdempotent() {
  Harness    h;
  auto       view   = h.manager->StartSession("u1", "https://x");
  const auto handle = h.registry->Find(view.record.id)->handle.handle_id;

  const auto first = h.manager->Terminate(view.record.id, SessionStatus::kCompleted);
  assert(first == TerminateResult::kTerminated);
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kCompleted);
  assert(h.driver->ReleaseCount(handle) == 1);
  assert(h.events->Count(TransitionKind::kCompleted) == 1);

  const auto second = h.manager->Terminate(view.record.id, SessionStatus::kFailed);
  assert(second == TerminateResult::kAlreadyTerminated);
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kCompleted);
  assert(h.driver->ReleaseCount(handle) == 1);
  assert(h.events->Count(TransitionKind::kFailed) == 0);
}

void TestTerminateValidatesInput() {
  Harness h;
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->Terminate("missing", SessionStatus::kCompleted); }));

  auto view = h.manager->StartSession("u1", "https://x");
  assert(Throws<sessionkeeper::util::InvalidArgument>([&] { h.manager->Terminate(view.record.id, SessionStatus::kAbandoned); }));
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kActive);
}

void TestTerminateDuringRecoveryIsRejected() {
  Harness h;
  auto    created = h.store->Inner().Create(MakeRecord("s-resuming", "u1", SessionStatus::kResuming, std::string("ckpt")));
  assert(created);

  assert(Throws<sessionkeeper::util::InvalidState>([&] { h.manager->Terminate("s-resuming", SessionStatus::kCompleted); }));
  assert(h.store->Inner().Get("s-resuming")->status == SessionStatus::kResuming);
}

void TestTerminateDropsHandleOfSessionEndedElsewhere() {
  Harness    h;
  auto       view   = h.manager->StartSession("u1", "https://x");
  const auto handle = h.registry->Find(view.record.id)->handle.handle_id;

  auto moved = h.store->Inner().UpdateStatus(view.record.id, SessionStatus::kActive, SessionStatus::kAbandoned, 1);
  assert(moved);

  const auto result = h.manager->Terminate(view.record.id, SessionStatus::kCompleted);
  assert(result == TerminateResult::kAlreadyTerminated);
  assert(h.driver->ReleaseCount(handle) == 1);
  assert(h.manager->LiveCount() == 0);
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kAbandoned);
}

void TestUpdateResumeToken() {
  Harness h;
  auto    view = h.manager->StartSession("u1", "https://x");

  h.manager->UpdateResumeToken(view.record.id, "ckpt-1");
  assert(h.store->Inner().Get(view.record.id)->resume_token == std::optional<std::string>("ckpt-1"));
  assert(h.manager->GetSession(view.record.id).record.resume_token == std::optional<std::string>("ckpt-1"));

  assert(Throws<sessionkeeper::util::InvalidArgument>([&] { h.manager->UpdateResumeToken(view.record.id, ""); }));
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->UpdateResumeToken("missing", "ckpt-2"); }));
}

void TestStatusFallsBackToStore() {
  Harness h;
  auto    created = h.store->Inner().Create(MakeRecord("s-old", "u1", SessionStatus::kFailed));
  assert(created);

  assert(h.manager->GetStatus("s-old") == SessionStatus::kFailed);
  assert(!h.manager->GetSession("s-old").view_url.has_value());
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->GetStatus("missing"); }));
  assert(Throws<sessionkeeper::util::NotFound>([&] { h.manager->GetSession("missing"); }));
}

void TestListSessionsOverlaysLiveState() {
  Harness h;
  auto    created = h.store->Inner().Create(MakeRecord("s-old", "u1", SessionStatus::kAbandoned, std::nullopt, 1));
  assert(created);
  auto live = h.manager->StartSession("u1", "https://x");
  h.manager->StartSession("u2", "https://y");

  auto sessions = h.manager->ListSessions("u1");
  assert(sessions.size() == 2);
  assert(sessions[0].record.id == "s-old");
  assert(!sessions[0].view_url.has_value());
  assert(sessions[1].record.id == live.record.id);
  assert(sessions[1].view_url == live.view_url);

  assert(Throws<sessionkeeper::util::InvalidArgument>([&] { h.manager->ListSessions(""); }));
}

} // namespace

int main() {
  TestStartSessionPersistsActiveRecord();
  TestStartSessionRejectsMissingArguments();
  TestSpinIsRetriedBeforeGivingUp();
  TestCapacityLimitRejectsBeforeSpinning();
  TestConcurrentStartsRespectCapacity();
  TestStoreFailureOnCreateReleasesHandle();
  TestHeartbeatRequiresLiveSession();
  TestHeartbeatStoreOutageNeverTransitions();
  TestTerminateIsIdempotent();
  TestTerminateValidatesInput();
  TestTerminateDuringRecoveryIsRejected();
  TestTerminateDropsHandleOfSessionEndedElsewhere();
  TestUpdateResumeToken();
  TestStatusFallsBackToStore();
  TestListSessionsOverlaysLiveState();

  std::cout << "sessionkeeper_unit_session_manager: pass\n";
  return 0;
}
