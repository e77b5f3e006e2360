#include "internal/heartbeat/heartbeat_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/core/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/fakes.hpp"

namespace {

using sessionkeeper::core::SessionManager;
using sessionkeeper::core::SessionRegistry;
using sessionkeeper::events::TransitionKind;
using sessionkeeper::heartbeat::HeartbeatMonitor;
using sessionkeeper::heartbeat::HeartbeatOptions;
using sessionkeeper::model::SessionStatus;
using sessionkeeper::testing::FakeDriver;
using sessionkeeper::testing::FlakyStore;
using sessionkeeper::testing::MakeRecord;
using sessionkeeper::testing::RecordingEventSink;

constexpr uint64_t kTimeoutMs = 60000;

struct Harness {
  std::shared_ptr<FlakyStore>         store    = std::make_shared<FlakyStore>();
  std::shared_ptr<FakeDriver>         driver   = std::make_shared<FakeDriver>();
  std::shared_ptr<SessionRegistry>    registry = std::make_shared<SessionRegistry>();
  std::shared_ptr<RecordingEventSink> events   = std::make_shared<RecordingEventSink>();
  std::shared_ptr<SessionManager>     manager  = std::make_shared<SessionManager>(store, driver, registry, events);
  std::shared_ptr<HeartbeatMonitor>   monitor;

  explicit Harness(HeartbeatOptions options = {}) {
    monitor = std::make_shared<HeartbeatMonitor>(store, driver, registry, events, options);
  }

  std::string HandleOf(const std::string& id) const {
    return registry->Find(id)->handle.handle_id;
  }
};

void TestSilentSessionIsAbandonedAndReleasedOnce() {
  Harness    h;
  auto       view   = h.manager->StartSession("u1", "https://x");
  const auto handle = h.HandleOf(view.record.id);
  const auto late   = view.record.last_active_at_ms + kTimeoutMs + 1;

  auto report = h.monitor->SweepOnce(late);
  assert(report.scanned == 1);
  assert(report.abandoned == 1);
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kAbandoned);
  assert(h.driver->ReleaseCount(handle) == 1);
  assert(h.events->Count(TransitionKind::kAbandoned) == 1);

  auto again = h.monitor->SweepOnce(late + kTimeoutMs);
  assert(again.scanned == 0);
  assert(h.driver->ReleaseCount(handle) == 1);
}

void TestSessionWithinTimeoutIsKept() {
  Harness h;
  auto    view = h.manager->StartSession("u1", "https://x");

  auto report = h.monitor->SweepOnce(view.record.last_active_at_ms + kTimeoutMs);
  assert(report.scanned == 1);
  assert(report.abandoned == 0);
  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kActive);
  assert(h.driver->Released().empty());
}

void TestMaxSessionAgeReclaimsBusySessions() {
  HeartbeatOptions options;
  options.max_session_age = std::chrono::milliseconds(1000);
  Harness h(options);

  auto view   = h.manager->StartSession("u1", "https://x");
  auto report = h.monitor->SweepOnce(view.record.created_at_ms + 1001);
  assert(report.abandoned == 1);

  auto events = h.events->Events();
  assert(events.back().kind == TransitionKind::kAbandoned);
  assert(events.back().detail == "max session age");
}

void TestRecordsWithoutLocalOwnerAreIgnored() {
  Harness h;
  auto    created = h.store->Inner().Create(MakeRecord("foreign", "u1", SessionStatus::kActive, std::nullopt, 1));
  assert(created);

  auto report = h.monitor->SweepOnce(sessionkeeper::util::NowMillis() + 10 * kTimeoutMs);
  assert(report.scanned == 0);
  assert(h.store->Inner().Get("foreign")->status == SessionStatus::kActive);
}

void TestLostOwnershipDropsLocalHandle() {
  Harness    h;
  auto       view   = h.manager->StartSession("u1", "https://x");
  const auto handle = h.HandleOf(view.record.id);

  auto moved = h.store->Inner().UpdateStatus(view.record.id, SessionStatus::kActive, SessionStatus::kCompleted, 5);
  assert(moved);

  auto report = h.monitor->SweepOnce(view.record.last_active_at_ms + kTimeoutMs + 1);
  assert(report.abandoned == 0);
  assert(report.claims_lost == 1);
  assert(h.registry->Size() == 0);
  assert(h.driver->ReleaseCount(handle) == 1);
  assert(h.store->Inner().Get(view.record.id)->status == SessionStatus::kCompleted);
  assert(h.events->Count(TransitionKind::kAbandoned) == 0);
}

void TestStoreOutageKeepsSessionForNextSweep() {
  Harness    h;
  auto       view   = h.manager->StartSession("u1", "https://x");
  const auto handle = h.HandleOf(view.record.id);
  const auto late   = view.record.last_active_at_ms + kTimeoutMs + 1;

  h.store->update_failures = 1;

  auto failed = h.monitor->SweepOnce(late);
  assert(failed.store_errors == 1);
  assert(h.registry->Contains(view.record.id));
  assert(h.driver->Released().empty());
  assert(h.store->Inner().Get(view.record.id)->status == SessionStatus::kActive);

  auto retried = h.monitor->SweepOnce(late);
  assert(retried.abandoned == 1);
  assert(h.driver->ReleaseCount(handle) == 1);
}

void TestSweepIntervalMustBeShorterThanTimeout() {
  HeartbeatOptions options;
  options.timeout        = std::chrono::milliseconds(1000);
  options.sweep_interval = std::chrono::milliseconds(1000);

  bool rejected = false;
  try {
    Harness h(options);
  } catch (const sessionkeeper::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestBackgroundLoopReclaimsSilentSession() {
  HeartbeatOptions options;
  options.timeout        = std::chrono::milliseconds(50);
  options.sweep_interval = std::chrono::milliseconds(10);
  Harness h(options);

  auto view = h.manager->StartSession("u1", "https://x");
  h.monitor->Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.manager->GetStatus(view.record.id) != SessionStatus::kAbandoned && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  h.monitor->Stop();

  assert(h.manager->GetStatus(view.record.id) == SessionStatus::kAbandoned);
  assert(h.driver->Released().size() == 1);
}

} // namespace

int main() {
  TestSilentSessionIsAbandonedAndReleasedOnce();
  TestSessionWithinTimeoutIsKept();
  TestMaxSessionAgeReclaimsBusySessions();
  TestRecordsWithoutLocalOwnerAreIgnored();
  TestLostOwnershipDropsLocalHandle();
  TestStoreOutageKeepsSessionForNextSweep();
  TestSweepIntervalMustBeShorterThanTimeout();
  TestBackgroundLoopReclaimsSilentSession();

  std::cout << "sessionkeeper_unit_heartbeat_monitor: pass\n";
  return 0;
}
