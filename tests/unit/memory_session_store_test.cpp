#include "internal/db/memory/memory_session_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "tests/support/fakes.hpp"

namespace {

using sessionkeeper::db::ErrorCode;
using sessionkeeper::db::memory::MemorySessionStore;
using sessionkeeper::model::SessionStatus;
using sessionkeeper::testing::MakeRecord;

void TestCreateRejectsDuplicateId() {
  MemorySessionStore store;
  auto created = store.Create(MakeRecord("s1", "u1", SessionStatus::kActive));
  assert(created);

  auto again = store.Create(MakeRecord("s1", "u2", SessionStatus::kActive));
  assert(again.code == ErrorCode::AlreadyExists);
  assert(store.Get("s1")->owner == "u1");
}

void TestUpdateStatusIsCompareAndSet() {
  MemorySessionStore store;
  store.Create(MakeRecord("s1", "u1", SessionStatus::kActive, std::nullopt, 1000));

  auto ok = store.UpdateStatus("s1", SessionStatus::kActive, SessionStatus::kResuming, 2000);
  assert(ok);
  assert(store.Get("s1")->status == SessionStatus::kResuming);
  assert(store.Get("s1")->status_changed_at_ms == 2000);

  auto stale = store.UpdateStatus("s1", SessionStatus::kActive, SessionStatus::kCompleted, 3000);
  assert(stale.code == ErrorCode::Conflict);
  assert(store.Get("s1")->status == SessionStatus::kResuming);

  auto missing = store.UpdateStatus("nope", SessionStatus::kActive, SessionStatus::kCompleted, 3000);
  assert(missing.code == ErrorCode::NotFound);
}

void TestIllegalTransitionNeverApplies() {
  MemorySessionStore store;
  store.Create(MakeRecord("s1", "u1", SessionStatus::kCompleted));

  auto result = store.UpdateStatus("s1", SessionStatus::kCompleted, SessionStatus::kActive, 5);
  assert(result.code == ErrorCode::ConstraintViolation);
  assert(store.Get("s1")->status == SessionStatus::kCompleted);
}

void TestTouchNeverMovesBackwards() {
  MemorySessionStore store;
  store.Create(MakeRecord("s1", "u1", SessionStatus::kActive, std::nullopt, 1000));

  auto forward  = store.Touch("s1", 5000);
  auto backward = store.Touch("s1", 3000);
  auto missing  = store.Touch("missing", 1);
  assert(forward);
  assert(backward);
  assert(store.Get("s1")->last_active_at_ms == 5000);
  assert(missing.code == ErrorCode::NotFound);
}

void TestResumeTokenOnlyWhileActive() {
  MemorySessionStore store;
  store.Create(MakeRecord("s1", "u1", SessionStatus::kActive));
  store.Create(MakeRecord("s2", "u1", SessionStatus::kFailed));

  auto active   = store.SetResumeToken("s1", "ckpt-1");
  auto terminal = store.SetResumeToken("s2", "ckpt-1");
  assert(active);
  assert(store.Get("s1")->resume_token == std::optional<std::string>("ckpt-1"));
  assert(terminal.code == ErrorCode::Conflict);
  assert(!store.Get("s2")->resume_token.has_value());
}

void TestQueriesFilterAndOrder() {
  MemorySessionStore store;
  store.Create(MakeRecord("b", "u1", SessionStatus::kActive, std::nullopt, 200));
  store.Create(MakeRecord("a", "u1", SessionStatus::kFailed, std::nullopt, 200));
  store.Create(MakeRecord("c", "u1", SessionStatus::kActive, std::nullopt, 100));
  store.Create(MakeRecord("d", "u2", SessionStatus::kActive, std::nullopt, 50));

  assert(store.QueryByStatus(SessionStatus::kActive).size() == 3);
  assert(store.QueryByStatus(SessionStatus::kResuming).empty());

  auto owned = store.ListByOwner("u1");
  assert(owned.size() == 3);
  assert(owned[0].id == "c");
  assert(owned[1].id == "a");
  assert(owned[2].id == "b");
  assert(store.ListByOwner("nobody").empty());
}

void TestConcurrentClaimsHaveOneWinner() {
  MemorySessionStore store;
  store.Create(MakeRecord("s1", "u1", SessionStatus::kActive));

  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result = store.UpdateStatus("s1", SessionStatus::kActive, SessionStatus::kResuming, 10);
      if (result) ++winners;
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
}

} // namespace

int main() {
  TestCreateRejectsDuplicateId();
  TestUpdateStatusIsCompareAndSet();
  TestIllegalTransitionNeverApplies();
  TestTouchNeverMovesBackwards();
  TestResumeTokenOnlyWhileActive();
  TestQueriesFilterAndOrder();
  TestConcurrentClaimsHaveOneWinner();

  std::cout << "sessionkeeper_unit_memory_session_store: pass\n";
  return 0;
}
