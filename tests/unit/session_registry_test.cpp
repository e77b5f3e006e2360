#include "internal/core/session_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "tests/support/fakes.hpp"

namespace {

using sessionkeeper::core::LiveSession;
using sessionkeeper::core::SessionRegistry;
using sessionkeeper::driver::DriverHandle;
using sessionkeeper::model::SessionStatus;
using sessionkeeper::testing::MakeRecord;

LiveSession MakeLive(const std::string& id, uint64_t at_ms) {
  return LiveSession{MakeRecord(id, "u1", SessionStatus::kActive, std::nullopt, at_ms), DriverHandle{"h-" + id, "https://view/" + id}};
}

void TestPutFindErase() {
  SessionRegistry registry;
  registry.Put(MakeLive("s1", 100));

  assert(registry.Contains("s1"));
  assert(registry.Size() == 1);
  assert(registry.Find("s1")->handle.handle_id == "h-s1");

  auto erased = registry.Erase("s1");
  assert(erased.has_value());
  assert(erased->handle.handle_id == "h-s1");
  assert(!registry.Contains("s1"));
  assert(!registry.Erase("s1").has_value());
}

void TestTouchIsMonotonicAndReportsAbsence() {
  SessionRegistry registry;
  registry.Put(MakeLive("s1", 1000));

  const bool forward  = registry.Touch("s1", 5000);
  const bool backward = registry.Touch("s1", 10);
  const bool missing  = registry.Touch("nope", 10);
  assert(forward && backward && !missing);
  assert(registry.Find("s1")->record.last_active_at_ms == 5000);
}

void TestResumeTokenUpdatesMirror() {
  SessionRegistry registry;
  registry.Put(MakeLive("s1", 1));

  const bool updated = registry.SetResumeToken("s1", "ckpt-3");
  const bool missing = registry.SetResumeToken("s2", "ckpt-3");
  assert(updated && !missing);
  assert(registry.Find("s1")->record.resume_token == std::optional<std::string>("ckpt-3"));
}

void TestSnapshotIsACopy() {
  SessionRegistry registry;
  registry.Put(MakeLive("s1", 1));
  registry.Put(MakeLive("s2", 1));

  auto snapshot = registry.Snapshot();
  registry.Erase("s1");

  assert(snapshot.size() == 2);
  assert(registry.Size() == 1);
}

void TestSameIdIsMutuallyExclusive() {
  SessionRegistry  registry;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 50; ++j) {
        auto lock = registry.Lock("s1");
        int  now  = ++inside;
        int  seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
        }
        --inside;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(max_inside.load() == 1);
  assert(registry.LockTableSize() == 0);
}

void TestDistinctIdsDoNotBlock() {
  SessionRegistry registry;
  auto            held = registry.Lock("s1");

  std::atomic<bool> acquired{false};
  std::thread       other([&] {
    auto lock = registry.Lock("s2");
    acquired  = true;
  });
  other.join();

  assert(acquired.load());
  assert(registry.LockTableSize() == 1);
}

void TestLockTableIsPrunedAfterRelease() {
  SessionRegistry registry;
  {
    auto a = registry.Lock("s1");
    auto b = registry.Lock("s2");
    assert(registry.LockTableSize() == 2);
  }
  assert(registry.LockTableSize() == 0);

  // a moved-from lock must not release twice
  auto first = registry.Lock("s3");
  auto moved = std::move(first);
  assert(registry.LockTableSize() == 1);
}

} // namespace

int main() {
  TestPutFindErase();
  TestTouchIsMonotonicAndReportsAbsence();
  TestResumeTokenUpdatesMirror();
  TestSnapshotIsACopy();
  TestSameIdIsMutuallyExclusive();
  TestDistinctIdsDoNotBlock();
  TestLockTableIsPrunedAfterRelease();

  std::cout << "sessionkeeper_unit_session_registry: pass\n";
  return 0;
}
