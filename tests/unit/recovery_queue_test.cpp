#include "internal/recovery/recovery_queue.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using sessionkeeper::recovery::RecoveryQueue;
using sessionkeeper::recovery::RecoveryTask;

RecoveryTask MakeTask(const std::string& id) {
  RecoveryTask task;
  task.record.id = id;
  return task;
}

void TestDrainsQueuedTasksAfterShutdown() {
  RecoveryQueue queue;
  queue.Enqueue(MakeTask("a"));
  queue.Enqueue(MakeTask("b"));
  queue.Shutdown();

  auto first  = queue.Dequeue();
  auto second = queue.Dequeue();
  assert(first && first->record.id == "a");
  assert(second && second->record.id == "b");
  assert(!queue.Dequeue().has_value());
}

void TestShutdownWakesBlockedWorkers() {
  RecoveryQueue            queue;
  std::atomic<int>         finished{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 3; ++i) {
    workers.emplace_back([&] {
      while (queue.Dequeue()) {
      }
      ++finished;
    });
  }

  queue.Enqueue(MakeTask("x"));
  queue.Shutdown();
  for (auto& w : workers) w.join();

  assert(finished.load() == 3);
}

} // namespace

int main() {
  TestDrainsQueuedTasksAfterShutdown();
  TestShutdownWakesBlockedWorkers();

  std::cout << "sessionkeeper_unit_recovery_queue: pass\n";
  return 0;
}
