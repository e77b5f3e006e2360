#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/db/model/session_record.hpp"

namespace sessionkeeper::recovery {

struct RecoveryTask {
  db::model::SessionRecord record;
};

/*
  Thread-safe blocking queue feeding recovery workers.

  After Shutdown() workers drain what is queued, then Dequeue returns nullopt.
*/
class RecoveryQueue {
 public:
  void Enqueue(RecoveryTask task);

  // blocking wait
  std::optional<RecoveryTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<RecoveryTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace sessionkeeper::recovery
