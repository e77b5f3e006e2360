#include "recovery_queue.hpp"

namespace sessionkeeper::recovery {

void RecoveryQueue::Enqueue(RecoveryTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<RecoveryTask> RecoveryQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  RecoveryTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void RecoveryQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace sessionkeeper::recovery
