#include "internal/mirror/mirror_scheduler.hpp"

namespace slotkeeper::mirror {

void MirrorScheduler::Enqueue(const MirrorTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<MirrorTask> MirrorScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  MirrorTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void MirrorScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t MirrorScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace slotkeeper::mirror
