#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/mirror/mirror_task.hpp"

namespace slotkeeper::mirror {

/*
  Thread-safe blocking queue for the mirror worker.
*/
class MirrorScheduler {
 public:
  void Enqueue(const MirrorTask& task);

  // Blocks until a task is available. nullopt only after Shutdown() once the
  // queue is drained.
  std::optional<MirrorTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<MirrorTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace slotkeeper::mirror
