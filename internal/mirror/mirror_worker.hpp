#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "internal/mirror/mirror_scheduler.hpp"
#include "internal/mirror/mirror_sync.hpp"

namespace slotkeeper::mirror {

/*
  Background worker draining the mirror task queue.

  A failed task is logged and dropped; the booking stays unsynced and the
  reconcile sweep pushes it again. Stop() drains the queue before joining.
*/
class MirrorWorker {
 public:
  MirrorWorker(std::shared_ptr<MirrorScheduler> scheduler, std::shared_ptr<MirrorSync> sync);
  ~MirrorWorker();

  void Start();
  void Stop();

  // Returns false when the task failed.
  bool Process(const MirrorTask& task);

  uint64_t Applied() const {
    return applied_.load();
  }
  uint64_t Failed() const {
    return failed_.load();
  }

 private:
  void Run();

  std::shared_ptr<MirrorScheduler> scheduler_;
  std::shared_ptr<MirrorSync>      sync_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> applied_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace slotkeeper::mirror
