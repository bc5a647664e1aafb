#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/mirror/mirror_reconciler.hpp"

namespace slotkeeper::mirror {

/*
  Periodic reconcile sweep.

  Runs one pass immediately after Start() and then every `interval` over
  [today, today + horizon_days).
*/
class ReconcileWorker {
 public:
  ReconcileWorker(std::shared_ptr<MirrorReconciler> reconciler, std::chrono::milliseconds interval, int horizon_days,
                  std::function<model::CivilDate()> today = model::CivilDate::Today);
  ~ReconcileWorker();

  void Start();
  void Stop();

  // One synchronous pass.
  ReconcileReport RunOnce();

 private:
  void Run();

  std::shared_ptr<MirrorReconciler> reconciler_;
  std::chrono::milliseconds         interval_;
  int                               horizon_days_;
  std::function<model::CivilDate()> today_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace slotkeeper::mirror
