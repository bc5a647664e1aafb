#include "internal/mirror/reconcile_worker.hpp"

#include "internal/observability/logging.hpp"

namespace slotkeeper::mirror {

ReconcileWorker::ReconcileWorker(std::shared_ptr<MirrorReconciler> reconciler, std::chrono::milliseconds interval,
                                 int horizon_days, std::function<model::CivilDate()> today)
    : reconciler_(std::move(reconciler)), interval_(interval), horizon_days_(horizon_days), today_(std::move(today)) {
}

ReconcileWorker::~ReconcileWorker() {
  Stop();
}

void ReconcileWorker::Start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&ReconcileWorker::Run, this);
}

void ReconcileWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

ReconcileReport ReconcileWorker::RunOnce() {
  return reconciler_->ReconcileAll(today_(), horizon_days_);
}

void ReconcileWorker::Run() {
  for (;;) {
    try {
      RunOnce();
    } catch (const std::exception& e) {
      SLOTKEEPER_LOG_ERROR("reconcile pass failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) break;
  }
}

} // namespace slotkeeper::mirror
