#include "internal/mirror/mirror_worker.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace slotkeeper::mirror {

MirrorWorker::MirrorWorker(std::shared_ptr<MirrorScheduler> scheduler, std::shared_ptr<MirrorSync> sync)
    : scheduler_(std::move(scheduler)), sync_(std::move(sync)) {
}

MirrorWorker::~MirrorWorker() {
  Stop();
}

void MirrorWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&MirrorWorker::Run, this);
}

void MirrorWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

bool MirrorWorker::Process(const MirrorTask& task) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto observe    = [&](bool success) {
    observability::Metrics::Instance().ObserveMirrorSyncMs(
        task.set ? "write" : "clear", success,
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    sync_->Apply(task);
    observe(true);
    ++applied_;
    return true;
  } catch (const util::MirrorSyncError& e) {
    SLOTKEEPER_LOG_WARN("mirror write failed",
                        {observability::StringField("booking_id", task.booking_id),
                         observability::StringField("error", e.what())});
  } catch (const util::StoreUnavailable& e) {
    SLOTKEEPER_LOG_WARN("mirror sync could not mark booking",
                        {observability::StringField("booking_id", task.booking_id),
                         observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    SLOTKEEPER_LOG_ERROR("mirror task failed",
                         {observability::StringField("booking_id", task.booking_id),
                          observability::StringField("error", e.what())});
  }
  observe(false);
  ++failed_;
  return false;
}

void MirrorWorker::Run() {
  for (;;) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    Process(*task);
  }
}

} // namespace slotkeeper::mirror
