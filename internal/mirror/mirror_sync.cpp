#include "internal/mirror/mirror_sync.hpp"

#include "internal/db/scoped_tx.hpp"
#include "internal/observability/logging.hpp"

namespace slotkeeper::mirror {

SlotRange RangeOf(const db::model::BookingRecord& booking, int slot_minutes) {
  SlotRange range;
  range.project_id     = booking.project_id;
  range.specialist     = booking.specialist;
  range.date           = model::CivilDate::Parse(booking.date, 0);
  range.start          = model::TimeOfDay{booking.start_minute};
  range.duration_slots = booking.duration_slots;
  range.slot_minutes   = slot_minutes;
  return range;
}

MirrorRecord RecordOf(const db::model::BookingRecord& booking) {
  return {booking.client_id, booking.client_name, booking.service_name};
}

MirrorSync::MirrorSync(std::shared_ptr<db::Repository> repository, std::shared_ptr<BookingMirror> mirror)
    : repository_(std::move(repository)), mirror_(std::move(mirror)) {
}

void MirrorSync::Apply(const MirrorTask& task) {
  if (task.clear) ClearRange(*task.clear);
  if (task.set) WriteRange(*task.set, task.record);

  MarkSynced(task);
}

void MirrorSync::WriteRange(const SlotRange& range, const MirrorRecord& record) {
  for (int i = 0; i < range.duration_slots; ++i) {
    mirror_->SetSlot(range.project_id, range.specialist, range.date, range.SlotTime(i),
                     i == 0 ? record : MirrorRecord::Continuation());
  }
}

void MirrorSync::ClearRange(const SlotRange& range) {
  for (int i = 0; i < range.duration_slots; ++i) {
    mirror_->ClearSlot(range.project_id, range.specialist, range.date, range.SlotTime(i));
  }
}

void MirrorSync::MarkSynced(const MirrorTask& task) {
  if (!task.set && !task.clear) return;

  const auto& range = task.set ? *task.set : *task.clear;
  const auto  scope = db::LockScope::Calendar(range.project_id, range.specialist, range.date.ToIso());

  const bool marked = db::WithScopes(*repository_, {scope}, [&](db::Transaction& tx) {
    auto booking = repository_->GetBooking(tx, task.booking_id);
    if (!booking || booking->revision != task.revision || booking->mirror_synced) {
      return false;
    }
    booking->mirror_synced = true;
    db::ThrowIfDbError(repository_->UpdateBooking(tx, *booking), "mark booking synced");
    return true;
  });

  if (!marked) {
    SLOTKEEPER_LOG_DEBUG("mirror sync superseded by newer revision",
                         {observability::StringField("booking_id", task.booking_id),
                          observability::IntField("revision", static_cast<int64_t>(task.revision))});
  }
}

} // namespace slotkeeper::mirror
