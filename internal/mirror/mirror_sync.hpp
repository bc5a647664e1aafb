#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/mirror/booking_mirror.hpp"
#include "internal/mirror/mirror_task.hpp"

namespace slotkeeper::mirror {

SlotRange    RangeOf(const db::model::BookingRecord& booking, int slot_minutes);
MirrorRecord RecordOf(const db::model::BookingRecord& booking);

/*
  Pushes booking state to the mirror.

  Mirror calls happen with no lock scope held. Marking the booking synced
  takes the calendar scope of the range the task wrote.
*/
class MirrorSync {
 public:
  MirrorSync(std::shared_ptr<db::Repository> repository, std::shared_ptr<BookingMirror> mirror);

  // Throws util::MirrorSyncError when the mirror rejects a write.
  void Apply(const MirrorTask& task);

  void WriteRange(const SlotRange& range, const MirrorRecord& record);
  void ClearRange(const SlotRange& range);

 private:
  void MarkSynced(const MirrorTask& task);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<BookingMirror>  mirror_;
};

} // namespace slotkeeper::mirror
