#pragma once

#include <string>
#include <vector>

#include "internal/db/model/booking_record.hpp"
#include "internal/model/project.hpp"

namespace slotkeeper::core {

/*
  Business-hours slot grid of one project day.

  Slot starts run from work_start in slot_minutes steps while the whole slot
  fits before work_end. A booking occupies every grid slot its
  [start, start + duration_slots * slot_minutes) range overlaps, so
  back-to-back bookings never conflict.
*/
class SlotGrid {
 public:
  explicit SlotGrid(const model::ProjectSettings& settings);

  const std::vector<int>& Starts() const {
    return starts_;
  }

  int SlotMinutes() const {
    return slot_minutes_;
  }

  bool IsGridStart(int minute) const;

  // Aligned start and every slot of the run inside business hours.
  bool RunInsideGrid(int start_minute, int duration_slots) const;

  // Grid starts covered by a range.
  std::vector<int> Covered(int start_minute, int duration_slots) const;

  // Active bookings only; `exclude_id` is ignored when computing occupancy.
  std::vector<int> Available(const std::vector<db::model::BookingRecord>& bookings, int duration_slots,
                             const std::string& exclude_id = {}) const;

  bool IsFree(const std::vector<db::model::BookingRecord>& bookings, int start_minute, int duration_slots,
              const std::string& exclude_id = {}) const;

 private:
  std::vector<bool> Occupancy(const std::vector<db::model::BookingRecord>& bookings, const std::string& exclude_id) const;
  int               IndexOf(int minute) const;

  int              slot_minutes_;
  std::vector<int> starts_;
};

} // namespace slotkeeper::core
