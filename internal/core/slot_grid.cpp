#include "internal/core/slot_grid.hpp"

#include <algorithm>
#include <cstdint>

namespace slotkeeper::core {

using slotkeeper::model::BookingStatus;

SlotGrid::SlotGrid(const model::ProjectSettings& settings) : slot_minutes_(std::max(1, settings.slot_minutes)) {
  for (int minute = settings.work_start.minutes; minute + slot_minutes_ <= settings.work_end.minutes;
       minute += slot_minutes_) {
    starts_.push_back(minute);
  }
}

int SlotGrid::IndexOf(int minute) const {
  auto it = std::lower_bound(starts_.begin(), starts_.end(), minute);
  if (it == starts_.end() || *it != minute) return -1;
  return static_cast<int>(it - starts_.begin());
}

bool SlotGrid::IsGridStart(int minute) const {
  return IndexOf(minute) >= 0;
}

bool SlotGrid::RunInsideGrid(int start_minute, int duration_slots) const {
  if (duration_slots < 1) return false;
  const int first = IndexOf(start_minute);
  return first >= 0 && duration_slots <= static_cast<int>(starts_.size()) - first;
}

std::vector<int> SlotGrid::Covered(int start_minute, int duration_slots) const {
  std::vector<int> covered;
  const int64_t end_minute = static_cast<int64_t>(start_minute) + static_cast<int64_t>(duration_slots) * slot_minutes_;
  for (int slot : starts_) {
    if (slot < end_minute && start_minute < slot + slot_minutes_) covered.push_back(slot);
  }
  return covered;
}

std::vector<bool> SlotGrid::Occupancy(const std::vector<db::model::BookingRecord>& bookings,
                                      const std::string& exclude_id) const {
  std::vector<bool> occupied(starts_.size(), false);
  for (const auto& booking : bookings) {
    if (booking.status != BookingStatus::kActive) continue;
    if (!exclude_id.empty() && booking.id == exclude_id) continue;

    for (int slot : Covered(booking.start_minute, booking.duration_slots)) {
      occupied[static_cast<size_t>(IndexOf(slot))] = true;
    }
  }
  return occupied;
}

std::vector<int> SlotGrid::Available(const std::vector<db::model::BookingRecord>& bookings, int duration_slots,
                                     const std::string& exclude_id) const {
  std::vector<int> available;
  if (duration_slots < 1) return available;

  const auto occupied = Occupancy(bookings, exclude_id);
  const int  count    = static_cast<int>(starts_.size());
  if (duration_slots > count) return available;

  for (int i = 0; i <= count - duration_slots; ++i) {
    bool free = true;
    for (int k = i; k - i < duration_slots; ++k) {
      if (occupied[static_cast<size_t>(k)]) {
        free = false;
        break;
      }
    }
    if (free) available.push_back(starts_[static_cast<size_t>(i)]);
  }
  return available;
}

bool SlotGrid::IsFree(const std::vector<db::model::BookingRecord>& bookings, int start_minute, int duration_slots,
                      const std::string& exclude_id) const {
  if (!RunInsideGrid(start_minute, duration_slots)) return false;

  const auto occupied = Occupancy(bookings, exclude_id);
  const int  first    = IndexOf(start_minute);
  for (int k = first; k - first < duration_slots; ++k) {
    if (occupied[static_cast<size_t>(k)]) return false;
  }
  return true;
}

} // namespace slotkeeper::core
