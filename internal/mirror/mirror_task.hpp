#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/mirror/booking_mirror.hpp"
#include "internal/model/calendar.hpp"

namespace slotkeeper::mirror {

// Consecutive slot rows of one specialist day.
struct SlotRange {
  std::string      project_id;
  std::string      specialist;
  model::CivilDate date;
  model::TimeOfDay start;
  int              duration_slots = 1;
  int              slot_minutes   = 30;

  model::TimeOfDay SlotTime(int index) const {
    return start.Plus(index * slot_minutes);
  }
};

/*
  A queued mirror update produced after a booking commit.

  clear runs before set. The booking is marked synced afterwards only if
  its revision still equals `revision`.
*/
struct MirrorTask {
  std::string booking_id;
  uint64_t    revision = 0;

  std::optional<SlotRange> clear;
  std::optional<SlotRange> set;
  MirrorRecord             record;
};

} // namespace slotkeeper::mirror
