#pragma once

#include <cstdint>
#include <string>

#include "internal/model/booking_status.hpp"

namespace slotkeeper::db::model {

/*
  Persistent booking row.

  - date is ISO text (YYYY-MM-DD), start_minute is minutes after midnight.
  - revision increments on every mutation; the mirror worker only marks a
    booking synced when the revision it pushed is still current.
  - Never hard-deleted; cancellation is a status change.
*/

struct BookingRecord {
  std::string id;
  std::string project_id;
  std::string specialist;
  std::string date;
  int32_t     start_minute   = 0;
  int32_t     duration_slots = 1;

  std::string client_id;
  std::string client_name;
  std::string client_phone;
  std::string service_name;

  slotkeeper::model::BookingStatus status = slotkeeper::model::BookingStatus::kActive;

  uint64_t revision      = 1;
  bool     mirror_synced = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace slotkeeper::db::model
