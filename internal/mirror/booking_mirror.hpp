#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/calendar.hpp"

namespace slotkeeper::mirror {

// Cell value of every row after the first one of a multi-slot booking.
inline constexpr std::string_view kContinuationMarker = "-";

struct MirrorRecord {
  std::string client_id;
  std::string client_name;
  std::string service;

  static MirrorRecord Continuation() {
    return {std::string(kContinuationMarker), std::string(kContinuationMarker), std::string(kContinuationMarker)};
  }

  bool IsContinuation() const {
    return client_id == kContinuationMarker;
  }

  bool operator==(const MirrorRecord&) const = default;
};

struct MirrorRow {
  model::TimeOfDay time;
  MirrorRecord     record;
};

/*
  Human-editable mirror of the bookings table.

  Addressed by (project, specialist, date, time). Every call may throw
  util::MirrorSyncError. Callers never hold a store lock scope while calling.
*/
class BookingMirror {
 public:
  virtual ~BookingMirror() = default;

  virtual void SetSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
                       model::TimeOfDay time, const MirrorRecord& record) = 0;

  virtual void ClearSlot(const std::string& project_id, const std::string& specialist, const model::CivilDate& date,
                         model::TimeOfDay time) = 0;

  virtual std::optional<MirrorRecord> ReadSlot(const std::string& project_id, const std::string& specialist,
                                               const model::CivilDate& date, model::TimeOfDay time) = 0;

  // Occupied rows of the day, ordered by time.
  virtual std::vector<MirrorRow> ReadDay(const std::string& project_id, const std::string& specialist,
                                         const model::CivilDate& date) = 0;
};

} // namespace slotkeeper::mirror
