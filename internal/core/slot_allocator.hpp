#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/mirror/booking_mirror.hpp"
#include "internal/mirror/mirror_scheduler.hpp"
#include "internal/model/calendar.hpp"
#include "internal/model/project.hpp"
#include "internal/util/time.hpp"

namespace slotkeeper::core {

struct BookingDetails {
  std::string client_id;
  std::string client_name;
  std::string client_phone;
  std::string service_name;
};

struct BookingStats {
  uint64_t total     = 0;
  uint64_t active    = 0;
  uint64_t cancelled = 0;
};

/*
  Slot Allocator

  Store of record for bookings. No two active bookings of one
  (project, specialist, date) overlap.

  Every mutation:
    1. validates the request (ValidationError, before any lock)
    2. cross-checks the mirror outside any lock (ConflictError when a row is
       taken; mirror read failures are logged and ignored)
    3. re-checks and writes under the calendar scope(s)
    4. queues a mirror task after commit
*/
class SlotAllocator {
 public:
  SlotAllocator(std::shared_ptr<db::Repository> repository, std::shared_ptr<const model::ProjectRegistry> projects,
                std::shared_ptr<mirror::BookingMirror> mirror, std::shared_ptr<mirror::MirrorScheduler> scheduler,
                util::NowMillisFn now = util::NowMillis);

  std::vector<model::TimeOfDay> GetAvailableSlots(const std::string& project_id, const std::string& specialist,
                                                  const model::CivilDate& date, int duration_slots);

  db::model::BookingRecord Allocate(const std::string& project_id, const std::string& specialist,
                                    const model::CivilDate& date, model::TimeOfDay start, int duration_slots,
                                    const BookingDetails& details);

  db::model::BookingRecord Cancel(const std::string& booking_id);

  // details, when set, replace the client and service fields.
  db::model::BookingRecord Change(const std::string& booking_id, const std::string& specialist,
                                  const model::CivilDate& date, model::TimeOfDay start, int duration_slots,
                                  const std::optional<BookingDetails>& details = std::nullopt);

  std::vector<db::model::BookingRecord> ClientBookings(const std::string& project_id, const std::string& client_id);

  BookingStats Stats(const std::string& project_id);

  const model::ProjectRegistry& Projects() const {
    return *projects_;
  }

  mirror::SlotRange          RangeOf(const db::model::BookingRecord& booking) const;
  static mirror::MirrorRecord MirrorRecordOf(const db::model::BookingRecord& booking);

 private:
  const model::ProjectSettings& ValidateRun(const std::string& project_id, const std::string& specialist,
                                            model::TimeOfDay start, int duration_slots) const;

  void CrossCheckMirror(const model::ProjectSettings& settings, const std::string& specialist,
                        const model::CivilDate& date, model::TimeOfDay start, int duration_slots,
                        const db::model::BookingRecord* current);

  db::model::BookingRecord ReadBooking(const std::string& booking_id);
  void                     QueueMirror(mirror::MirrorTask task);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const model::ProjectRegistry> projects_;
  std::shared_ptr<mirror::BookingMirror>        mirror_;
  std::shared_ptr<mirror::MirrorScheduler>      scheduler_;
  util::NowMillisFn                             now_;
};

} // namespace slotkeeper::core
