#include "internal/core/slot_allocator.hpp"

#include <set>
#include <string>

#include "internal/core/slot_grid.hpp"
#include "internal/db/scoped_tx.hpp"
#include "internal/mirror/mirror_sync.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace slotkeeper::core {

using slotkeeper::model::BookingStatus;
using namespace slotkeeper::observability;

namespace {

// A booking can move between the unlocked read and the scoped re-read.
constexpr int kMaxScopeAttempts = 3;

db::LockScope CalendarScope(const db::model::BookingRecord& booking) {
  return db::LockScope::Calendar(booking.project_id, booking.specialist, booking.date);
}

bool SameScope(const db::model::BookingRecord& a, const db::model::BookingRecord& b) {
  return a.project_id == b.project_id && a.specialist == b.specialist && a.date == b.date;
}

} // namespace

SlotAllocator::SlotAllocator(std::shared_ptr<db::Repository> repository,
                             std::shared_ptr<const model::ProjectRegistry> projects,
                             std::shared_ptr<mirror::BookingMirror> mirror,
                             std::shared_ptr<mirror::MirrorScheduler> scheduler, util::NowMillisFn now)
    : repository_(std::move(repository)),
      projects_(std::move(projects)),
      mirror_(std::move(mirror)),
      scheduler_(std::move(scheduler)),
      now_(std::move(now)) {
}

const model::ProjectSettings& SlotAllocator::ValidateRun(const std::string& project_id, const std::string& specialist,
                                                         model::TimeOfDay start, int duration_slots) const {
  const auto& settings = projects_->Get(project_id);

  if (!settings.HasSpecialist(specialist)) {
    throw util::ValidationError("unknown specialist: " + specialist);
  }
  if (duration_slots < 1) {
    throw util::ValidationError("duration must be at least one slot");
  }

  SlotGrid grid(settings);
  if (duration_slots > static_cast<int>(grid.Starts().size())) {
    throw util::ValidationError("duration of " + std::to_string(duration_slots) + " slots exceeds the working day");
  }
  if (!grid.IsGridStart(start.minutes)) {
    throw util::ValidationError("start " + start.ToString() + " is not a slot boundary within business hours");
  }
  if (!grid.RunInsideGrid(start.minutes, duration_slots)) {
    throw util::ValidationError("booking from " + start.ToString() + " runs past business hours");
  }
  return settings;
}

void SlotAllocator::CrossCheckMirror(const model::ProjectSettings& settings, const std::string& specialist,
                                     const model::CivilDate& date, model::TimeOfDay start, int duration_slots,
                                     const db::model::BookingRecord* current) {
  if (!mirror_) return;

  // rows the booking being changed already holds
  std::set<int> own;
  if (current && current->specialist == specialist && current->date == date.ToIso()) {
    const auto range = RangeOf(*current);
    for (int i = 0; i < range.duration_slots; ++i) own.insert(range.SlotTime(i).minutes);
  }

  for (int i = 0; i < duration_slots; ++i) {
    const auto time = start.Plus(i * settings.slot_minutes);
    if (own.contains(time.minutes)) continue;

    std::optional<mirror::MirrorRecord> row;
    try {
      row = mirror_->ReadSlot(settings.project_id, specialist, date, time);
    } catch (const util::MirrorSyncError& e) {
      LogWarn("mirror read failed; relying on store", {StringField("project_id", settings.project_id),
                                                       StringField("specialist", specialist),
                                                       StringField("date", date.ToIso()),
                                                       StringField("error", e.what())});
      return;
    }

    if (row) {
      throw util::ConflictError("slot " + time.ToString() + " on " + date.ToIso() + " is taken in the mirror");
    }
  }
}

std::vector<model::TimeOfDay> SlotAllocator::GetAvailableSlots(const std::string& project_id,
                                                               const std::string& specialist,
                                                               const model::CivilDate& date, int duration_slots) {
  const auto& settings = projects_->Get(project_id);
  if (!settings.HasSpecialist(specialist)) {
    throw util::ValidationError("unknown specialist: " + specialist);
  }
  if (duration_slots < 1) {
    throw util::ValidationError("duration must be at least one slot");
  }
  const SlotGrid grid(settings);
  if (duration_slots > static_cast<int>(grid.Starts().size())) {
    throw util::ValidationError("duration of " + std::to_string(duration_slots) + " slots exceeds the working day");
  }

  auto day = db::ReadOnly(*repository_, [&](db::Transaction& tx) {
    return repository_->ListDayBookings(tx, project_id, specialist, date.ToIso());
  });

  std::vector<model::TimeOfDay> slots;
  for (int minute : grid.Available(day, duration_slots)) {
    slots.push_back(model::TimeOfDay{minute});
  }
  return slots;
}

db::model::BookingRecord SlotAllocator::Allocate(const std::string& project_id, const std::string& specialist,
                                                 const model::CivilDate& date, model::TimeOfDay start,
                                                 int duration_slots, const BookingDetails& details) {
  if (details.client_id.empty()) {
    throw util::ValidationError("client_id is required");
  }
  const auto& settings = ValidateRun(project_id, specialist, start, duration_slots);

  CrossCheckMirror(settings, specialist, date, start, duration_slots, nullptr);

  const auto now = now_();
  db::model::BookingRecord booking;
  booking.id             = util::NewId();
  booking.project_id     = project_id;
  booking.specialist     = specialist;
  booking.date           = date.ToIso();
  booking.start_minute   = start.minutes;
  booking.duration_slots = duration_slots;
  booking.client_id      = details.client_id;
  booking.client_name    = details.client_name;
  booking.client_phone   = details.client_phone;
  booking.service_name   = details.service_name;
  booking.status         = BookingStatus::kActive;
  booking.revision       = 1;
  booking.mirror_synced  = false;
  booking.created_at_ms  = now;
  booking.updated_at_ms  = now;

  const SlotGrid grid(settings);
  db::WithScopes(*repository_, {CalendarScope(booking)}, [&](db::Transaction& tx) {
    auto day = repository_->ListDayBookings(tx, project_id, specialist, booking.date);
    if (!grid.IsFree(day, start.minutes, duration_slots)) {
      throw util::ConflictError("slot " + start.ToString() + " on " + booking.date + " is already booked");
    }
    db::ThrowIfDbError(repository_->InsertBooking(tx, booking), "insert booking");
  });

  LogInfo("booking allocated", {StringField("booking_id", booking.id), StringField("project_id", project_id),
                                StringField("specialist", specialist), StringField("date", booking.date),
                                StringField("start", start.ToString()), IntField("slots", duration_slots)});

  mirror::MirrorTask task;
  task.booking_id = booking.id;
  task.revision   = booking.revision;
  task.set        = RangeOf(booking);
  task.record     = MirrorRecordOf(booking);
  QueueMirror(std::move(task));

  return booking;
}

db::model::BookingRecord SlotAllocator::Cancel(const std::string& booking_id) {
  for (int attempt = 0; attempt < kMaxScopeAttempts; ++attempt) {
    const auto snapshot = ReadBooking(booking_id);

    auto cancelled = db::WithScopes(
        *repository_, {CalendarScope(snapshot)}, [&](db::Transaction& tx) -> std::optional<db::model::BookingRecord> {
          auto current = repository_->GetBooking(tx, booking_id);
          if (!current) throw util::NotFound("booking not found: " + booking_id);
          if (!SameScope(*current, snapshot)) return std::nullopt;
          if (current->status == BookingStatus::kCancelled) {
            throw util::InvalidState("booking already cancelled: " + booking_id);
          }

          current->status        = BookingStatus::kCancelled;
          current->revision     += 1;
          current->mirror_synced = false;
          current->updated_at_ms = now_();
          db::ThrowIfDbError(repository_->UpdateBooking(tx, *current), "cancel booking");
          return current;
        });

    if (!cancelled) continue;

    LogInfo("booking cancelled", {StringField("booking_id", booking_id)});

    mirror::MirrorTask task;
    task.booking_id = cancelled->id;
    task.revision   = cancelled->revision;
    task.clear      = RangeOf(*cancelled);
    QueueMirror(std::move(task));
    return *cancelled;
  }

  throw util::ConflictError("booking moved concurrently: " + booking_id);
}

db::model::BookingRecord SlotAllocator::Change(const std::string& booking_id, const std::string& specialist,
                                               const model::CivilDate& date, model::TimeOfDay start,
                                               int duration_slots, const std::optional<BookingDetails>& details) {
  for (int attempt = 0; attempt < kMaxScopeAttempts; ++attempt) {
    const auto snapshot = ReadBooking(booking_id);
    if (snapshot.status == BookingStatus::kCancelled) {
      throw util::InvalidState("cannot change a cancelled booking: " + booking_id);
    }

    const auto& settings = ValidateRun(snapshot.project_id, specialist, start, duration_slots);
    CrossCheckMirror(settings, specialist, date, start, duration_slots, &snapshot);

    const auto     target = db::LockScope::Calendar(snapshot.project_id, specialist, date.ToIso());
    const SlotGrid grid(settings);

    using Moved = std::pair<db::model::BookingRecord, db::model::BookingRecord>;
    auto moved  = db::WithScopes(
        *repository_, {CalendarScope(snapshot), target}, [&](db::Transaction& tx) -> std::optional<Moved> {
          auto current = repository_->GetBooking(tx, booking_id);
          if (!current) throw util::NotFound("booking not found: " + booking_id);
          if (!SameScope(*current, snapshot)) return std::nullopt;
          if (current->status == BookingStatus::kCancelled) {
            throw util::InvalidState("cannot change a cancelled booking: " + booking_id);
          }

          auto day = repository_->ListDayBookings(tx, current->project_id, specialist, date.ToIso());
          if (!grid.IsFree(day, start.minutes, duration_slots, current->id)) {
            throw util::ConflictError("slot " + start.ToString() + " on " + date.ToIso() + " is already booked");
          }

          const auto before      = *current;
          current->specialist     = specialist;
          current->date           = date.ToIso();
          current->start_minute   = start.minutes;
          current->duration_slots = duration_slots;
          if (details) {
            if (!details->client_id.empty()) current->client_id = details->client_id;
            current->client_name  = details->client_name;
            current->client_phone = details->client_phone;
            current->service_name = details->service_name;
          }
          current->revision     += 1;
          current->mirror_synced = false;
          current->updated_at_ms = now_();
          db::ThrowIfDbError(repository_->UpdateBooking(tx, *current), "change booking");
          return Moved{before, *current};
        });

    if (!moved) continue;

    const auto& [before, after] = *moved;
    LogInfo("booking changed", {StringField("booking_id", booking_id), StringField("from_date", before.date),
                                StringField("to_date", after.date),
                                StringField("to_start", model::TimeOfDay{after.start_minute}.ToString())});

    mirror::MirrorTask task;
    task.booking_id = after.id;
    task.revision   = after.revision;
    task.clear      = RangeOf(before);
    task.set        = RangeOf(after);
    task.record     = MirrorRecordOf(after);
    QueueMirror(std::move(task));
    return after;
  }

  throw util::ConflictError("booking moved concurrently: " + booking_id);
}

std::vector<db::model::BookingRecord> SlotAllocator::ClientBookings(const std::string& project_id,
                                                                    const std::string& client_id) {
  return db::ReadOnly(*repository_, [&](db::Transaction& tx) {
    return repository_->ListClientBookings(tx, project_id, client_id);
  });
}

BookingStats SlotAllocator::Stats(const std::string& project_id) {
  auto counts = db::ReadOnly(*repository_, [&](db::Transaction& tx) {
    return repository_->CountBookingsByStatus(tx, project_id);
  });

  BookingStats stats;
  stats.active    = counts[BookingStatus::kActive];
  stats.cancelled = counts[BookingStatus::kCancelled];
  stats.total     = stats.active + stats.cancelled;
  return stats;
}

mirror::SlotRange SlotAllocator::RangeOf(const db::model::BookingRecord& booking) const {
  return mirror::RangeOf(booking, projects_->Get(booking.project_id).slot_minutes);
}

mirror::MirrorRecord SlotAllocator::MirrorRecordOf(const db::model::BookingRecord& booking) {
  return mirror::RecordOf(booking);
}

db::model::BookingRecord SlotAllocator::ReadBooking(const std::string& booking_id) {
  auto booking = db::ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->GetBooking(tx, booking_id); });
  if (!booking) throw util::NotFound("booking not found: " + booking_id);
  return *booking;
}

void SlotAllocator::QueueMirror(mirror::MirrorTask task) {
  if (!scheduler_) return;
  scheduler_->Enqueue(task);
}

} // namespace slotkeeper::core
