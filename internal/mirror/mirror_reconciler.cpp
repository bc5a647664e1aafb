#include "internal/mirror/mirror_reconciler.hpp"

#include <chrono>
#include <map>
#include <set>
#include <utility>

#include "internal/db/scoped_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace slotkeeper::mirror {

using slotkeeper::model::BookingStatus;
using namespace slotkeeper::observability;

namespace {

int EndMinute(const db::model::BookingRecord& booking, int slot_minutes) {
  return booking.start_minute + booking.duration_slots * slot_minutes;
}

bool Overlaps(const db::model::BookingRecord& booking, const MirrorBlock& block, int slot_minutes) {
  const int block_end = block.start.minutes + block.duration_slots * slot_minutes;
  return booking.start_minute < block_end && block.start.minutes < EndMinute(booking, slot_minutes);
}

// (revision, mirror_synced) per booking id. Every store write bumps the
// revision and a mirror sync flips the flag, so equal stamps mean the
// mirror day was read against the same local state.
using DayStamp = std::map<std::string, std::pair<uint64_t, bool>>;

DayStamp StampOf(const std::vector<db::model::BookingRecord>& bookings) {
  DayStamp stamp;
  for (const auto& booking : bookings) stamp[booking.id] = {booking.revision, booking.mirror_synced};
  return stamp;
}

bool SameFields(const db::model::BookingRecord& booking, const MirrorBlock& block) {
  return booking.client_id == block.record.client_id && booking.client_name == block.record.client_name &&
         booking.service_name == block.record.service && booking.duration_slots == block.duration_slots;
}

} // namespace

ReconcileReport& ReconcileReport::operator+=(const ReconcileReport& other) {
  days += other.days;
  failed_days += other.failed_days;
  repushed += other.repushed;
  cancelled += other.cancelled;
  overwritten += other.overwritten;
  imported += other.imported;
  deferred += other.deferred;
  recleared += other.recleared;
  return *this;
}

std::vector<MirrorBlock> GroupBlocks(const std::vector<MirrorRow>& rows, int slot_minutes) {
  std::vector<MirrorBlock> blocks;
  for (const auto& row : rows) {
    if (row.record.IsContinuation()) {
      if (!blocks.empty()) {
        auto& last = blocks.back();
        if (last.start.minutes + last.duration_slots * slot_minutes == row.time.minutes) {
          ++last.duration_slots;
        }
      }
      continue;
    }
    blocks.push_back({row.time, 1, row.record});
  }
  return blocks;
}

MirrorReconciler::MirrorReconciler(std::shared_ptr<db::Repository> repository,
                                   std::shared_ptr<const model::ProjectRegistry> projects,
                                   std::shared_ptr<BookingMirror> mirror, std::shared_ptr<MirrorSync> sync,
                                   uint64_t grace_period_ms, util::NowMillisFn now)
    : repository_(std::move(repository)),
      projects_(std::move(projects)),
      mirror_(std::move(mirror)),
      sync_(std::move(sync)),
      grace_period_ms_(grace_period_ms),
      now_(std::move(now)) {
}

ReconcileReport MirrorReconciler::ReconcileDay(const std::string& project_id, const std::string& specialist,
                                               const model::CivilDate& date) {
  const auto& settings     = projects_->Get(project_id);
  const int   slot_minutes = settings.slot_minutes;
  const auto  iso          = date.ToIso();

  const auto before = StampOf(db::ReadOnly(*repository_, [&](db::Transaction& tx) {
    return repository_->ListDayBookings(tx, project_id, specialist, iso);
  }));
  const auto blocks = GroupBlocks(mirror_->ReadDay(project_id, specialist, date), slot_minutes);

  ReconcileReport report;
  report.days = 1;

  std::vector<MirrorTask> clears;
  std::vector<MirrorTask> pushes;
  bool                    day_moved = false;

  db::WithScopes(*repository_, {db::LockScope::Calendar(project_id, specialist, iso)}, [&](db::Transaction& tx) {
    const auto now      = now_();
    auto       bookings = repository_->ListDayBookings(tx, project_id, specialist, iso);

    // the mirror read may predate a booking write or mirror apply
    if (StampOf(bookings) != before) {
      day_moved = true;
      return;
    }

    auto save = [&](db::model::BookingRecord& booking, const char* context) {
      booking.revision += 1;
      booking.updated_at_ms = now;
      db::ThrowIfDbError(repository_->UpdateBooking(tx, booking), context);
    };

    auto block_at = [&](int minute) -> const MirrorBlock* {
      for (const auto& block : blocks) {
        if (block.start.minutes == minute) return &block;
      }
      return nullptr;
    };

    // blocks matched by an active local booking starting at the same row,
    // keyed by start with the booking's synced flag
    std::map<int, bool> matched;

    // bookings that must not be pushed because a mirror block owns their rows
    std::set<std::string> held_back;

    // Active bookings other than `owner` overlapping the block. in_grace is set
    // when one of them is unsynced and was touched within the grace period,
    // blocked when one of them is already synced.
    auto overlapping = [&](const MirrorBlock& block, const std::string& owner, bool& in_grace, bool& blocked) {
      std::vector<db::model::BookingRecord*> found;
      for (auto& other : bookings) {
        if (other.status != BookingStatus::kActive || other.id == owner) continue;
        if (!Overlaps(other, block, slot_minutes)) continue;
        if (other.mirror_synced) {
          blocked = true;
          continue;
        }
        found.push_back(&other);
        if (other.updated_at_ms + grace_period_ms_ > now) in_grace = true;
      }
      return found;
    };

    auto displace = [&](const std::vector<db::model::BookingRecord*>& displaced) {
      for (auto* booking : displaced) {
        booking->status = BookingStatus::kCancelled;
        // the mirror already shows the block; nothing to clear
        booking->mirror_synced = true;
        save(*booking, "cancel booking displaced by mirror");
        ++report.cancelled;
        LogInfo("booking displaced by mirror block, cancelled", {StringField("booking_id", booking->id)});
      }
    };

    for (auto& booking : bookings) {
      if (booking.status != BookingStatus::kActive) continue;

      const auto* block = block_at(booking.start_minute);
      if (block) matched[block->start.minutes] = booking.mirror_synced;
      if (!booking.mirror_synced) continue;

      if (!block) {
        booking.status = BookingStatus::kCancelled;
        save(booking, "cancel booking missing from mirror");
        ++report.cancelled;
        LogInfo("booking removed in mirror, cancelled", {StringField("booking_id", booking.id)});
        continue;
      }

      if (!SameFields(booking, *block)) {
        bool in_grace = false;
        bool blocked  = false;
        const auto displaced = overlapping(*block, booking.id, in_grace, blocked);
        if (blocked || in_grace) {
          for (auto* other : displaced) held_back.insert(other->id);
          ++report.deferred;
          LogInfo("mirror edit overlaps another booking, deferred",
                  {StringField("booking_id", booking.id), IntField("duration_slots", block->duration_slots)});
          continue;
        }
        displace(displaced);

        booking.client_id      = block->record.client_id;
        booking.client_name    = block->record.client_name;
        booking.service_name   = block->record.service;
        booking.duration_slots = block->duration_slots;
        save(booking, "overwrite booking from mirror");
        ++report.overwritten;
        LogInfo("booking edited in mirror, overwritten", {StringField("booking_id", booking.id)});
      }
    }

    // cancelled bookings the mirror still shows; a block now owned by a synced
    // active booking is left alone
    std::set<int> pending_clear;

    for (auto& booking : bookings) {
      if (booking.status != BookingStatus::kCancelled || booking.mirror_synced) continue;

      const auto* block = block_at(booking.start_minute);
      const auto  owner = block ? matched.find(block->start.minutes) : matched.end();
      if (block && block->record.client_id == booking.client_id && (owner == matched.end() || !owner->second)) {
        MirrorTask task;
        task.booking_id = booking.id;
        task.revision   = booking.revision;
        task.clear      = SlotRange{project_id, specialist, date, block->start, block->duration_slots, slot_minutes};
        clears.push_back(std::move(task));
        pending_clear.insert(block->start.minutes);
        continue;
      }

      booking.mirror_synced = true;
      db::ThrowIfDbError(repository_->UpdateBooking(tx, booking), "mark cancelled booking synced");
    }

    for (const auto& block : blocks) {
      if (matched.contains(block.start.minutes) || pending_clear.contains(block.start.minutes)) continue;

      bool       in_grace  = false;
      bool       blocked   = false;
      const auto displaced = overlapping(block, std::string(), in_grace, blocked);
      if (blocked || in_grace) {
        for (auto* booking : displaced) held_back.insert(booking->id);
        ++report.deferred;
        if (blocked) {
          LogWarn("mirror block overlaps a synced booking, not imported",
                  {StringField("date", iso), StringField("start", block.start.ToString())});
        }
        continue;
      }
      displace(displaced);

      db::model::BookingRecord imported;
      imported.id             = util::NewId();
      imported.project_id     = project_id;
      imported.specialist     = specialist;
      imported.date           = iso;
      imported.start_minute   = block.start.minutes;
      imported.duration_slots = block.duration_slots;
      imported.client_id      = block.record.client_id;
      imported.client_name    = block.record.client_name;
      imported.service_name   = block.record.service;
      imported.status         = BookingStatus::kActive;
      imported.revision       = 1;
      imported.mirror_synced  = true;
      imported.created_at_ms  = now;
      imported.updated_at_ms  = now;
      db::ThrowIfDbError(repository_->InsertBooking(tx, imported), "import mirror booking");
      ++report.imported;
      LogInfo("mirror block imported", {StringField("booking_id", imported.id), StringField("date", iso),
                                        StringField("start", block.start.ToString())});
    }

    for (auto& booking : bookings) {
      if (booking.status != BookingStatus::kActive || booking.mirror_synced) continue;
      if (held_back.contains(booking.id)) continue;

      MirrorTask task;
      task.booking_id = booking.id;
      task.revision   = booking.revision;
      task.set        = RangeOf(booking, slot_minutes);
      task.record     = RecordOf(booking);
      pushes.push_back(std::move(task));
    }
  });

  if (day_moved) {
    ++report.deferred;
    LogInfo("bookings changed while the mirror was read, day deferred",
            {StringField("project_id", project_id), StringField("specialist", specialist), StringField("date", iso)});
    return report;
  }

  // clears first so a rebooked row ends up showing the new booking
  pushes.insert(pushes.begin(), clears.begin(), clears.end());

  for (const auto& task : pushes) {
    try {
      sync_->Apply(task);
      if (task.set) {
        ++report.repushed;
      } else {
        ++report.recleared;
      }
    } catch (const util::MirrorSyncError& e) {
      LogWarn("mirror repush failed", {StringField("booking_id", task.booking_id), StringField("error", e.what())});
    }
  }

  return report;
}

ReconcileReport MirrorReconciler::ReconcileAll(const model::CivilDate& from, int horizon_days) {
  ReconcileReport          total;
  observability::SpanScope span("MirrorReconciler.ReconcileAll");

  for (const auto& settings : projects_->All()) {
    for (const auto& specialist : settings.specialists) {
      for (int offset = 0; offset < horizon_days; ++offset) {
        const auto date       = from.AddDays(offset);
        const auto started_at = std::chrono::steady_clock::now();
        const auto observe    = [&](bool success) {
          observability::Metrics::Instance().ObserveMirrorSyncMs(
              "reconcile", success,
              std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
        };
        try {
          total += ReconcileDay(settings.project_id, specialist, date);
          observe(true);
        } catch (const util::MirrorSyncError& e) {
          observe(false);
          ++total.failed_days;
          LogWarn("reconcile day skipped, mirror unreadable",
                  {StringField("project_id", settings.project_id), StringField("specialist", specialist),
                   StringField("date", date.ToIso()), StringField("error", e.what())});
        } catch (const util::StoreUnavailable& e) {
          observe(false);
          ++total.failed_days;
          LogWarn("reconcile day skipped, store unavailable",
                  {StringField("project_id", settings.project_id), StringField("specialist", specialist),
                   StringField("date", date.ToIso()), StringField("error", e.what())});
        }
      }
    }
  }

  LogInfo("reconcile pass finished",
          {IntField("days", static_cast<int64_t>(total.days)), IntField("failed_days", static_cast<int64_t>(total.failed_days)),
           IntField("repushed", static_cast<int64_t>(total.repushed)),
           IntField("cancelled", static_cast<int64_t>(total.cancelled)),
           IntField("overwritten", static_cast<int64_t>(total.overwritten)),
           IntField("imported", static_cast<int64_t>(total.imported)),
           IntField("deferred", static_cast<int64_t>(total.deferred))});
  span.SetAttribute("days", static_cast<int64_t>(total.days));
  span.SetAttribute("failed_days", static_cast<int64_t>(total.failed_days));
  return total;
}

} // namespace slotkeeper::mirror
