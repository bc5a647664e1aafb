#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/mirror/booking_mirror.hpp"
#include "internal/mirror/mirror_sync.hpp"
#include "internal/model/project.hpp"
#include "internal/util/time.hpp"

namespace slotkeeper::mirror {

struct ReconcileReport {
  uint64_t days        = 0;
  uint64_t failed_days = 0;
  uint64_t repushed    = 0;
  uint64_t cancelled   = 0;
  uint64_t overwritten = 0;
  uint64_t imported    = 0;
  uint64_t deferred    = 0;
  uint64_t recleared   = 0;

  ReconcileReport& operator+=(const ReconcileReport& other);
};

// Contiguous mirror rows of one booking: a head row plus continuation rows.
struct MirrorBlock {
  model::TimeOfDay start;
  int              duration_slots = 1;
  MirrorRecord     record;
};

// Groups ReadDay rows into blocks. Continuation rows without a head are dropped.
std::vector<MirrorBlock> GroupBlocks(const std::vector<MirrorRow>& rows, int slot_minutes);

/*
  Mirror Reconciler

  The mirror wins on divergence. Per (project, specialist, date):

  - unsynced active bookings are pushed again
  - synced active bookings missing from the mirror are cancelled
  - synced active bookings whose mirror fields differ take the mirror fields
  - mirror blocks without a local booking are imported; unsynced local
    bookings overlapping such a block are cancelled, unless updated within
    the grace period, in which case the block waits for the next sweep
  - a mirror edit that would make a synced booking overlap another active
    booking follows the same grace rule, and never overlaps a synced one
  - cancelled unsynced bookings still shown in the mirror are cleared again

  The mirror is read before and written after the calendar scope is held.
  When the day's bookings changed between that read and the scope, the whole
  day is deferred to the next sweep.
*/
class MirrorReconciler {
 public:
  MirrorReconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<const model::ProjectRegistry> projects,
                   std::shared_ptr<BookingMirror> mirror, std::shared_ptr<MirrorSync> sync, uint64_t grace_period_ms,
                   util::NowMillisFn now = util::NowMillis);

  // Throws util::MirrorSyncError when the mirror day cannot be read.
  ReconcileReport ReconcileDay(const std::string& project_id, const std::string& specialist,
                               const model::CivilDate& date);

  // Every configured project and specialist over [from, from + horizon_days).
  // Per-day failures are logged and counted.
  ReconcileReport ReconcileAll(const model::CivilDate& from, int horizon_days);

 private:
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const model::ProjectRegistry> projects_;
  std::shared_ptr<BookingMirror>                mirror_;
  std::shared_ptr<MirrorSync>                   sync_;
  uint64_t                                      grace_period_ms_;
  util::NowMillisFn                             now_;
};

} // namespace slotkeeper::mirror
