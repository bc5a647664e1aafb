#include "booking_service.hpp"

#include <algorithm>
#include <limits>

#include "internal/core/slot_allocator.hpp"
#include "internal/mirror/mirror_reconciler.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"
#include "api/slotkeeper/v1.hpp"

namespace slotkeeper::service {

using namespace slotkeeper::v1;

namespace {

core::BookingDetails FromProto(const slotkeeper::v1::BookingDetails& details) {
  return core::BookingDetails{details.client_id(), details.client_name(), details.client_phone(), details.service_name()};
}

// Values past INT_MAX saturate; the allocator rejects anything longer than the day.
int DurationOrOne(uint32_t duration_slots) {
  if (duration_slots == 0) return 1;
  return static_cast<int>(std::min<uint32_t>(duration_slots, std::numeric_limits<int>::max()));
}

} // namespace

BookingService::BookingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetAvailableSlotsResponse BookingService::GetAvailableSlots(const GetAvailableSlotsRequest& req) {
  return ObserveRpc("BookingService.GetAvailableSlots", [&] {
    RequireField("project_id", req.project_id());
    RequireField("specialist", req.specialist());
    const auto date = ParseDateField("date", req.date());

    GetAvailableSlotsResponse resp;
    for (const auto& start :
         ctx_.allocator->GetAvailableSlots(req.project_id(), req.specialist(), date, DurationOrOne(req.duration_slots()))) {
      resp.add_start_times(start.ToString());
    }
    return resp;
  });
}

AllocateResponse BookingService::Allocate(const AllocateRequest& req) {
  return ObserveRpc("BookingService.Allocate", [&] {
    RequireField("project_id", req.project_id());
    RequireField("specialist", req.specialist());
    RequireField("details.client_id", req.details().client_id());
    const auto date  = ParseDateField("date", req.date());
    const auto start = ParseTimeField("start_time", req.start_time());

    AllocateResponse resp;
    *resp.mutable_booking() = ToProto(ctx_.allocator->Allocate(req.project_id(), req.specialist(), date, start,
                                                               DurationOrOne(req.duration_slots()),
                                                               FromProto(req.details())));
    return resp;
  });
}

CancelResponse BookingService::Cancel(const CancelRequest& req) {
  return ObserveRpc("BookingService.Cancel", [&] {
    RequireField("booking_id", req.booking_id());

    CancelResponse resp;
    *resp.mutable_booking() = ToProto(ctx_.allocator->Cancel(req.booking_id()));
    return resp;
  });
}

ChangeResponse BookingService::Change(const ChangeRequest& req) {
  return ObserveRpc("BookingService.Change", [&] {
    RequireField("booking_id", req.booking_id());
    RequireField("specialist", req.specialist());
    const auto date  = ParseDateField("date", req.date());
    const auto start = ParseTimeField("start_time", req.start_time());

    std::optional<core::BookingDetails> details;
    if (req.has_details()) {
      details = FromProto(req.details());
    }

    ChangeResponse resp;
    *resp.mutable_booking() = ToProto(ctx_.allocator->Change(req.booking_id(), req.specialist(), date, start,
                                                             DurationOrOne(req.duration_slots()), details));
    return resp;
  });
}

ListClientBookingsResponse BookingService::ListClientBookings(const ListClientBookingsRequest& req) {
  return ObserveRpc("BookingService.ListClientBookings", [&] {
    RequireField("project_id", req.project_id());
    RequireField("client_id", req.client_id());

    ListClientBookingsResponse resp;
    for (const auto& booking : ctx_.allocator->ClientBookings(req.project_id(), req.client_id())) {
      *resp.add_bookings() = ToProto(booking);
    }
    return resp;
  });
}

BookingStatsResponse BookingService::BookingStats(const BookingStatsRequest& req) {
  return ObserveRpc("BookingService.BookingStats", [&] {
    RequireField("project_id", req.project_id());

    const auto           stats = ctx_.allocator->Stats(req.project_id());
    BookingStatsResponse resp;
    resp.set_total(stats.total);
    resp.set_active(stats.active);
    resp.set_cancelled(stats.cancelled);
    return resp;
  });
}

ReconcileResponse BookingService::Reconcile(const ReconcileRequest& req) {
  return ObserveRpc("BookingService.Reconcile", [&] {
    if (!ctx_.reconciler) {
      throw util::InvalidState("reconciliation is disabled");
    }

    mirror::ReconcileReport report;
    if (req.project_id().empty()) {
      report = ctx_.reconciler->ReconcileAll(model::CivilDate::Today(), static_cast<int>(ctx_.reconcile_horizon_days));
    } else {
      RequireField("specialist", req.specialist());
      report = ctx_.reconciler->ReconcileDay(req.project_id(), req.specialist(), ParseDateField("date", req.date()));
    }

    ReconcileResponse resp;
    resp.set_days(report.days);
    resp.set_failed_days(report.failed_days);
    resp.set_repushed(report.repushed);
    resp.set_cancelled(report.cancelled);
    resp.set_overwritten(report.overwritten);
    resp.set_imported(report.imported);
    resp.set_deferred(report.deferred);
    resp.set_recleared(report.recleared);
    return resp;
  });
}

} // namespace slotkeeper::service
