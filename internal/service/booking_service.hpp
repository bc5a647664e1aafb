#pragma once

#include "service_context.hpp"
#include "slotkeeper/v1/booking.pb.h"

namespace slotkeeper::service {

class BookingService {
public:
  explicit BookingService(ServiceContext ctx);

  slotkeeper::v1::GetAvailableSlotsResponse
  GetAvailableSlots(const slotkeeper::v1::GetAvailableSlotsRequest& req);

  slotkeeper::v1::AllocateResponse
  Allocate(const slotkeeper::v1::AllocateRequest& req);

  slotkeeper::v1::CancelResponse
  Cancel(const slotkeeper::v1::CancelRequest& req);

  slotkeeper::v1::ChangeResponse
  Change(const slotkeeper::v1::ChangeRequest& req);

  slotkeeper::v1::ListClientBookingsResponse
  ListClientBookings(const slotkeeper::v1::ListClientBookingsRequest& req);

  slotkeeper::v1::BookingStatsResponse
  BookingStats(const slotkeeper::v1::BookingStatsRequest& req);

  // Runs a sweep now: one day when project, specialist and date are set,
  // otherwise every configured project over the horizon.
  slotkeeper::v1::ReconcileResponse
  Reconcile(const slotkeeper::v1::ReconcileRequest& req);

private:
  ServiceContext ctx_;
};

}
