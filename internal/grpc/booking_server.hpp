#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "slotkeeper/v1/booking_service.grpc.pb.h"
#include "internal/service/booking_service.hpp"

namespace slotkeeper::grpc {

class BookingServer final : public slotkeeper::v1::BookingService::Service {
public:
  explicit BookingServer(std::shared_ptr<slotkeeper::service::BookingService> svc);

  ::grpc::Status GetAvailableSlots(::grpc::ServerContext*,
                                   const slotkeeper::v1::GetAvailableSlotsRequest*,
                                   slotkeeper::v1::GetAvailableSlotsResponse*) override;

  ::grpc::Status Allocate(::grpc::ServerContext*,
                          const slotkeeper::v1::AllocateRequest*,
                          slotkeeper::v1::AllocateResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*,
                        const slotkeeper::v1::CancelRequest*,
                        slotkeeper::v1::CancelResponse*) override;

  ::grpc::Status Change(::grpc::ServerContext*,
                        const slotkeeper::v1::ChangeRequest*,
                        slotkeeper::v1::ChangeResponse*) override;

  ::grpc::Status ListClientBookings(::grpc::ServerContext*,
                                    const slotkeeper::v1::ListClientBookingsRequest*,
                                    slotkeeper::v1::ListClientBookingsResponse*) override;

  ::grpc::Status BookingStats(::grpc::ServerContext*,
                              const slotkeeper::v1::BookingStatsRequest*,
                              slotkeeper::v1::BookingStatsResponse*) override;

  ::grpc::Status Reconcile(::grpc::ServerContext*,
                           const slotkeeper::v1::ReconcileRequest*,
                           slotkeeper::v1::ReconcileResponse*) override;

private:
  std::shared_ptr<slotkeeper::service::BookingService> service_;
};

}
