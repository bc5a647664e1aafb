#include "booking_server.hpp"

#include "grpc_error.hpp"
#include "api/slotkeeper/v1.hpp"

namespace slotkeeper::grpc {

using namespace slotkeeper::v1;

BookingServer::BookingServer(std::shared_ptr<slotkeeper::service::BookingService> svc) : service_(std::move(svc)) {
}

::grpc::Status BookingServer::GetAvailableSlots(::grpc::ServerContext*, const GetAvailableSlotsRequest* req,
                                                GetAvailableSlotsResponse* resp) {
  try {
    *resp = service_->GetAvailableSlots(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::Allocate(::grpc::ServerContext*, const AllocateRequest* req, AllocateResponse* resp) {
  try {
    *resp = service_->Allocate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::Change(::grpc::ServerContext*, const ChangeRequest* req, ChangeResponse* resp) {
  try {
    *resp = service_->Change(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::ListClientBookings(::grpc::ServerContext*, const ListClientBookingsRequest* req,
                                                 ListClientBookingsResponse* resp) {
  try {
    *resp = service_->ListClientBookings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::BookingStats(::grpc::ServerContext*, const BookingStatsRequest* req, BookingStatsResponse* resp) {
  try {
    *resp = service_->BookingStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BookingServer::Reconcile(::grpc::ServerContext*, const ReconcileRequest* req, ReconcileResponse* resp) {
  try {
    *resp = service_->Reconcile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace slotkeeper::grpc
