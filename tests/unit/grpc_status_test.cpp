#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "api/slotkeeper/v1.hpp"
#include "internal/core/message_coordinator.hpp"
#include "internal/core/slot_allocator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/booking_server.hpp"
#include "internal/grpc/conversation_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/mirror/memory_mirror.hpp"
#include "internal/service/booking_service.hpp"
#include "internal/service/conversation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

slotkeeper::service::ServiceContext BuildServiceContext() {
  slotkeeper::model::ProjectSettings settings;
  settings.project_id  = "salon";
  settings.specialists = {"Anna"};

  slotkeeper::service::ServiceContext ctx;
  auto repository  = std::make_shared<slotkeeper::db::memory::MemoryRepository>();
  auto projects    = std::make_shared<const slotkeeper::model::ProjectRegistry>(
      std::vector<slotkeeper::model::ProjectSettings>{settings});
  ctx.repository  = repository;
  ctx.coordinator = std::make_shared<slotkeeper::core::MessageCoordinator>(repository);
  ctx.allocator   = std::make_shared<slotkeeper::core::SlotAllocator>(
      repository, projects, std::make_shared<slotkeeper::mirror::MemoryMirror>(),
      std::make_shared<slotkeeper::mirror::MirrorScheduler>());
  return ctx;
}

slotkeeper::v1::AllocateRequest AllocateAt(const std::string& client, const std::string& time) {
  slotkeeper::v1::AllocateRequest req;
  req.set_project_id("salon");
  req.set_specialist("Anna");
  req.set_date("2026-03-02");
  req.set_start_time(time);
  req.set_duration_slots(2);
  req.mutable_details()->set_client_id(client);
  return req;
}

void TestAllocateOkAndConflictReturnsAborted() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<slotkeeper::service::BookingService>(ctx);
  slotkeeper::grpc::BookingServer server(service);

  ::grpc::ServerContext            grpc_ctx;
  slotkeeper::v1::AllocateResponse resp;

  auto first = AllocateAt("c1", "10:00");
  assert(server.Allocate(&grpc_ctx, &first, &resp).ok());
  assert(resp.booking().start_time() == "10:00");

  auto second = AllocateAt("c2", "10:30");
  const auto status = server.Allocate(&grpc_ctx, &second, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
}

void TestMisalignedStartReturnsInvalidArgument() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<slotkeeper::service::BookingService>(ctx);
  slotkeeper::grpc::BookingServer server(service);

  ::grpc::ServerContext            grpc_ctx;
  slotkeeper::v1::AllocateResponse resp;
  auto                             req = AllocateAt("c1", "10:10");

  const auto status = server.Allocate(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCancelMissingBookingReturnsNotFound() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<slotkeeper::service::BookingService>(ctx);
  slotkeeper::grpc::BookingServer server(service);

  slotkeeper::v1::CancelRequest req;
  req.set_booking_id("missing-booking");
  slotkeeper::v1::CancelResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.Cancel(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestReconcileWithoutReconcilerReturnsFailedPrecondition() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<slotkeeper::service::BookingService>(ctx);
  slotkeeper::grpc::BookingServer server(service);

  slotkeeper::v1::ReconcileRequest  req;
  slotkeeper::v1::ReconcileResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  const auto status = server.Reconcile(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestBeginTurnOnFinishedItemReturnsFailedPrecondition() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<slotkeeper::service::ConversationService>(ctx);
  slotkeeper::grpc::ConversationServer server(service);
  ::grpc::ServerContext                grpc_ctx;

  slotkeeper::v1::SubmitRequest submit;
  submit.set_project_id("salon");
  submit.set_client_id("c1");
  submit.set_text("hi");
  slotkeeper::v1::SubmitResponse submitted;
  assert(server.Submit(&grpc_ctx, &submit, &submitted).ok());

  slotkeeper::v1::MarkFailedRequest failed;
  failed.set_item_id(submitted.item().id());
  slotkeeper::v1::MarkFailedResponse failed_resp;
  assert(server.MarkFailed(&grpc_ctx, &failed, &failed_resp).ok());

  slotkeeper::v1::BeginTurnRequest  begin;
  slotkeeper::v1::BeginTurnResponse begin_resp;
  begin.set_item_id(submitted.item().id());
  const auto status = server.BeginTurn(&grpc_ctx, &begin, &begin_resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  slotkeeper::v1::SubmitRequest anonymous;
  const auto invalid = server.Submit(&grpc_ctx, &anonymous, &submitted);
  assert(invalid.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnavailableMapping() {
  using slotkeeper::grpc::ToStatus;
  assert(ToStatus(slotkeeper::util::StoreUnavailable("db down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(slotkeeper::util::MirrorSyncError("sheet down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(slotkeeper::util::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestAllocateOkAndConflictReturnsAborted();
  TestMisalignedStartReturnsInvalidArgument();
  TestCancelMissingBookingReturnsNotFound();
  TestReconcileWithoutReconcilerReturnsFailedPrecondition();
  TestBeginTurnOnFinishedItemReturnsFailedPrecondition();
  TestUnavailableMapping();

  std::cout << "slotkeeper_unit_grpc_status: pass\n";
  return 0;
}
