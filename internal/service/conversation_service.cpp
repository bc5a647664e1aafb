#include "conversation_service.hpp"

#include "internal/core/message_coordinator.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "api/slotkeeper/v1.hpp"

namespace slotkeeper::service {

using namespace slotkeeper::v1;

ConversationService::ConversationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse ConversationService::Submit(const SubmitRequest& req) {
  return ObserveRpc("ConversationService.Submit", [&] {
    core::InboundEvent event;
    event.project_id     = req.project_id();
    event.client_id      = req.client_id();
    event.text           = req.text();
    event.retry          = req.retry();
    event.delivery_count = req.delivery_count();

    SubmitResponse resp;
    auto           item = ctx_.coordinator->Submit(event);
    if (!item) {
      resp.set_skipped(true);
      return resp;
    }
    *resp.mutable_item() = ToProto(*item);
    return resp;
  });
}

BeginTurnResponse ConversationService::BeginTurn(const BeginTurnRequest& req) {
  return ObserveRpc("ConversationService.BeginTurn", [&] {
    RequireField("item_id", req.item_id());

    BeginTurnResponse resp;
    auto              item = ctx_.coordinator->BeginTurn(req.item_id());
    if (!item) {
      resp.set_superseded(true);
      return resp;
    }
    *resp.mutable_item() = ToProto(*item);
    return resp;
  });
}

ClaimWinnerResponse ConversationService::ClaimWinner(const ClaimWinnerRequest& req) {
  return ObserveRpc("ConversationService.ClaimWinner", [&] {
    RequireField("item_id", req.item_id());

    ClaimWinnerResponse resp;
    const auto outcome = ctx_.coordinator->ClaimWinner(req.item_id());
    resp.set_outcome(outcome == core::ClaimOutcome::kWin ? CLAIM_OUTCOME_WIN : CLAIM_OUTCOME_LOSE);
    return resp;
  });
}

MarkFailedResponse ConversationService::MarkFailed(const MarkFailedRequest& req) {
  return ObserveRpc("ConversationService.MarkFailed", [&] {
    RequireField("item_id", req.item_id());
    ctx_.coordinator->MarkFailed(req.item_id());
    return MarkFailedResponse{};
  });
}

QueueStatsResponse ConversationService::QueueStats(const QueueStatsRequest& req) {
  return ObserveRpc("ConversationService.QueueStats", [&] {
    RequireField("project_id", req.project_id());

    QueueStatsResponse resp;
    for (const auto& [status, count] : ctx_.coordinator->QueueStats(req.project_id())) {
      switch (status) {
        case slotkeeper::model::MessageStatus::kPending:
          resp.set_pending(count);
          break;
        case slotkeeper::model::MessageStatus::kProcessing:
          resp.set_processing(count);
          break;
        case slotkeeper::model::MessageStatus::kCompleted:
          resp.set_completed(count);
          break;
        case slotkeeper::model::MessageStatus::kCancelled:
          resp.set_cancelled(count);
          break;
        case slotkeeper::model::MessageStatus::kSuperseded:
          resp.set_superseded(count);
          break;
      }
    }
    return resp;
  });
}

InactiveClientsResponse ConversationService::InactiveClients(const InactiveClientsRequest& req) {
  return ObserveRpc("ConversationService.InactiveClients", [&] {
    const uint32_t hours = req.hours() != 0 ? req.hours() : ctx_.archive_after_hours;

    InactiveClientsResponse resp;
    for (const auto& record : ctx_.coordinator->InactiveClients(hours)) {
      *resp.add_clients() = ToProto(record);
    }
    return resp;
  });
}

} // namespace slotkeeper::service
