#pragma once

#include "service_context.hpp"
#include "slotkeeper/v1/conversation.pb.h"

namespace slotkeeper::service {

class ConversationService {
public:
  explicit ConversationService(ServiceContext ctx);

  slotkeeper::v1::SubmitResponse
  Submit(const slotkeeper::v1::SubmitRequest& req);

  slotkeeper::v1::BeginTurnResponse
  BeginTurn(const slotkeeper::v1::BeginTurnRequest& req);

  slotkeeper::v1::ClaimWinnerResponse
  ClaimWinner(const slotkeeper::v1::ClaimWinnerRequest& req);

  slotkeeper::v1::MarkFailedResponse
  MarkFailed(const slotkeeper::v1::MarkFailedRequest& req);

  slotkeeper::v1::QueueStatsResponse
  QueueStats(const slotkeeper::v1::QueueStatsRequest& req);

  slotkeeper::v1::InactiveClientsResponse
  InactiveClients(const slotkeeper::v1::InactiveClientsRequest& req);

private:
  ServiceContext ctx_;
};

}
