#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "slotkeeper/v1/conversation_service.grpc.pb.h"
#include "internal/service/conversation_service.hpp"

namespace slotkeeper::grpc {

class ConversationServer final : public slotkeeper::v1::ConversationService::Service {
public:
  explicit ConversationServer(std::shared_ptr<slotkeeper::service::ConversationService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const slotkeeper::v1::SubmitRequest*,
                        slotkeeper::v1::SubmitResponse*) override;

  ::grpc::Status BeginTurn(::grpc::ServerContext*,
                           const slotkeeper::v1::BeginTurnRequest*,
                           slotkeeper::v1::BeginTurnResponse*) override;

  ::grpc::Status ClaimWinner(::grpc::ServerContext*,
                             const slotkeeper::v1::ClaimWinnerRequest*,
                             slotkeeper::v1::ClaimWinnerResponse*) override;

  ::grpc::Status MarkFailed(::grpc::ServerContext*,
                            const slotkeeper::v1::MarkFailedRequest*,
                            slotkeeper::v1::MarkFailedResponse*) override;

  ::grpc::Status QueueStats(::grpc::ServerContext*,
                            const slotkeeper::v1::QueueStatsRequest*,
                            slotkeeper::v1::QueueStatsResponse*) override;

  ::grpc::Status InactiveClients(::grpc::ServerContext*,
                                 const slotkeeper::v1::InactiveClientsRequest*,
                                 slotkeeper::v1::InactiveClientsResponse*) override;

private:
  std::shared_ptr<slotkeeper::service::ConversationService> service_;
};

}
