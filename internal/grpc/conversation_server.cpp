#include "conversation_server.hpp"

#include "grpc_error.hpp"
#include "api/slotkeeper/v1.hpp"

namespace slotkeeper::grpc {

using namespace slotkeeper::v1;

ConversationServer::ConversationServer(std::shared_ptr<slotkeeper::service::ConversationService> svc)
    : service_(std::move(svc)) {
}

::grpc::Status ConversationServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConversationServer::BeginTurn(::grpc::ServerContext*, const BeginTurnRequest* req, BeginTurnResponse* resp) {
  try {
    *resp = service_->BeginTurn(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConversationServer::ClaimWinner(::grpc::ServerContext*, const ClaimWinnerRequest* req, ClaimWinnerResponse* resp) {
  try {
    *resp = service_->ClaimWinner(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConversationServer::MarkFailed(::grpc::ServerContext*, const MarkFailedRequest* req, MarkFailedResponse* resp) {
  try {
    *resp = service_->MarkFailed(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConversationServer::QueueStats(::grpc::ServerContext*, const QueueStatsRequest* req, QueueStatsResponse* resp) {
  try {
    *resp = service_->QueueStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConversationServer::InactiveClients(::grpc::ServerContext*, const InactiveClientsRequest* req,
                                                   InactiveClientsResponse* resp) {
  try {
    *resp = service_->InactiveClients(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace slotkeeper::grpc
