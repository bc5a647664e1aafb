#include "internal/core/turn_runner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace slotkeeper::core {

using namespace slotkeeper::observability;

std::string_view ToString(TurnOutcome outcome) {
  switch (outcome) {
    case TurnOutcome::kSkipped:
      return "skipped";
    case TurnOutcome::kSuperseded:
      return "superseded";
    case TurnOutcome::kFailed:
      return "failed";
    case TurnOutcome::kDelivered:
    default:
      return "delivered";
  }
}

TurnRunner::TurnRunner(std::shared_ptr<MessageCoordinator> coordinator, std::shared_ptr<DirectiveExecutor> executor,
                       std::shared_ptr<TurnProcessor> processor, std::shared_ptr<ReplyChannel> channel)
    : coordinator_(std::move(coordinator)),
      executor_(std::move(executor)),
      processor_(std::move(processor)),
      channel_(std::move(channel)) {
}

void TurnRunner::Fail(const std::string& item_id) {
  try {
    coordinator_->MarkFailed(item_id);
  } catch (const util::StoreUnavailable& e) {
    LogError("could not mark turn failed", {StringField("item_id", item_id), StringField("error", e.what())});
  }
}

TurnResult TurnRunner::Run(const InboundEvent& event) {
  auto result = Drive(event);
  Metrics::Instance().RecordTurnOutcome(ToString(result.outcome));
  return result;
}

TurnResult TurnRunner::Drive(const InboundEvent& event) {
  TurnResult result;

  auto item = coordinator_->Submit(event);
  if (!item) {
    result.outcome = TurnOutcome::kSkipped;
    return result;
  }
  result.item_id = item->id;

  auto started = coordinator_->BeginTurn(item->id);
  if (!started) {
    result.outcome = TurnOutcome::kSuperseded;
    return result;
  }

  TurnReply reply;
  try {
    reply = processor_->Process(*started);
  } catch (const std::exception& e) {
    LogError("turn processor failed", {StringField("item_id", item->id), StringField("error", e.what())});
    Fail(item->id);
    result.outcome = TurnOutcome::kFailed;
    return result;
  }

  if (reply.directive && executor_) {
    try {
      result.directive = executor_->Execute(event.project_id, event.client_id, *reply.directive);
    } catch (const util::StoreUnavailable& e) {
      LogError("booking directive failed", {StringField("item_id", item->id), StringField("error", e.what())});
      Fail(item->id);
      result.outcome = TurnOutcome::kFailed;
      return result;
    }
  }

  if (coordinator_->ClaimWinner(item->id) != ClaimOutcome::kWin) {
    result.outcome = TurnOutcome::kSuperseded;
    return result;
  }

  channel_->Deliver(event.project_id, event.client_id, reply.text);
  result.outcome = TurnOutcome::kDelivered;
  return result;
}

} // namespace slotkeeper::core
