#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/core/booking_directive.hpp"
#include "internal/core/message_coordinator.hpp"

namespace slotkeeper::core {

struct TurnReply {
  std::string                     text;
  std::optional<BookingDirective> directive;
};

// Computes the reply of one turn. Runs outside every lock scope.
class TurnProcessor {
 public:
  virtual ~TurnProcessor() = default;

  virtual TurnReply Process(const db::model::QueuedMessageRecord& item) = 0;
};

class ReplyChannel {
 public:
  virtual ~ReplyChannel() = default;

  virtual void Deliver(const std::string& project_id, const std::string& client_id, const std::string& text) = 0;
};

enum class TurnOutcome {
  kSkipped,
  kSuperseded,
  kFailed,
  kDelivered,
};

struct TurnResult {
  TurnOutcome                    outcome = TurnOutcome::kSkipped;
  std::string                    item_id;
  std::optional<DirectiveResult> directive;
};

/*
  Drives one inbound event through the coordinator:

    Submit -> BeginTurn -> Process -> directive -> ClaimWinner -> Deliver

  The reply is delivered only on WIN. A processor exception or a store
  failure while executing the directive marks the item failed.
*/
class TurnRunner {
 public:
  TurnRunner(std::shared_ptr<MessageCoordinator> coordinator, std::shared_ptr<DirectiveExecutor> executor,
             std::shared_ptr<TurnProcessor> processor, std::shared_ptr<ReplyChannel> channel);

  TurnResult Run(const InboundEvent& event);

 private:
  TurnResult Drive(const InboundEvent& event);
  void       Fail(const std::string& item_id);

  std::shared_ptr<MessageCoordinator> coordinator_;
  std::shared_ptr<DirectiveExecutor>  executor_;
  std::shared_ptr<TurnProcessor>      processor_;
  std::shared_ptr<ReplyChannel>       channel_;
};

std::string_view ToString(TurnOutcome outcome);

} // namespace slotkeeper::core
