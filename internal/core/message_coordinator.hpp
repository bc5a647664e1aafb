#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/message_status.hpp"
#include "internal/util/time.hpp"

namespace slotkeeper::core {

struct InboundEvent {
  std::string project_id;
  std::string client_id;
  std::string text;
  bool        retry          = false;
  uint32_t    delivery_count = 0;
};

enum class ClaimOutcome {
  kWin,
  kLose,
};

/*
  Inbound Message Coordinator

  Guarantees one visible reply per logical turn of a client:

    Submit      folds every unfinished item of the client into a new one
    BeginTurn   PENDING -> PROCESSING, or "superseded" when it already lost
    ClaimWinner exactly one of the client's items ever wins
    MarkFailed  the item is dropped from arbitration for good

  All state changes happen under the client lock scope, which covers every
  row of the client whatever its status.
*/
class MessageCoordinator {
 public:
  explicit MessageCoordinator(std::shared_ptr<db::Repository> repository, util::NowMillisFn now = util::NowMillis);

  // nullopt: provider redelivery of an event already accepted, nothing stored.
  std::optional<db::model::QueuedMessageRecord> Submit(const InboundEvent& event);

  // nullopt: the item was superseded before processing started.
  std::optional<db::model::QueuedMessageRecord> BeginTurn(const std::string& item_id);

  // WIN is only returned after the transaction committed.
  ClaimOutcome ClaimWinner(const std::string& item_id);

  void MarkFailed(const std::string& item_id);

  std::map<model::MessageStatus, uint64_t> QueueStats(const std::string& project_id);

  std::vector<db::model::ClientActivityRecord> InactiveClients(uint32_t hours);

 private:
  db::model::QueuedMessageRecord Lookup(const std::string& item_id);

  std::shared_ptr<db::Repository> repository_;
  util::NowMillisFn               now_;
};

} // namespace slotkeeper::core
