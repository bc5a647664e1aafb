#pragma once

#include <cstdint>
#include <string>

#include "internal/model/message_status.hpp"

namespace slotkeeper::db::model {

/*
  Persistent queued-message row.

  One logical inbound turn. aggregated_text carries every text folded into
  this item, oldest first.

  sequence is assigned by the store on insert and breaks created_at ties when
  the winner of a client is decided.
*/

struct QueuedMessageRecord {
  std::string id;
  std::string project_id;
  std::string client_id;

  std::string original_text;
  std::string aggregated_text;

  slotkeeper::model::MessageStatus status = slotkeeper::model::MessageStatus::kPending;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint32_t retry_count   = 0;
  uint64_t sequence      = 0;
};

// Newer-than ordering used for winner arbitration.
inline bool IsNewer(const QueuedMessageRecord& a, const QueuedMessageRecord& b) {
  if (a.created_at_ms != b.created_at_ms) {
    return a.created_at_ms > b.created_at_ms;
  }
  return a.sequence > b.sequence;
}

} // namespace slotkeeper::db::model
