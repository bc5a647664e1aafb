#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace slotkeeper::model {

enum class MessageStatus : std::uint8_t {
  kPending = 1,
  kProcessing = 2,
  kCompleted = 3,
  kCancelled = 4,
  kSuperseded = 5,
};

constexpr bool IsTerminal(MessageStatus status) {
  return status == MessageStatus::kCompleted || status == MessageStatus::kCancelled ||
         status == MessageStatus::kSuperseded;
}

// PENDING -> {PROCESSING, SUPERSEDED}
// PROCESSING -> {COMPLETED, CANCELLED, SUPERSEDED}
// terminal states have no outward edges.
constexpr bool CanTransition(MessageStatus from, MessageStatus to) {
  switch (from) {
    case MessageStatus::kPending:
      return to == MessageStatus::kProcessing || to == MessageStatus::kSuperseded;
    case MessageStatus::kProcessing:
      return to == MessageStatus::kCompleted || to == MessageStatus::kCancelled ||
             to == MessageStatus::kSuperseded;
    case MessageStatus::kCompleted:
    case MessageStatus::kCancelled:
    case MessageStatus::kSuperseded:
    default:
      return false;
  }
}

constexpr std::string_view ToString(MessageStatus status) {
  switch (status) {
    case MessageStatus::kPending:
      return "pending";
    case MessageStatus::kProcessing:
      return "processing";
    case MessageStatus::kCompleted:
      return "completed";
    case MessageStatus::kCancelled:
      return "cancelled";
    case MessageStatus::kSuperseded:
    default:
      return "superseded";
  }
}

constexpr std::optional<MessageStatus> MessageStatusFromString(std::string_view value) {
  for (auto status : {MessageStatus::kPending, MessageStatus::kProcessing, MessageStatus::kCompleted,
                      MessageStatus::kCancelled, MessageStatus::kSuperseded}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace slotkeeper::model
