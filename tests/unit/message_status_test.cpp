#include <cassert>
#include <iostream>

#include "internal/model/booking_status.hpp"
#include "internal/model/message_status.hpp"

namespace {

using slotkeeper::model::BookingStatus;
using slotkeeper::model::CanTransition;
using slotkeeper::model::IsTerminal;
using slotkeeper::model::MessageStatus;

void TestAllowedTransitions() {
  assert(CanTransition(MessageStatus::kPending, MessageStatus::kProcessing));
  assert(CanTransition(MessageStatus::kPending, MessageStatus::kSuperseded));
  assert(CanTransition(MessageStatus::kProcessing, MessageStatus::kCompleted));
  assert(CanTransition(MessageStatus::kProcessing, MessageStatus::kCancelled));
  assert(CanTransition(MessageStatus::kProcessing, MessageStatus::kSuperseded));
}

void TestRejectedTransitions() {
  assert(!CanTransition(MessageStatus::kPending, MessageStatus::kCompleted));
  assert(!CanTransition(MessageStatus::kPending, MessageStatus::kCancelled));
  assert(!CanTransition(MessageStatus::kProcessing, MessageStatus::kPending));

  for (auto terminal : {MessageStatus::kCompleted, MessageStatus::kCancelled, MessageStatus::kSuperseded}) {
    assert(IsTerminal(terminal));
    for (auto to : {MessageStatus::kPending, MessageStatus::kProcessing, MessageStatus::kCompleted,
                    MessageStatus::kCancelled, MessageStatus::kSuperseded}) {
      assert(!CanTransition(terminal, to));
    }
  }
  assert(!IsTerminal(MessageStatus::kPending));
  assert(!IsTerminal(MessageStatus::kProcessing));
}

void TestStringRoundTrip() {
  for (auto status : {MessageStatus::kPending, MessageStatus::kProcessing, MessageStatus::kCompleted,
                      MessageStatus::kCancelled, MessageStatus::kSuperseded}) {
    auto parsed = slotkeeper::model::MessageStatusFromString(slotkeeper::model::ToString(status));
    assert(parsed.has_value() && *parsed == status);
  }
  assert(!slotkeeper::model::MessageStatusFromString("done").has_value());

  assert(slotkeeper::model::BookingStatusFromString("active") == BookingStatus::kActive);
  assert(slotkeeper::model::BookingStatusFromString("cancelled") == BookingStatus::kCancelled);
  assert(!slotkeeper::model::BookingStatusFromString("deleted").has_value());
}

} // namespace

int main() {
  TestAllowedTransitions();
  TestRejectedTransitions();
  TestStringRoundTrip();

  std::cout << "slotkeeper_unit_message_status: pass\n";
  return 0;
}
