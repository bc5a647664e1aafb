#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "internal/core/slot_allocator.hpp"
#include "internal/model/calendar.hpp"

namespace slotkeeper::core {

enum class DirectiveAction {
  kActivate,
  kReject,
  kChange,
};

/*
  Booking action extracted from a turn reply.

  date/time name the slot to book (activate, change); reject_date and
  reject_time name the existing booking (reject, and change when the service
  name does not identify it). Dates are DD.MM.YYYY, DD.MM or YYYY-MM-DD;
  times HH:MM.
*/
struct BookingDirective {
  DirectiveAction action = DirectiveAction::kActivate;

  std::string specialist;
  std::string date;
  std::string time;
  std::string reject_date;
  std::string reject_time;

  std::string service;
  std::string client_name;
  std::string client_phone;
};

struct DirectiveResult {
  bool        success = false;
  std::string message;
  std::string booking_id;
};

/*
  Executes booking directives on behalf of a client.

  Business rejections (validation, conflict, missing booking) come back as
  unsuccessful results. Store failures propagate.
*/
class DirectiveExecutor {
 public:
  explicit DirectiveExecutor(std::shared_ptr<SlotAllocator> allocator,
                             std::function<model::CivilDate()> today = model::CivilDate::Today);

  DirectiveResult Execute(const std::string& project_id, const std::string& client_id,
                          const BookingDirective& directive);

 private:
  DirectiveResult Activate(const std::string& project_id, const std::string& client_id,
                           const BookingDirective& directive);
  DirectiveResult Reject(const std::string& project_id, const std::string& client_id,
                         const BookingDirective& directive);
  DirectiveResult Change(const std::string& project_id, const std::string& client_id,
                         const BookingDirective& directive);

  model::CivilDate ParseDate(const std::string& text) const;

  std::shared_ptr<SlotAllocator>    allocator_;
  std::function<model::CivilDate()> today_;
};

std::string_view ToString(DirectiveAction action);

} // namespace slotkeeper::core
