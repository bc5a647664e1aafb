#include "internal/core/booking_directive.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slotkeeper::core {

using namespace slotkeeper::observability;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

DirectiveResult Failure(std::string message) {
  return {false, std::move(message), {}};
}

std::string Describe(const db::model::BookingRecord& booking) {
  return booking.specialist + ", " + model::CivilDate::Parse(booking.date, 0).ToDisplay() + " " +
         model::TimeOfDay{booking.start_minute}.ToString();
}

} // namespace

std::string_view ToString(DirectiveAction action) {
  switch (action) {
    case DirectiveAction::kActivate:
      return "activate";
    case DirectiveAction::kReject:
      return "reject";
    case DirectiveAction::kChange:
    default:
      return "change";
  }
}

DirectiveExecutor::DirectiveExecutor(std::shared_ptr<SlotAllocator> allocator,
                                     std::function<model::CivilDate()> today)
    : allocator_(std::move(allocator)), today_(std::move(today)) {
}

model::CivilDate DirectiveExecutor::ParseDate(const std::string& text) const {
  return model::CivilDate::Parse(text, today_().year);
}

DirectiveResult DirectiveExecutor::Execute(const std::string& project_id, const std::string& client_id,
                                           const BookingDirective& directive) {
  DirectiveResult result;
  try {
    switch (directive.action) {
      case DirectiveAction::kActivate:
        result = Activate(project_id, client_id, directive);
        break;
      case DirectiveAction::kReject:
        result = Reject(project_id, client_id, directive);
        break;
      case DirectiveAction::kChange:
        result = Change(project_id, client_id, directive);
        break;
    }
  } catch (const util::ValidationError& e) {
    result = Failure(e.what());
  } catch (const util::ConflictError& e) {
    result = Failure(e.what());
  } catch (const util::NotFound& e) {
    result = Failure(e.what());
  } catch (const util::InvalidState& e) {
    result = Failure(e.what());
  }

  LogInfo("booking directive executed", {StringField("project_id", project_id), StringField("client_id", client_id),
                                         StringField("action", ToString(directive.action)),
                                         BoolField("success", result.success), StringField("message", result.message)});
  return result;
}

DirectiveResult DirectiveExecutor::Activate(const std::string& project_id, const std::string& client_id,
                                            const BookingDirective& directive) {
  if (directive.specialist.empty() || directive.date.empty() || directive.time.empty()) {
    return Failure("specialist, date and time are required to book");
  }

  const auto date  = ParseDate(directive.date);
  const auto start = model::TimeOfDay::Parse(directive.time);

  const auto& settings = allocator_->Projects().Get(project_id);
  const int   slots    = settings.ServiceSlots(directive.service).value_or(1);

  const auto booking = allocator_->Allocate(project_id, directive.specialist, date, start, slots,
                                            {client_id, directive.client_name, directive.client_phone,
                                             directive.service});
  return {true, "booked: " + Describe(booking), booking.id};
}

DirectiveResult DirectiveExecutor::Reject(const std::string& project_id, const std::string& client_id,
                                          const BookingDirective& directive) {
  if (directive.specialist.empty() || directive.reject_date.empty() || directive.reject_time.empty()) {
    return Failure("specialist, date and time are required to cancel");
  }

  const auto date = ParseDate(directive.reject_date).ToIso();
  const auto time = model::TimeOfDay::Parse(directive.reject_time);

  const auto bookings = allocator_->ClientBookings(project_id, client_id);
  auto it = std::find_if(bookings.begin(), bookings.end(), [&](const db::model::BookingRecord& b) {
    return b.specialist == directive.specialist && b.date == date && b.start_minute == time.minutes;
  });
  if (it == bookings.end()) {
    return Failure("booking not found");
  }

  const auto cancelled = allocator_->Cancel(it->id);
  return {true, "cancelled: " + Describe(cancelled), cancelled.id};
}

DirectiveResult DirectiveExecutor::Change(const std::string& project_id, const std::string& client_id,
                                          const BookingDirective& directive) {
  const auto bookings = allocator_->ClientBookings(project_id, client_id);
  if (bookings.empty()) {
    return Failure("no active booking to change");
  }

  auto newest = [](const db::model::BookingRecord& a, const db::model::BookingRecord& b) {
    return a.created_at_ms < b.created_at_ms;
  };

  const db::model::BookingRecord* target = nullptr;

  if (!directive.service.empty()) {
    const auto needle = Lower(directive.service);
    for (const auto& booking : bookings) {
      if (Lower(booking.service_name).find(needle) == std::string::npos) continue;
      if (!target || newest(*target, booking)) target = &booking;
    }
  }

  if (!target && !directive.reject_date.empty() && !directive.reject_time.empty()) {
    auto date = model::CivilDate::TryParse(directive.reject_date, today_().year);
    auto time = model::TimeOfDay::TryParse(directive.reject_time);
    if (date && time) {
      for (const auto& booking : bookings) {
        if (booking.date == date->ToIso() && booking.start_minute == time->minutes) {
          target = &booking;
          break;
        }
      }
    }
  }

  if (!target) {
    target = &*std::max_element(bookings.begin(), bookings.end(), newest);
    LogWarn("no booking matched the change request, using most recent",
            {StringField("client_id", client_id), StringField("booking_id", target->id)});
  }

  if (directive.specialist.empty() || directive.date.empty() || directive.time.empty()) {
    return Failure("specialist, date and time are required to change a booking");
  }

  const auto date  = ParseDate(directive.date);
  const auto start = model::TimeOfDay::Parse(directive.time);

  const auto& settings = allocator_->Projects().Get(project_id);
  const int   slots    = settings.ServiceSlots(directive.service).value_or(target->duration_slots);

  BookingDetails details;
  details.client_id    = target->client_id;
  details.client_name  = directive.client_name.empty() ? target->client_name : directive.client_name;
  details.client_phone = directive.client_phone.empty() ? target->client_phone : directive.client_phone;
  details.service_name = directive.service.empty() ? target->service_name : directive.service;

  const auto changed = allocator_->Change(target->id, directive.specialist, date, start, slots, details);
  return {true, "changed: " + Describe(changed), changed.id};
}

} // namespace slotkeeper::core
