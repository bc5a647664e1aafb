#include "proto_mapping.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace slotkeeper::service {

using namespace slotkeeper::v1;

MessageStatus ToProto(slotkeeper::model::MessageStatus status) {
  switch (status) {
    case slotkeeper::model::MessageStatus::kPending:
      return MESSAGE_STATUS_PENDING;
    case slotkeeper::model::MessageStatus::kProcessing:
      return MESSAGE_STATUS_PROCESSING;
    case slotkeeper::model::MessageStatus::kCompleted:
      return MESSAGE_STATUS_COMPLETED;
    case slotkeeper::model::MessageStatus::kCancelled:
      return MESSAGE_STATUS_CANCELLED;
    case slotkeeper::model::MessageStatus::kSuperseded:
      return MESSAGE_STATUS_SUPERSEDED;
  }
  return MESSAGE_STATUS_UNSPECIFIED;
}

BookingStatus ToProto(slotkeeper::model::BookingStatus status) {
  switch (status) {
    case slotkeeper::model::BookingStatus::kActive:
      return BOOKING_STATUS_ACTIVE;
    case slotkeeper::model::BookingStatus::kCancelled:
      return BOOKING_STATUS_CANCELLED;
  }
  return BOOKING_STATUS_UNSPECIFIED;
}

QueuedMessage ToProto(const db::model::QueuedMessageRecord& record) {
  QueuedMessage out;
  out.set_id(record.id);
  out.set_project_id(record.project_id);
  out.set_client_id(record.client_id);
  out.set_original_text(record.original_text);
  out.set_aggregated_text(record.aggregated_text);
  out.set_status(ToProto(record.status));
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  out.set_retry_count(record.retry_count);
  out.set_sequence(record.sequence);
  return out;
}

Booking ToProto(const db::model::BookingRecord& record) {
  Booking out;
  out.set_id(record.id);
  out.set_project_id(record.project_id);
  out.set_specialist(record.specialist);
  out.set_date(record.date);
  out.set_start_time(model::TimeOfDay{record.start_minute}.ToString());
  out.set_duration_slots(static_cast<uint32_t>(record.duration_slots));
  out.set_client_id(record.client_id);
  out.set_client_name(record.client_name);
  out.set_client_phone(record.client_phone);
  out.set_service_name(record.service_name);
  out.set_status(ToProto(record.status));
  out.set_revision(record.revision);
  out.set_mirror_synced(record.mirror_synced);
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return out;
}

ClientActivity ToProto(const db::model::ClientActivityRecord& record) {
  ClientActivity out;
  out.set_project_id(record.project_id);
  out.set_client_id(record.client_id);
  *out.mutable_last_message_at() = util::MillisToProto(record.last_message_at_ms);
  return out;
}

model::CivilDate ParseDateField(const std::string& field, const std::string& value) {
  auto date = model::CivilDate::TryParse(value, model::CivilDate::Today().year);
  if (!date) {
    throw util::ValidationError(field + ": invalid date '" + value + "'");
  }
  return *date;
}

model::TimeOfDay ParseTimeField(const std::string& field, const std::string& value) {
  auto time = model::TimeOfDay::TryParse(value);
  if (!time) {
    throw util::ValidationError(field + ": invalid time '" + value + "'");
  }
  return *time;
}

void RequireField(const std::string& field, const std::string& value) {
  if (value.empty()) {
    throw util::ValidationError(field + " is required");
  }
}

} // namespace slotkeeper::service
