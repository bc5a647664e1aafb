#pragma once

#include <string>

#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/client_activity_record.hpp"
#include "internal/db/model/queued_message_record.hpp"
#include "internal/model/calendar.hpp"
#include "slotkeeper/v1/types.pb.h"

namespace slotkeeper::service {

/*
  Record <-> wire conversions.

  Parse helpers throw util::ValidationError with the offending field name.
*/

slotkeeper::v1::MessageStatus ToProto(slotkeeper::model::MessageStatus status);
slotkeeper::v1::BookingStatus ToProto(slotkeeper::model::BookingStatus status);

slotkeeper::v1::QueuedMessage  ToProto(const db::model::QueuedMessageRecord& record);
slotkeeper::v1::Booking        ToProto(const db::model::BookingRecord& record);
slotkeeper::v1::ClientActivity ToProto(const db::model::ClientActivityRecord& record);

model::CivilDate ParseDateField(const std::string& field, const std::string& value);
model::TimeOfDay ParseTimeField(const std::string& field, const std::string& value);
void             RequireField(const std::string& field, const std::string& value);

} // namespace slotkeeper::service
