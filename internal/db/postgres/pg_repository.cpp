#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace slotkeeper::db::postgres {

using slotkeeper::model::BookingStatus;
using slotkeeper::model::MessageStatus;

namespace {

MessageStatus ParseMessageStatus(const std::string& value) {
  auto status = slotkeeper::model::MessageStatusFromString(value);
  if (!status) throw util::StoreUnavailable("corrupt message status: " + value);
  return *status;
}

BookingStatus ParseBookingStatus(const std::string& value) {
  auto status = slotkeeper::model::BookingStatusFromString(value);
  if (!status) throw util::StoreUnavailable("corrupt booking status: " + value);
  return *status;
}

model::QueuedMessageRecord ReadMessage(const pqxx::row& row) {
  model::QueuedMessageRecord r;
  r.id              = row[0].c_str();
  r.project_id      = row[1].c_str();
  r.client_id       = row[2].c_str();
  r.original_text   = row[3].c_str();
  r.aggregated_text = row[4].c_str();
  r.status          = ParseMessageStatus(row[5].c_str());
  r.created_at_ms   = row[6].as<uint64_t>();
  r.updated_at_ms   = row[7].as<uint64_t>();
  r.retry_count     = row[8].as<uint32_t>();
  r.sequence        = row[9].as<uint64_t>();
  return r;
}

model::BookingRecord ReadBooking(const pqxx::row& row) {
  model::BookingRecord r;
  r.id             = row[0].c_str();
  r.project_id     = row[1].c_str();
  r.specialist     = row[2].c_str();
  r.date           = row[3].c_str();
  r.start_minute   = row[4].as<int32_t>();
  r.duration_slots = row[5].as<int32_t>();
  r.client_id      = row[6].c_str();
  r.client_name    = row[7].c_str();
  r.client_phone   = row[8].c_str();
  r.service_name   = row[9].c_str();
  r.status         = ParseBookingStatus(row[10].c_str());
  r.revision       = row[11].as<uint64_t>();
  r.mirror_synced  = row[12].as<bool>();
  r.created_at_ms  = row[13].as<uint64_t>();
  r.updated_at_ms  = row[14].as<uint64_t>();
  return r;
}

// Reads have no Result channel; connection-level failures surface as StoreUnavailable.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::StoreUnavailable(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::AcquireScope(Transaction& t, const LockScope& scope) {
  try {
    auto& work = TX(t).Work();
    // advisory lock first so a scope with no rows yet is still exclusive
    work.exec_prepared("acquire_scope", scope.Key());
    if (scope.kind == LockScopeKind::kClient) {
      work.exec_prepared("lock_client_rows", scope.project_id, scope.subject);
    } else {
      work.exec_prepared("lock_calendar_rows", scope.project_id, scope.subject, scope.date);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Queued messages
// ------------------------------------------------------------------

Result PgRepository::InsertQueuedMessage(Transaction& t, model::QueuedMessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_message", r.id, r.project_id, r.client_id, r.original_text,
                                          r.aggregated_text, std::string(slotkeeper::model::ToString(r.status)),
                                          r.created_at_ms, r.updated_at_ms, r.retry_count);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::QueuedMessageRecord> PgRepository::GetQueuedMessage(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::QueuedMessageRecord> {
    auto res = TX(t).Work().exec_prepared("get_message", id);
    if (res.empty()) return std::nullopt;
    return ReadMessage(res[0]);
  });
}

std::vector<model::QueuedMessageRecord> PgRepository::ListClientMessages(Transaction& t, const std::string& project_id,
                                                                         const std::string& client_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_client_messages", project_id, client_id);

    std::vector<model::QueuedMessageRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadMessage(row));
    return out;
  });
}

Result PgRepository::UpdateQueuedMessage(Transaction& t, const model::QueuedMessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_message", r.id, r.original_text, r.aggregated_text,
                                          std::string(slotkeeper::model::ToString(r.status)), r.updated_at_ms,
                                          r.retry_count);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "queued message not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::map<MessageStatus, uint64_t> PgRepository::CountMessagesByStatus(Transaction& t, const std::string& project_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("count_messages", project_id);

    std::map<MessageStatus, uint64_t> counts;
    for (const auto& row : res) counts[ParseMessageStatus(row[0].c_str())] = row[1].as<uint64_t>();
    return counts;
  });
}

// ------------------------------------------------------------------
// Client activity
// ------------------------------------------------------------------

Result PgRepository::TouchClientActivity(Transaction& t, const model::ClientActivityRecord& r) {
  try {
    TX(t).Work().exec_prepared("touch_activity", r.project_id, r.client_id, r.last_message_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ClientActivityRecord> PgRepository::ListClientsInactiveSince(Transaction& t, uint64_t cutoff_ms) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("inactive_clients", cutoff_ms);

    std::vector<model::ClientActivityRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::ClientActivityRecord r;
      r.project_id         = row[0].c_str();
      r.client_id          = row[1].c_str();
      r.last_message_at_ms = row[2].as<uint64_t>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result PgRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_booking", r.id, r.project_id, r.specialist, r.date, r.start_minute,
                               r.duration_slots, r.client_id, r.client_name, r.client_phone, r.service_name,
                               std::string(slotkeeper::model::ToString(r.status)), r.revision, r.mirror_synced,
                               r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BookingRecord> PgRepository::GetBooking(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::BookingRecord> {
    auto res = TX(t).Work().exec_prepared("get_booking", id);
    if (res.empty()) return std::nullopt;
    return ReadBooking(res[0]);
  });
}

Result PgRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_booking", r.id, r.specialist, r.date, r.start_minute,
                                          r.duration_slots, r.client_name, r.client_phone, r.service_name,
                                          std::string(slotkeeper::model::ToString(r.status)), r.revision,
                                          r.mirror_synced, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "booking not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BookingRecord> PgRepository::ListDayBookings(Transaction& t, const std::string& project_id,
                                                                const std::string& specialist, const std::string& date) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_day_bookings", project_id, specialist, date);

    std::vector<model::BookingRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadBooking(row));
    return out;
  });
}

std::vector<model::BookingRecord> PgRepository::ListClientBookings(Transaction& t, const std::string& project_id,
                                                                   const std::string& client_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("list_client_bookings", project_id, client_id);

    std::vector<model::BookingRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadBooking(row));
    return out;
  });
}

std::map<BookingStatus, uint64_t> PgRepository::CountBookingsByStatus(Transaction& t, const std::string& project_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared("count_bookings", project_id);

    std::map<BookingStatus, uint64_t> counts;
    for (const auto& row : res) counts[ParseBookingStatus(row[0].c_str())] = row[1].as<uint64_t>();
    return counts;
  });
}

} // namespace slotkeeper::db::postgres
