#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace slotkeeper::db::sqlite {

using slotkeeper::db::ErrorCode;
using slotkeeper::db::Result;
using slotkeeper::model::BookingStatus;
using slotkeeper::model::MessageStatus;

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr const char* kMessageColumns =
    "id,project_id,client_id,original_text,aggregated_text,status,created_at_ms,updated_at_ms,retry_count,sequence";

constexpr const char* kBookingColumns =
    "id,project_id,specialist,date,start_minute,duration_slots,client_id,client_name,client_phone,service_name,"
    "status,revision,mirror_synced,created_at_ms,updated_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Prepare for a read path; reads have no Result channel so failures throw.
Statement PrepareRead(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st);
}

// true on SQLITE_ROW, false on SQLITE_DONE
bool StepRead(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

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

model::QueuedMessageRecord ReadMessage(sqlite3_stmt* st) {
    model::QueuedMessageRecord r;
    r.id              = ColText(st, 0);
    r.project_id      = ColText(st, 1);
    r.client_id       = ColText(st, 2);
    r.original_text   = ColText(st, 3);
    r.aggregated_text = ColText(st, 4);
    r.status          = ParseMessageStatus(ColText(st, 5));
    r.created_at_ms   = ColU64(st, 6);
    r.updated_at_ms   = ColU64(st, 7);
    r.retry_count     = static_cast<uint32_t>(ColI32(st, 8));
    r.sequence        = ColU64(st, 9);
    return r;
}

model::BookingRecord ReadBooking(sqlite3_stmt* st) {
    model::BookingRecord r;
    r.id             = ColText(st, 0);
    r.project_id     = ColText(st, 1);
    r.specialist     = ColText(st, 2);
    r.date           = ColText(st, 3);
    r.start_minute   = ColI32(st, 4);
    r.duration_slots = ColI32(st, 5);
    r.client_id      = ColText(st, 6);
    r.client_name    = ColText(st, 7);
    r.client_phone   = ColText(st, 8);
    r.service_name   = ColText(st, 9);
    r.status         = ParseBookingStatus(ColText(st, 10));
    r.revision       = ColU64(st, 11);
    r.mirror_synced  = ColI32(st, 12) != 0;
    r.created_at_ms  = ColU64(st, 13);
    r.updated_at_ms  = ColU64(st, 14);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

// BEGIN IMMEDIATE plus the connection mutex already serialize writers.
Result SqliteRepository::AcquireScope(Transaction&, const LockScope&) {
    return Result::Ok();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Queued messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertQueuedMessage(Transaction& t, model::QueuedMessageRecord& r) {
    auto* db = TX(t).Handle();

    {
        auto st = PrepareRead(db, "SELECT COALESCE(MAX(sequence),0)+1 FROM queued_messages;");
        if (!StepRead(db, st.get()))
            return Result::Err(ErrorCode::InternalError, "sequence query returned no row");
        r.sequence = ColU64(st.get(), 0);
    }

    const char* sql =
        "INSERT INTO queued_messages(id,project_id,client_id,original_text,aggregated_text,status,"
        "created_at_ms,updated_at_ms,retry_count,sequence) VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.id);
    BindText(raw, 2, r.project_id);
    BindText(raw, 3, r.client_id);
    BindText(raw, 4, r.original_text);
    BindText(raw, 5, r.aggregated_text);
    BindText(raw, 6, slotkeeper::model::ToString(r.status));
    BindU64(raw, 7, r.created_at_ms);
    BindU64(raw, 8, r.updated_at_ms);
    BindI32(raw, 9, static_cast<int>(r.retry_count));
    BindU64(raw, 10, r.sequence);

    return Translate(db, sqlite3_step(raw));
}

std::optional<model::QueuedMessageRecord>
SqliteRepository::GetQueuedMessage(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, std::string("SELECT ") + kMessageColumns + " FROM queued_messages WHERE id=?;");
    BindText(st.get(), 1, id);

    if (!StepRead(db, st.get())) return std::nullopt;
    return ReadMessage(st.get());
}

std::vector<model::QueuedMessageRecord>
SqliteRepository::ListClientMessages(Transaction& t, const std::string& project_id, const std::string& client_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, std::string("SELECT ") + kMessageColumns +
                                  " FROM queued_messages WHERE project_id=? AND client_id=?"
                                  " ORDER BY created_at_ms ASC, sequence ASC;");
    BindText(st.get(), 1, project_id);
    BindText(st.get(), 2, client_id);

    std::vector<model::QueuedMessageRecord> out;
    while (StepRead(db, st.get())) out.push_back(ReadMessage(st.get()));
    return out;
}

Result SqliteRepository::UpdateQueuedMessage(Transaction& t, const model::QueuedMessageRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE queued_messages SET original_text=?,aggregated_text=?,status=?,updated_at_ms=?,retry_count=? "
        "WHERE id=?;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.original_text);
    BindText(raw, 2, r.aggregated_text);
    BindText(raw, 3, slotkeeper::model::ToString(r.status));
    BindU64(raw, 4, r.updated_at_ms);
    BindI32(raw, 5, static_cast<int>(r.retry_count));
    BindText(raw, 6, r.id);

    int rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "queued message not found");

    return Result::Ok();
}

std::map<MessageStatus, uint64_t>
SqliteRepository::CountMessagesByStatus(Transaction& t, const std::string& project_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, "SELECT status,COUNT(*) FROM queued_messages WHERE project_id=? GROUP BY status;");
    BindText(st.get(), 1, project_id);

    std::map<MessageStatus, uint64_t> counts;
    while (StepRead(db, st.get())) counts[ParseMessageStatus(ColText(st.get(), 0))] = ColU64(st.get(), 1);
    return counts;
}

// ------------------------------------------------------------------
// Client activity
// ------------------------------------------------------------------

Result SqliteRepository::TouchClientActivity(Transaction& t, const model::ClientActivityRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO client_activity(project_id,client_id,last_message_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(project_id,client_id) DO UPDATE SET "
        "last_message_at_ms=MAX(last_message_at_ms,excluded.last_message_at_ms);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.project_id);
    BindText(raw, 2, r.client_id);
    BindU64(raw, 3, r.last_message_at_ms);

    return Translate(db, sqlite3_step(raw));
}

std::vector<model::ClientActivityRecord>
SqliteRepository::ListClientsInactiveSince(Transaction& t, uint64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db,
                          "SELECT project_id,client_id,last_message_at_ms FROM client_activity "
                          "WHERE last_message_at_ms<? ORDER BY project_id,client_id;");
    BindU64(st.get(), 1, cutoff_ms);

    std::vector<model::ClientActivityRecord> out;
    while (StepRead(db, st.get())) {
        model::ClientActivityRecord r;
        r.project_id         = ColText(st.get(), 0);
        r.client_id          = ColText(st.get(), 1);
        r.last_message_at_ms = ColU64(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO bookings(id,project_id,specialist,date,start_minute,duration_slots,client_id,client_name,"
        "client_phone,service_name,status,revision,mirror_synced,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.id);
    BindText(raw, 2, r.project_id);
    BindText(raw, 3, r.specialist);
    BindText(raw, 4, r.date);
    BindI32(raw, 5, r.start_minute);
    BindI32(raw, 6, r.duration_slots);
    BindText(raw, 7, r.client_id);
    BindText(raw, 8, r.client_name);
    BindText(raw, 9, r.client_phone);
    BindText(raw, 10, r.service_name);
    BindText(raw, 11, slotkeeper::model::ToString(r.status));
    BindU64(raw, 12, r.revision);
    BindI32(raw, 13, r.mirror_synced ? 1 : 0);
    BindU64(raw, 14, r.created_at_ms);
    BindU64(raw, 15, r.updated_at_ms);

    return Translate(db, sqlite3_step(raw));
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id=?;");
    BindText(st.get(), 1, id);

    if (!StepRead(db, st.get())) return std::nullopt;
    return ReadBooking(st.get());
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE bookings SET specialist=?,date=?,start_minute=?,duration_slots=?,client_name=?,client_phone=?,"
        "service_name=?,status=?,revision=?,mirror_synced=?,updated_at_ms=? WHERE id=?;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.specialist);
    BindText(raw, 2, r.date);
    BindI32(raw, 3, r.start_minute);
    BindI32(raw, 4, r.duration_slots);
    BindText(raw, 5, r.client_name);
    BindText(raw, 6, r.client_phone);
    BindText(raw, 7, r.service_name);
    BindText(raw, 8, slotkeeper::model::ToString(r.status));
    BindU64(raw, 9, r.revision);
    BindI32(raw, 10, r.mirror_synced ? 1 : 0);
    BindU64(raw, 11, r.updated_at_ms);
    BindText(raw, 12, r.id);

    int rc = sqlite3_step(raw);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "booking not found");

    return Result::Ok();
}

std::vector<model::BookingRecord> SqliteRepository::ListDayBookings(Transaction& t, const std::string& project_id,
                                                                    const std::string& specialist,
                                                                    const std::string& date) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, std::string("SELECT ") + kBookingColumns +
                                  " FROM bookings WHERE project_id=? AND specialist=? AND date=?"
                                  " ORDER BY start_minute ASC, id ASC;");
    BindText(st.get(), 1, project_id);
    BindText(st.get(), 2, specialist);
    BindText(st.get(), 3, date);

    std::vector<model::BookingRecord> out;
    while (StepRead(db, st.get())) out.push_back(ReadBooking(st.get()));
    return out;
}

std::vector<model::BookingRecord> SqliteRepository::ListClientBookings(Transaction& t, const std::string& project_id,
                                                                       const std::string& client_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, std::string("SELECT ") + kBookingColumns +
                                  " FROM bookings WHERE project_id=? AND client_id=? AND status='active'"
                                  " ORDER BY date ASC, start_minute ASC, id ASC;");
    BindText(st.get(), 1, project_id);
    BindText(st.get(), 2, client_id);

    std::vector<model::BookingRecord> out;
    while (StepRead(db, st.get())) out.push_back(ReadBooking(st.get()));
    return out;
}

std::map<BookingStatus, uint64_t>
SqliteRepository::CountBookingsByStatus(Transaction& t, const std::string& project_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareRead(db, "SELECT status,COUNT(*) FROM bookings WHERE project_id=? GROUP BY status;");
    BindText(st.get(), 1, project_id);

    std::map<BookingStatus, uint64_t> counts;
    while (StepRead(db, st.get())) counts[ParseBookingStatus(ColText(st.get(), 0))] = ColU64(st.get(), 1);
    return counts;
}

} // namespace slotkeeper::db::sqlite
