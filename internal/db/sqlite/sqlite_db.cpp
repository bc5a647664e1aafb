#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace slotkeeper::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    // WAL enables concurrent readers while writer holds lock
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS queued_messages (id TEXT PRIMARY KEY, sequence INTEGER NOT NULL UNIQUE, project_id TEXT NOT NULL, client_id TEXT NOT NULL, original_text TEXT NOT NULL, aggregated_text TEXT NOT NULL, status TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, retry_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS queued_messages_client ON queued_messages(project_id, client_id, created_at_ms, sequence);",
      "CREATE TABLE IF NOT EXISTS client_activity (project_id TEXT NOT NULL, client_id TEXT NOT NULL, last_message_at_ms INTEGER NOT NULL, PRIMARY KEY (project_id, client_id));",
      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, project_id TEXT NOT NULL, specialist TEXT NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, duration_slots INTEGER NOT NULL, client_id TEXT NOT NULL, client_name TEXT NOT NULL, client_phone TEXT NOT NULL, service_name TEXT NOT NULL, status TEXT NOT NULL, revision INTEGER NOT NULL, mirror_synced INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS bookings_day ON bookings(project_id, specialist, date, start_minute);",
      "CREATE INDEX IF NOT EXISTS bookings_client ON bookings(project_id, client_id, status);"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace slotkeeper::db::sqlite
