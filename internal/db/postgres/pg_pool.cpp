#include "pg_pool.hpp"

namespace slotkeeper::db::postgres {

namespace {

constexpr const char* kMessageColumns =
    "id,project_id,client_id,original_text,aggregated_text,status,created_at_ms,updated_at_ms,retry_count,sequence";

constexpr const char* kBookingColumns =
    "id,project_id,specialist,date,start_minute,duration_slots,client_id,client_name,client_phone,service_name,"
    "status,revision,mirror_synced,created_at_ms,updated_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::BootstrapSchema() {
  auto conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS queued_messages (id TEXT PRIMARY KEY, sequence BIGSERIAL UNIQUE, project_id TEXT NOT NULL, client_id TEXT NOT NULL, original_text TEXT NOT NULL, aggregated_text TEXT NOT NULL, status TEXT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, retry_count INTEGER NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS queued_messages_client ON queued_messages(project_id, client_id, created_at_ms, sequence);");
  tx.exec("CREATE TABLE IF NOT EXISTS client_activity (project_id TEXT NOT NULL, client_id TEXT NOT NULL, last_message_at_ms BIGINT NOT NULL, PRIMARY KEY (project_id, client_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, project_id TEXT NOT NULL, specialist TEXT NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, duration_slots INTEGER NOT NULL, client_id TEXT NOT NULL, client_name TEXT NOT NULL, client_phone TEXT NOT NULL, service_name TEXT NOT NULL, status TEXT NOT NULL, revision BIGINT NOT NULL, mirror_synced BOOLEAN NOT NULL DEFAULT FALSE, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS bookings_day ON bookings(project_id, specialist, date, start_minute);");
  tx.exec("CREATE INDEX IF NOT EXISTS bookings_client ON bookings(project_id, client_id, status);");
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("acquire_scope", "SELECT pg_advisory_xact_lock(hashtextextended($1, 0))");
  conn.prepare("lock_client_rows",
               "SELECT id FROM queued_messages WHERE project_id=$1 AND client_id=$2 FOR UPDATE");
  conn.prepare("lock_calendar_rows",
               "SELECT id FROM bookings WHERE project_id=$1 AND specialist=$2 AND date=$3 FOR UPDATE");

  conn.prepare("insert_message",
               "INSERT INTO queued_messages(id,project_id,client_id,original_text,aggregated_text,status,"
               "created_at_ms,updated_at_ms,retry_count) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING sequence");

  conn.prepare("get_message", std::string("SELECT ") + kMessageColumns + " FROM queued_messages WHERE id=$1");

  conn.prepare("list_client_messages", std::string("SELECT ") + kMessageColumns +
                                           " FROM queued_messages WHERE project_id=$1 AND client_id=$2"
                                           " ORDER BY created_at_ms ASC, sequence ASC");

  conn.prepare("update_message",
               "UPDATE queued_messages SET original_text=$2,aggregated_text=$3,status=$4,updated_at_ms=$5,"
               "retry_count=$6 WHERE id=$1");

  conn.prepare("count_messages",
               "SELECT status,COUNT(*) FROM queued_messages WHERE project_id=$1 GROUP BY status");

  conn.prepare("touch_activity",
               "INSERT INTO client_activity(project_id,client_id,last_message_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(project_id,client_id) DO UPDATE SET "
               "last_message_at_ms=GREATEST(client_activity.last_message_at_ms,EXCLUDED.last_message_at_ms)");

  conn.prepare("inactive_clients",
               "SELECT project_id,client_id,last_message_at_ms FROM client_activity "
               "WHERE last_message_at_ms<$1 ORDER BY project_id,client_id");

  conn.prepare("insert_booking",
               "INSERT INTO bookings(id,project_id,specialist,date,start_minute,duration_slots,client_id,client_name,"
               "client_phone,service_name,status,revision,mirror_synced,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("get_booking", std::string("SELECT ") + kBookingColumns + " FROM bookings WHERE id=$1");

  conn.prepare("update_booking",
               "UPDATE bookings SET specialist=$2,date=$3,start_minute=$4,duration_slots=$5,client_name=$6,"
               "client_phone=$7,service_name=$8,status=$9,revision=$10,mirror_synced=$11,updated_at_ms=$12 "
               "WHERE id=$1");

  conn.prepare("list_day_bookings", std::string("SELECT ") + kBookingColumns +
                                        " FROM bookings WHERE project_id=$1 AND specialist=$2 AND date=$3"
                                        " ORDER BY start_minute ASC, id ASC");

  conn.prepare("list_client_bookings", std::string("SELECT ") + kBookingColumns +
                                           " FROM bookings WHERE project_id=$1 AND client_id=$2 AND status='active'"
                                           " ORDER BY date ASC, start_minute ASC, id ASC");

  conn.prepare("count_bookings", "SELECT status,COUNT(*) FROM bookings WHERE project_id=$1 GROUP BY status");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace slotkeeper::db::postgres
