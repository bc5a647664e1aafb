#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/scoped_tx.hpp"

#if SLOTKEEPER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SLOTKEEPER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using slotkeeper::db::ErrorCode;
using slotkeeper::db::LockScope;
using slotkeeper::db::Repository;
using slotkeeper::db::memory::MemoryRepository;
using slotkeeper::db::model::BookingRecord;
using slotkeeper::db::model::ClientActivityRecord;
using slotkeeper::db::model::QueuedMessageRecord;
using slotkeeper::model::BookingStatus;
using slotkeeper::model::MessageStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

QueuedMessageRecord Message(const std::string& id, const std::string& project, const std::string& client,
                            uint64_t created_at_ms) {
  QueuedMessageRecord record;
  record.id              = id;
  record.project_id      = project;
  record.client_id       = client;
  record.original_text   = "text " + id;
  record.aggregated_text = "text " + id;
  record.status          = MessageStatus::kPending;
  record.created_at_ms   = created_at_ms;
  record.updated_at_ms   = created_at_ms;
  return record;
}

BookingRecord Booking(const std::string& id, const std::string& project, const std::string& client,
                      const std::string& date, int start_minute) {
  BookingRecord record;
  record.id             = id;
  record.project_id     = project;
  record.specialist     = "Anna";
  record.date           = date;
  record.start_minute   = start_minute;
  record.duration_slots = 2;
  record.client_id      = client;
  record.client_name    = "Name " + client;
  record.client_phone   = "+100";
  record.service_name   = "Haircut";
  record.created_at_ms  = 1000;
  record.updated_at_ms  = 1000;
  return record;
}

void VerifyQueuedMessages(Repository& repo, const std::string& project) {
  auto tx = repo.Begin();

  auto first  = Message(project + "-m1", project, "c1", 2000);
  auto second = Message(project + "-m2", project, "c1", 2000);
  auto third  = Message(project + "-m3", project, "c1", 1500);
  auto other  = Message(project + "-m4", project, "c2", 1000);
  assert(repo.InsertQueuedMessage(*tx, first));
  assert(repo.InsertQueuedMessage(*tx, second));
  assert(repo.InsertQueuedMessage(*tx, third));
  assert(repo.InsertQueuedMessage(*tx, other));
  assert(second.sequence > first.sequence);
  assert(third.sequence > second.sequence);
  tx->Commit();

  // a failed statement may poison the transaction, so it gets its own
  tx             = repo.Begin();
  auto duplicate = Message(project + "-m1", project, "c1", 3000);
  const auto dup = repo.InsertQueuedMessage(*tx, duplicate);
  assert(!dup && dup.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx = repo.Begin();
  auto rows = repo.ListClientMessages(*tx, project, "c1");
  assert(rows.size() == 3);
  // oldest first, sequence breaks created_at ties
  assert(rows[0].id == third.id);
  assert(rows[1].id == first.id);
  assert(rows[2].id == second.id);
  assert(rows[2].aggregated_text == "text " + second.id);

  auto stored = repo.GetQueuedMessage(*tx, first.id);
  assert(stored.has_value());
  stored->status          = MessageStatus::kSuperseded;
  stored->aggregated_text = "folded";
  stored->retry_count     = 3;
  assert(repo.UpdateQueuedMessage(*tx, *stored));

  auto missing = Message(project + "-missing", project, "c1", 1);
  assert(repo.UpdateQueuedMessage(*tx, missing).code == ErrorCode::NotFound);
  assert(!repo.GetQueuedMessage(*tx, missing.id).has_value());
  tx->Commit();

  tx          = repo.Begin();
  auto reread = repo.GetQueuedMessage(*tx, first.id);
  assert(reread && reread->status == MessageStatus::kSuperseded);
  assert(reread->aggregated_text == "folded");
  assert(reread->retry_count == 3);

  auto counts = repo.CountMessagesByStatus(*tx, project);
  assert(counts[MessageStatus::kPending] == 3);
  assert(counts[MessageStatus::kSuperseded] == 1);
  assert(repo.CountMessagesByStatus(*tx, project + "-other").empty());
  tx->Commit();
}

void VerifyClientActivity(Repository& repo, const std::string& project) {
  {
    auto tx = repo.Begin();
    assert(repo.TouchClientActivity(*tx, {project, "idle", 1000}));
    assert(repo.TouchClientActivity(*tx, {project, "busy", 1000}));
    assert(repo.TouchClientActivity(*tx, {project, "busy", 9000}));
    // never moves backwards
    assert(repo.TouchClientActivity(*tx, {project, "busy", 5000}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  std::vector<ClientActivityRecord> inactive;
  for (const auto& record : repo.ListClientsInactiveSince(*tx, 9000)) {
    if (record.project_id == project) inactive.push_back(record);
  }
  assert(inactive.size() == 1);
  assert(inactive[0].client_id == "idle");

  inactive.clear();
  for (const auto& record : repo.ListClientsInactiveSince(*tx, 9001)) {
    if (record.project_id == project) inactive.push_back(record);
  }
  assert(inactive.size() == 2);
  assert(inactive[0].client_id == "busy");
  assert(inactive[0].last_message_at_ms == 9000);
  tx->Commit();
}

void VerifyBookings(Repository& repo, const std::string& project) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(project + "-b1", project, "c1", "2026-03-02", 660)));
    assert(repo.InsertBooking(*tx, Booking(project + "-b2", project, "c1", "2026-03-02", 600)));
    assert(repo.InsertBooking(*tx, Booking(project + "-b3", project, "c1", "2026-03-01", 900)));
    assert(repo.InsertBooking(*tx, Booking(project + "-b4", project, "c2", "2026-03-02", 720)));
    tx->Commit();
  }

  {
    auto       tx  = repo.Begin();
    const auto dup = repo.InsertBooking(*tx, Booking(project + "-b1", project, "c9", "2026-03-09", 600));
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx      = repo.Begin();
    auto booking = repo.GetBooking(*tx, project + "-b1");
    assert(booking.has_value());
    assert(booking->client_phone == "+100");
    assert(booking->duration_slots == 2);
    assert(booking->status == BookingStatus::kActive);
    assert(booking->revision == 1);
    assert(!booking->mirror_synced);

    booking->status        = BookingStatus::kCancelled;
    booking->revision      = 2;
    booking->mirror_synced = true;
    booking->updated_at_ms = 2000;
    assert(repo.UpdateBooking(*tx, *booking));

    auto ghost = Booking(project + "-ghost", project, "c1", "2026-03-02", 600);
    assert(repo.UpdateBooking(*tx, ghost).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto day = repo.ListDayBookings(*tx, project, "Anna", "2026-03-02");
  assert(day.size() == 3);
  assert(day[0].start_minute == 600);
  assert(day[1].start_minute == 660);
  assert(day[1].status == BookingStatus::kCancelled);
  assert(day[1].revision == 2 && day[1].mirror_synced);
  assert(day[1].updated_at_ms == 2000);
  assert(day[2].start_minute == 720);
  assert(repo.ListDayBookings(*tx, project, "Boris", "2026-03-02").empty());

  auto mine = repo.ListClientBookings(*tx, project, "c1");
  assert(mine.size() == 2);
  assert(mine[0].id == project + "-b3");
  assert(mine[1].id == project + "-b2");

  auto counts = repo.CountBookingsByStatus(*tx, project);
  assert(counts[BookingStatus::kActive] == 3);
  assert(counts[BookingStatus::kCancelled] == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& project) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(project + "-rb1", project, "c1", "2026-04-01", 600)));
    assert(repo.GetBooking(*tx, project + "-rb1").has_value());
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(project + "-rb2", project, "c1", "2026-04-01", 600)));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetBooking(*tx, project + "-rb1").has_value());
  assert(!repo.GetBooking(*tx, project + "-rb2").has_value());
  tx->Commit();
}

// Read-modify-write of one row under a calendar scope from several threads.
void VerifyScopeSerializesWriters(Repository& repo, const std::string& project) {
  const auto id = project + "-counter";
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(id, project, "c1", "2026-05-01", 600)));
    tx->Commit();
  }

  constexpr int kThreads = 4;
  constexpr int kRounds  = 5;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kRounds; ++i) {
        slotkeeper::db::WithScopes(repo, {LockScope::Calendar(project, "Anna", "2026-05-01")},
                                   [&](slotkeeper::db::Transaction& tx) {
          auto booking = repo.GetBooking(tx, id);
          assert(booking.has_value());
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
          booking->revision += 1;
          slotkeeper::db::ThrowIfDbError(repo.UpdateBooking(tx, *booking), "bump revision");
        });
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto tx      = repo.Begin();
  auto booking = repo.GetBooking(*tx, id);
  assert(booking && booking->revision == 1 + kThreads * kRounds);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& project) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  auto item = Message(project + "-durable", project, "c1", 4000);
  {
    auto tx = repo->Begin();
    assert(repo->InsertQueuedMessage(*tx, item));
    assert(repo->InsertBooking(*tx, Booking(project + "-durable", project, "c1", "2026-06-01", 600)));
    assert(repo->TouchClientActivity(*tx, {project, "c1", 4000}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto message = repo->GetQueuedMessage(*tx, item.id);
  assert(message.has_value());
  assert(message->sequence == item.sequence);
  assert(message->created_at_ms == 4000);

  auto booking = repo->GetBooking(*tx, project + "-durable");
  assert(booking && booking->date == "2026-06-01");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SLOTKEEPER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("slotkeeper_integration_sqlite_" + std::to_string(NowMs()) + ".db"))
          .string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<slotkeeper::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<slotkeeper::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

#if SLOTKEEPER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SLOTKEEPER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SLOTKEEPER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<slotkeeper::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::make_shared<slotkeeper::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // rows persist across postgres runs
  const auto project = backend.name + "-" + std::to_string(NowMs());

  VerifyQueuedMessages(*repo, project + "-queue");
  VerifyClientActivity(*repo, project + "-activity");
  VerifyBookings(*repo, project + "-bookings");
  VerifyRollbackBehavior(*repo, project + "-rollback");
  VerifyScopeSerializesWriters(*repo, project + "-scope");

  repo.reset();
  VerifyRestartDurability(backend, project + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SLOTKEEPER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SLOTKEEPER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "slotkeeper_integration_repository_parity: pass\n";
  return 0;
}
