#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace slotkeeper::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  Result AcquireScope(Transaction&, const LockScope&) override;

  Result InsertQueuedMessage(Transaction&, model::QueuedMessageRecord&) override;
  std::optional<model::QueuedMessageRecord> GetQueuedMessage(Transaction&, const std::string&) override;
  std::vector<model::QueuedMessageRecord> ListClientMessages(Transaction&, const std::string& project_id,
                                                             const std::string& client_id) override;
  Result UpdateQueuedMessage(Transaction&, const model::QueuedMessageRecord&) override;
  std::map<slotkeeper::model::MessageStatus, uint64_t> CountMessagesByStatus(Transaction&, const std::string& project_id) override;

  Result TouchClientActivity(Transaction&, const model::ClientActivityRecord&) override;
  std::vector<model::ClientActivityRecord> ListClientsInactiveSince(Transaction&, uint64_t cutoff_ms) override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&) override;
  std::vector<model::BookingRecord> ListDayBookings(Transaction&, const std::string& project_id,
                                                    const std::string& specialist, const std::string& date) override;
  std::vector<model::BookingRecord> ListClientBookings(Transaction&, const std::string& project_id,
                                                       const std::string& client_id) override;
  std::map<slotkeeper::model::BookingStatus, uint64_t> CountBookingsByStatus(Transaction&, const std::string& project_id) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace slotkeeper::db::sqlite
