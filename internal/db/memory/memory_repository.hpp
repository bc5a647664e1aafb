#pragma once

#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace slotkeeper::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Reads are read-committed: every read merges the committed state with the
  calling transaction's own write set. Lock scopes are entries in a named
  lock table owned by a transaction until it commits or rolls back.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::QueuedMessageRecord> messages;
    std::unordered_map<std::string, model::BookingRecord> bookings;
    std::unordered_map<std::string, model::ClientActivityRecord> activity;
  };

  // Caller holds mutex_.
  void ReleaseScopesLocked(MemoryTransaction& tx);

  std::mutex mutex_;
  std::condition_variable scope_cv_;
  std::unordered_map<std::string, const MemoryTransaction*> scope_owners_;
  State committed_;
  uint64_t next_sequence_ = 1;
};

} // namespace slotkeeper::db::memory
