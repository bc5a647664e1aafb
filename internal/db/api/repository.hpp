#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/lock_scope.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/client_activity_record.hpp"
#include "internal/db/model/queued_message_record.hpp"

namespace slotkeeper::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Reads issued after AcquireScope() see every row of that scope as last
    committed by other transactions
  - Two transactions never hold the same scope at the same time

  The DB is the source of truth for:
    queued message state
    bookings
    client activity
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Blocks until the scope is owned by this transaction.
  virtual Result AcquireScope(Transaction&, const LockScope& scope) = 0;

  // ---------------------------------------------------------------------
  // Queued messages
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result InsertQueuedMessage(Transaction&, model::QueuedMessageRecord& record) = 0;

  virtual std::optional<model::QueuedMessageRecord> GetQueuedMessage(Transaction&, const std::string& id) = 0;

  // Every row of the client whatever its status, oldest first.
  virtual std::vector<model::QueuedMessageRecord> ListClientMessages(Transaction&, const std::string& project_id,
                                                                     const std::string& client_id) = 0;

  virtual Result UpdateQueuedMessage(Transaction&, const model::QueuedMessageRecord& record) = 0;

  virtual std::map<slotkeeper::model::MessageStatus, uint64_t> CountMessagesByStatus(Transaction&, const std::string& project_id) = 0;

  // ---------------------------------------------------------------------
  // Client activity
  // ---------------------------------------------------------------------

  virtual Result TouchClientActivity(Transaction&, const model::ClientActivityRecord& record) = 0;

  virtual std::vector<model::ClientActivityRecord> ListClientsInactiveSince(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord& record) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  virtual Result UpdateBooking(Transaction&, const model::BookingRecord& record) = 0;

  // Every booking of the day whatever its status, ordered by start.
  virtual std::vector<model::BookingRecord> ListDayBookings(Transaction&, const std::string& project_id,
                                                            const std::string& specialist, const std::string& date) = 0;

  // Active bookings of a client, ordered by date then start.
  virtual std::vector<model::BookingRecord> ListClientBookings(Transaction&, const std::string& project_id,
                                                               const std::string& client_id) = 0;

  virtual std::map<slotkeeper::model::BookingStatus, uint64_t> CountBookingsByStatus(Transaction&, const std::string& project_id) = 0;
};

} // namespace slotkeeper::db
