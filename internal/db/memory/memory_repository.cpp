#include "memory_repository.hpp"

#include <algorithm>
#include <stdexcept>

#include "memory_tx.hpp"

namespace slotkeeper::db::memory {

using slotkeeper::model::BookingStatus;
using slotkeeper::model::MessageStatus;

namespace {

MemoryTransaction& TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

std::string ActivityKey(const std::string& project_id, const std::string& client_id) {
  return project_id + '\x1f' + client_id;
}

// committed rows shadowed by the write set, then the write set itself
template <typename Record, typename Pred>
std::vector<Record> Collect(const std::unordered_map<std::string, Record>& committed,
                            const std::unordered_map<std::string, Record>& writes, Pred pred) {
  std::vector<Record> out;
  for (const auto& [key, record] : committed) {
    if (!writes.contains(key) && pred(record)) out.push_back(record);
  }
  for (const auto& [key, record] : writes) {
    if (pred(record)) out.push_back(record);
  }
  return out;
}

template <typename Record>
std::optional<Record> Lookup(const std::unordered_map<std::string, Record>& committed,
                             const std::unordered_map<std::string, Record>& writes, const std::string& key) {
  if (auto it = writes.find(key); it != writes.end()) return it->second;
  if (auto it = committed.find(key); it != committed.end()) return it->second;
  return std::nullopt;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::AcquireScope(Transaction& t, const LockScope& scope) {
  auto&       tx  = TX(t);
  const auto  key = scope.Key();
  std::unique_lock lock(mutex_);

  scope_cv_.wait(lock, [&] {
    auto it = scope_owners_.find(key);
    return it == scope_owners_.end() || it->second == &tx;
  });

  auto [it, inserted] = scope_owners_.emplace(key, &tx);
  if (inserted) tx.HeldScopes().push_back(key);
  return Result::Ok();
}

void MemoryRepository::ReleaseScopesLocked(MemoryTransaction& tx) {
  for (const auto& key : tx.HeldScopes()) {
    auto it = scope_owners_.find(key);
    if (it != scope_owners_.end() && it->second == &tx) scope_owners_.erase(it);
  }
  tx.HeldScopes().clear();
}

// ------------------------------------------------------------------
// Queued messages
// ------------------------------------------------------------------

Result MemoryRepository::InsertQueuedMessage(Transaction& t, model::QueuedMessageRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (committed_.messages.contains(r.id) || tx.Writes().messages.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "queued message exists");
  }

  r.sequence                   = next_sequence_++;
  tx.Writes().messages[r.id]   = r;
  return Result::Ok();
}

std::optional<model::QueuedMessageRecord> MemoryRepository::GetQueuedMessage(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);
  return Lookup(committed_.messages, tx.Writes().messages, id);
}

std::vector<model::QueuedMessageRecord> MemoryRepository::ListClientMessages(Transaction& t, const std::string& project_id,
                                                                             const std::string& client_id) {
  auto& tx = TX(t);
  std::vector<model::QueuedMessageRecord> out;
  {
    std::scoped_lock lock(mutex_);
    out = Collect(committed_.messages, tx.Writes().messages, [&](const model::QueuedMessageRecord& r) {
      return r.project_id == project_id && r.client_id == client_id;
    });
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return model::IsNewer(b, a); });
  return out;
}

Result MemoryRepository::UpdateQueuedMessage(Transaction& t, const model::QueuedMessageRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (!committed_.messages.contains(r.id) && !tx.Writes().messages.contains(r.id)) {
    return Result::Err(ErrorCode::NotFound, "queued message not found");
  }

  tx.Writes().messages[r.id] = r;
  return Result::Ok();
}

std::map<MessageStatus, uint64_t> MemoryRepository::CountMessagesByStatus(Transaction& t, const std::string& project_id) {
  auto& tx = TX(t);
  std::map<MessageStatus, uint64_t> counts;

  std::scoped_lock lock(mutex_);
  auto rows = Collect(committed_.messages, tx.Writes().messages,
                      [&](const model::QueuedMessageRecord& r) { return r.project_id == project_id; });
  for (const auto& r : rows) ++counts[r.status];
  return counts;
}

// ------------------------------------------------------------------
// Client activity
// ------------------------------------------------------------------

Result MemoryRepository::TouchClientActivity(Transaction& t, const model::ClientActivityRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  const auto key = ActivityKey(r.project_id, r.client_id);
  auto current   = Lookup(committed_.activity, tx.Writes().activity, key);
  if (current && current->last_message_at_ms >= r.last_message_at_ms) {
    return Result::Ok();
  }

  tx.Writes().activity[key] = r;
  return Result::Ok();
}

std::vector<model::ClientActivityRecord> MemoryRepository::ListClientsInactiveSince(Transaction& t, uint64_t cutoff_ms) {
  auto& tx = TX(t);
  std::vector<model::ClientActivityRecord> out;
  {
    std::scoped_lock lock(mutex_);
    out = Collect(committed_.activity, tx.Writes().activity,
                  [&](const model::ClientActivityRecord& r) { return r.last_message_at_ms < cutoff_ms; });
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.project_id != b.project_id) return a.project_id < b.project_id;
    return a.client_id < b.client_id;
  });
  return out;
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (committed_.bookings.contains(r.id) || tx.Writes().bookings.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "booking exists");
  }

  tx.Writes().bookings[r.id] = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);
  return Lookup(committed_.bookings, tx.Writes().bookings, id);
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (!committed_.bookings.contains(r.id) && !tx.Writes().bookings.contains(r.id)) {
    return Result::Err(ErrorCode::NotFound, "booking not found");
  }

  tx.Writes().bookings[r.id] = r;
  return Result::Ok();
}

std::vector<model::BookingRecord> MemoryRepository::ListDayBookings(Transaction& t, const std::string& project_id,
                                                                    const std::string& specialist, const std::string& date) {
  auto& tx = TX(t);
  std::vector<model::BookingRecord> out;
  {
    std::scoped_lock lock(mutex_);
    out = Collect(committed_.bookings, tx.Writes().bookings, [&](const model::BookingRecord& r) {
      return r.project_id == project_id && r.specialist == specialist && r.date == date;
    });
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.start_minute != b.start_minute) return a.start_minute < b.start_minute;
    return a.id < b.id;
  });
  return out;
}

std::vector<model::BookingRecord> MemoryRepository::ListClientBookings(Transaction& t, const std::string& project_id,
                                                                       const std::string& client_id) {
  auto& tx = TX(t);
  std::vector<model::BookingRecord> out;
  {
    std::scoped_lock lock(mutex_);
    out = Collect(committed_.bookings, tx.Writes().bookings, [&](const model::BookingRecord& r) {
      return r.project_id == project_id && r.client_id == client_id && r.status == BookingStatus::kActive;
    });
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.date != b.date) return a.date < b.date;
    if (a.start_minute != b.start_minute) return a.start_minute < b.start_minute;
    return a.id < b.id;
  });
  return out;
}

std::map<BookingStatus, uint64_t> MemoryRepository::CountBookingsByStatus(Transaction& t, const std::string& project_id) {
  auto& tx = TX(t);
  std::map<BookingStatus, uint64_t> counts;

  std::scoped_lock lock(mutex_);
  auto rows = Collect(committed_.bookings, tx.Writes().bookings,
                      [&](const model::BookingRecord& r) { return r.project_id == project_id; });
  for (const auto& r : rows) ++counts[r.status];
  return counts;
}

} // namespace slotkeeper::db::memory
