#include "memory_tx.hpp"

#include <stdexcept>

namespace slotkeeper::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    for (auto& [id, record] : writes_.messages) repo_.committed_.messages[id] = std::move(record);
    for (auto& [id, record] : writes_.bookings) repo_.committed_.bookings[id] = std::move(record);
    for (auto& [key, record] : writes_.activity) repo_.committed_.activity[key] = std::move(record);
    writes_    = {};
    committed_ = true;
    repo_.ReleaseScopesLocked(*this);
  }
  repo_.scope_cv_.notify_all();
}

void MemoryTransaction::Rollback() {
  {
    std::scoped_lock lock(repo_.mutex_);
    writes_      = {};
    rolled_back_ = true;
    repo_.ReleaseScopesLocked(*this);
  }
  repo_.scope_cv_.notify_all();
}

} // namespace slotkeeper::db::memory
