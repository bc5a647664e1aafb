#pragma once

#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace slotkeeper::db::memory {

/*
  Transaction = write set + held lock scopes
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Writes() {
    return writes_;
  }
  const MemoryRepository::State& Writes() const {
    return writes_;
  }

  std::vector<std::string>& HeldScopes() {
    return held_scopes_;
  }

 private:
  MemoryRepository&        repo_;
  MemoryRepository::State  writes_;
  std::vector<std::string> held_scopes_;
  bool                     committed_   = false;
  bool                     rolled_back_ = false;
};

} // namespace slotkeeper::db::memory
