#pragma once

namespace slotkeeper::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Lock scopes acquired through the transaction are held until
    Commit() or Rollback()

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: write set over read-committed state
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
