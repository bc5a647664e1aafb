#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace slotkeeper::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions take TxMutex() for their whole
  lifetime so BEGIN IMMEDIATE never nests on the shared handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Creates every table and index if missing.
  void BootstrapSchema();

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace slotkeeper::db::sqlite
