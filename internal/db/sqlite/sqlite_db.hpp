#pragma once

#include <sqlite3.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace alo::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every thread of the process; transactions
  on it are serialized by tx_mutex_. Other processes on the same file are
  serialized by SQLite's own write lock (BEGIN IMMEDIATE + busy_timeout).
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // Held for the lifetime of a SqliteTransaction.
  std::unique_lock<std::mutex> LockForTransaction();
  void                         ReleaseTransaction(std::unique_lock<std::mutex>& lock);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;

  std::mutex                   tx_mutex_;
  std::atomic<std::thread::id> tx_owner_{};
};

} // namespace alo::db::sqlite
