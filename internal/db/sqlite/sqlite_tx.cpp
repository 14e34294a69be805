#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace alo::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  lock_ = db_->LockForTransaction();
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (...) {
    db_->ReleaseTransaction(lock_);
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      ALO_LOG_WARN("sqlite rollback failed", {alo::observability::StringField("error", e.what())});
    }
  }
  db_->ReleaseTransaction(lock_);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  db_->ReleaseTransaction(lock_);
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  db_->ReleaseTransaction(lock_);
}

} // namespace alo::db::sqlite
