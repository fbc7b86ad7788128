#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace relaynorm::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), serial_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      RELAYNORM_LOG_ERROR("SQLite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  serial_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  serial_.unlock();
}

} // namespace relaynorm::db::sqlite
