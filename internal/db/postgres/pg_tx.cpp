#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relaynorm::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RELAYNORM_LOG_ERROR("Postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

} // namespace relaynorm::db::postgres
