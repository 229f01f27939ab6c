#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flowsched::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      FLOWSCHED_LOG_WARN("postgres rollback failed", {flowsched::observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
