#include "memory_tx.hpp"

#include <stdexcept>

namespace flowsched::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.writer_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }
  if (committed_) {
    throw std::logic_error("transaction already committed");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  working_     = {};
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace flowsched::db::memory
