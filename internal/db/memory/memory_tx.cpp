#include "memory_tx.hpp"

#include <stdexcept>

namespace wfrun::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TransactionMode mode)
    : repo_(repo), mode_(mode), id_(repo.next_tx_id_.fetch_add(1)) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Finish();
}

void MemoryTransaction::Apply(Op op) {
  op(working_);
  log_.push_back(std::move(op));
}

void MemoryTransaction::Refresh() {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
  for (const auto& op : log_) {
    op(working_);
  }
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("memory transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    for (const auto& op : log_) {
      op(repo_.committed_);
    }
  }
  committed_ = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  Finish();
}

void MemoryTransaction::Finish() {
  finished_ = true;
  log_.clear();
  repo_.row_locks_.ReleaseAll(id_);
}

} // namespace wfrun::db::memory
