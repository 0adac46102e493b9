#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace wfrun::db::memory {

/*
  Transaction = snapshot + redo log

  Writes are applied to the private snapshot immediately (read-your-writes)
  and recorded; Commit() replays the log onto the committed state, so
  transactions touching different runs never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Op = std::function<void(MemoryRepository::State&)>;

  MemoryTransaction(MemoryRepository& repo, TransactionMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool ReadOnly() const {
    return mode_ == TransactionMode::kReadOnly;
  }
  uint64_t Id() const {
    return id_;
  }

  // apply to the snapshot and record for commit
  void Apply(Op op);

  // re-read committed state, then re-apply this transaction's own writes
  void Refresh();

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void Finish();

  MemoryRepository&       repo_;
  TransactionMode         mode_;
  uint64_t                id_;
  MemoryRepository::State working_;
  std::vector<Op>         log_;
  bool                    committed_ = false;
  bool                    finished_  = false;
};

} // namespace wfrun::db::memory
