#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace wfrun::db::lock {

/*
  In-process exclusive row locks for the memory backend.

  - TryAcquire never blocks; a row held by another owner is refused
  - Re-acquiring a row already held by the same owner succeeds
  - Owners are transactions; every lock is dropped by ReleaseAll
*/
class RowLockTable {
 public:
  bool TryAcquire(int64_t row_id, uint64_t owner);

  void ReleaseAll(uint64_t owner);

 private:
  std::mutex mutex_;

  std::unordered_map<int64_t, uint64_t> owners_;
};

} // namespace wfrun::db::lock
