#include "row_lock_table.hpp"

namespace wfrun::db::lock {

bool RowLockTable::TryAcquire(int64_t row_id, uint64_t owner) {
  std::lock_guard lock(mutex_);

  auto [it, inserted] = owners_.try_emplace(row_id, owner);
  if (inserted) return true;
  return it->second == owner;
}

void RowLockTable::ReleaseAll(uint64_t owner) {
  std::lock_guard lock(mutex_);

  for (auto it = owners_.begin(); it != owners_.end();) {
    if (it->second == owner) {
      it = owners_.erase(it);
      continue;
    }
    ++it;
  }
}

} // namespace wfrun::db::lock
