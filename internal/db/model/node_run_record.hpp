#pragma once

#include <cstdint>

namespace wfrun::db::model {

struct NodeRunRecord {
  int64_t id              = 0;
  int64_t workflow_run_id = 0;
  int64_t node_id         = 0;
  int32_t sub_number      = 0;
  int32_t status          = 0;

  uint64_t started_at_ms    = 0;
  uint64_t finished_at_ms   = 0; // 0 = not finished
  uint64_t last_modified_ms = 0;
};

} // namespace wfrun::db::model
