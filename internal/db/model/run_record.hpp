#pragma once

#include <cstdint>
#include <string>

namespace wfrun::db::model {

/*
  Persistent workflow_run row.

  Structured columns serve filtering/ordering; the two blobs carry the
  encoded definition snapshot and info log for full-fidelity restoration.
  Both halves are always written in the same transaction.
*/
struct RunRecord {
  int64_t id = 0;

  int64_t     workflow_id = 0;
  int64_t     project_id  = 0;
  std::string project_key;
  std::string workflow_name;

  int64_t number = 0;
  int32_t status = 0;
  bool    stop_requested = false;

  uint64_t started_at_ms    = 0;
  uint64_t last_modified_ms = 0;

  // Empty when the column is NULL (rows written before the field existed).
  std::string workflow_blob;
  std::string infos_blob;
};

} // namespace wfrun::db::model
