#pragma once

#include <cstdint>
#include <string>

namespace wfrun::db::model {

struct RunTagRecord {
  int64_t     workflow_run_id = 0;
  std::string tag;
  std::string value;
};

} // namespace wfrun::db::model
