#include "status_aggregator.hpp"

#include <algorithm>

namespace wfrun::engine {

model::Status ComputeRunStatus(const model::WorkflowRun& run) {
  const bool has_error =
      std::any_of(run.infos.begin(), run.infos.end(), [](const ::wfrun::v1::RunInfo& info) { return info.is_error(); });
  if (has_error) {
    return ::wfrun::v1::RUN_STATUS_FAIL;
  }

  bool pending = false;
  bool failed  = false;
  for (const auto& [_, attempts] : run.node_runs) {
    if (attempts.empty()) continue;

    const auto status = attempts.front().status;
    if (!model::IsTerminal(status)) pending = true;
    if (status == ::wfrun::v1::RUN_STATUS_FAIL) failed = true;
  }

  if (pending) return ::wfrun::v1::RUN_STATUS_BUILDING;
  if (failed) return ::wfrun::v1::RUN_STATUS_FAIL;
  if (run.stop_requested) return ::wfrun::v1::RUN_STATUS_STOPPED;
  return ::wfrun::v1::RUN_STATUS_SUCCESS;
}

} // namespace wfrun::engine
