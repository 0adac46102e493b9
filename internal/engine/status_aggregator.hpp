#pragma once

#include "internal/model/workflow_run.hpp"

namespace wfrun::engine {

/*
  Run status as a pure function of the run's current state.

  Only the latest attempt of each node counts:
    1. any error info                  -> Fail
    2. any latest attempt not terminal -> Building
    3. any latest attempt Fail         -> Fail
    4. stop requested                  -> Stopped
    5. otherwise                       -> Success
*/
model::Status ComputeRunStatus(const model::WorkflowRun& run);

} // namespace wfrun::engine
