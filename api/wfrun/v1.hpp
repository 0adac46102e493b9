#pragma once

#include "wfrun/v1/workflow.pb.h"

// Generated types live in ::wfrun::v1 (Workflow, WorkflowNode, RunInfo,
// RunInfoList, TriggerContext, RunStatus).
