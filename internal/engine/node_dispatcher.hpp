#pragma once

#include "internal/model/workflow_run.hpp"

namespace wfrun::engine {

/*
  Receives "node ready" signals.

  Called only after the mutation that scheduled the node has committed,
  outside any run lock. Implementations hand the node to whatever
  executes it; exceptions are logged and never undo the mutation.
*/
class NodeDispatcher {
 public:
  virtual ~NodeDispatcher() = default;

  virtual void NodeReady(const model::WorkflowRun& run, const model::NodeRun& node_run) = 0;
};

} // namespace wfrun::engine
