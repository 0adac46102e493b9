#pragma once

#include <cstdint>
#include <vector>

#include "wfrun/v1.hpp"

namespace wfrun::engine {

// Throws util::ValidationError naming the first problem found.
void ValidateWorkflow(const ::wfrun::v1::Workflow& workflow);
void ValidateTrigger(const ::wfrun::v1::TriggerContext& trigger);

const ::wfrun::v1::WorkflowNode* FindNode(const ::wfrun::v1::Workflow& workflow, int64_t node_id);

// Nodes without parents, in definition order.
std::vector<int64_t> RootNodeIds(const ::wfrun::v1::Workflow& workflow);

// Nodes listing node_id as a parent, in definition order.
std::vector<int64_t> ChildNodeIds(const ::wfrun::v1::Workflow& workflow, int64_t node_id);

} // namespace wfrun::engine
