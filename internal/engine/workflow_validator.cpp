#include "workflow_validator.hpp"

#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace wfrun::engine {

namespace {

[[noreturn]] void Reject(const ::wfrun::v1::Workflow& workflow, const std::string& reason) {
  throw util::ValidationError("workflow id=" + std::to_string(workflow.id()) + " name=" + workflow.name() + ": " + reason);
}

} // namespace

void ValidateWorkflow(const ::wfrun::v1::Workflow& workflow) {
  if (workflow.id() <= 0) Reject(workflow, "id must be positive");
  if (workflow.name().empty()) Reject(workflow, "name is required");
  if (workflow.project_key().empty()) Reject(workflow, "project_key is required");
  if (workflow.nodes().empty()) Reject(workflow, "at least one node is required");

  std::unordered_set<int64_t> ids;
  for (const auto& node : workflow.nodes()) {
    if (node.id() <= 0) Reject(workflow, "node ids must be positive");
    if (!ids.insert(node.id()).second) Reject(workflow, "duplicate node id " + std::to_string(node.id()));
  }

  // Kahn: every node must drain, otherwise the remainder sits on a cycle
  std::unordered_map<int64_t, int> in_degree;
  std::unordered_map<int64_t, std::vector<int64_t>> children;
  for (const auto& node : workflow.nodes()) {
    in_degree.try_emplace(node.id(), 0);
    std::unordered_set<int64_t> seen_parents;
    for (const auto parent : node.parent_ids()) {
      if (!ids.contains(parent)) {
        Reject(workflow, "node " + std::to_string(node.id()) + " references unknown parent " + std::to_string(parent));
      }
      if (!seen_parents.insert(parent).second) continue;
      ++in_degree[node.id()];
      children[parent].push_back(node.id());
    }
  }

  std::deque<int64_t> ready;
  for (const auto& [id, degree] : in_degree) {
    if (degree == 0) ready.push_back(id);
  }

  std::size_t drained = 0;
  while (!ready.empty()) {
    const auto id = ready.front();
    ready.pop_front();
    ++drained;
    for (const auto child : children[id]) {
      if (--in_degree[child] == 0) ready.push_back(child);
    }
  }

  if (drained != ids.size()) Reject(workflow, "node graph contains a cycle");
}

void ValidateTrigger(const ::wfrun::v1::TriggerContext& trigger) {
  for (const auto& [key, _] : trigger.extra_tags()) {
    if (key.empty()) {
      throw util::ValidationError("trigger: extra tag keys must not be empty");
    }
  }
}

const ::wfrun::v1::WorkflowNode* FindNode(const ::wfrun::v1::Workflow& workflow, int64_t node_id) {
  for (const auto& node : workflow.nodes()) {
    if (node.id() == node_id) return &node;
  }
  return nullptr;
}

std::vector<int64_t> RootNodeIds(const ::wfrun::v1::Workflow& workflow) {
  std::vector<int64_t> roots;
  for (const auto& node : workflow.nodes()) {
    if (node.parent_ids().empty()) roots.push_back(node.id());
  }
  return roots;
}

std::vector<int64_t> ChildNodeIds(const ::wfrun::v1::Workflow& workflow, int64_t node_id) {
  std::vector<int64_t> children;
  for (const auto& node : workflow.nodes()) {
    for (const auto parent : node.parent_ids()) {
      if (parent == node_id) {
        children.push_back(node.id());
        break;
      }
    }
  }
  return children;
}

} // namespace wfrun::engine
