#include "internal/db/api/types.hpp"

namespace wfrun::db {

RunSelector RunSelector::ByNumber(std::string project_key, std::string workflow_name, int64_t number) {
  RunSelector s;
  s.kind          = Kind::kByNumber;
  s.project_key   = std::move(project_key);
  s.workflow_name = std::move(workflow_name);
  s.number        = number;
  return s;
}

RunSelector RunSelector::Latest(std::string project_key, std::string workflow_name) {
  RunSelector s;
  s.kind          = Kind::kLatest;
  s.project_key   = std::move(project_key);
  s.workflow_name = std::move(workflow_name);
  return s;
}

RunSelector RunSelector::ById(int64_t run_id) {
  RunSelector s;
  s.kind   = Kind::kById;
  s.run_id = run_id;
  return s;
}

RunSelector RunSelector::ByIdAndProject(std::string project_key, int64_t run_id) {
  RunSelector s;
  s.kind        = Kind::kByIdAndProject;
  s.project_key = std::move(project_key);
  s.run_id      = run_id;
  return s;
}

std::string RunSelector::Describe() const {
  switch (kind) {
    case Kind::kByNumber:
      return "project=" + project_key + " workflow=" + workflow_name + " number=" + std::to_string(number);
    case Kind::kLatest:
      return "project=" + project_key + " workflow=" + workflow_name + " latest";
    case Kind::kById:
      return "id=" + std::to_string(run_id);
    case Kind::kByIdAndProject:
      return "project=" + project_key + " id=" + std::to_string(run_id);
  }
  return "unknown selector";
}

} // namespace wfrun::db
