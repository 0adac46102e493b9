#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wfrun::db {

struct Pagination {
  std::size_t limit  = 50;
  std::size_t offset = 0;
};

/*
  Identifies a single workflow run.

  Workflow-scoped selectors address the workflow by project key + name.
*/
struct RunSelector {
  enum class Kind {
    kByNumber,
    kLatest,
    kById,
    kByIdAndProject,
  };

  Kind        kind = Kind::kById;
  std::string project_key;
  std::string workflow_name;
  int64_t     number = 0;
  int64_t     run_id = 0;

  static RunSelector ByNumber(std::string project_key, std::string workflow_name, int64_t number);
  static RunSelector Latest(std::string project_key, std::string workflow_name);
  static RunSelector ById(int64_t run_id);
  static RunSelector ByIdAndProject(std::string project_key, int64_t run_id);

  // "project=KEY workflow=NAME number=3" style context for error messages
  std::string Describe() const;
};

} // namespace wfrun::db
