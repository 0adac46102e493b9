#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/model/run_status.hpp"
#include "internal/util/time.hpp"
#include "wfrun/v1.hpp"

namespace wfrun::model {

/*
  One execution attempt of one node within a run.

  Attempts are append-only: a retry adds a NodeRun with a higher
  sub_number, terminal attempts are never rewritten.
*/
struct NodeRun {
  int64_t id              = 0;
  int64_t workflow_run_id = 0;
  int64_t node_id         = 0;
  int32_t sub_number      = 0;

  Status status = ::wfrun::v1::RUN_STATUS_UNSPECIFIED;

  util::TimePoint started_at{};
  util::TimePoint finished_at{}; // epoch while not terminal
  util::TimePoint last_modified_at{};
};

struct RunTag {
  std::string key;
  std::string value;

  bool operator==(const RunTag& other) const {
    return key == other.key && value == other.value;
  }
  bool operator<(const RunTag& other) const {
    return key != other.key ? key < other.key : value < other.value;
  }
};

struct WorkflowRun {
  int64_t id     = 0;
  int64_t number = 0;

  int64_t     workflow_id = 0;
  int64_t     project_id  = 0;
  std::string project_key;
  std::string workflow_name;

  // Definition as it was at trigger time. Never rewritten after creation.
  ::wfrun::v1::Workflow workflow;

  Status status         = ::wfrun::v1::RUN_STATUS_BUILDING;
  bool   stop_requested = false;

  util::TimePoint started_at{};
  util::TimePoint last_modified_at{};

  // node id -> attempts, latest (highest sub_number) first
  std::map<int64_t, std::vector<NodeRun>> node_runs;

  std::vector<RunTag>                tags;
  std::vector<::wfrun::v1::RunInfo> infos;
};

} // namespace wfrun::model
