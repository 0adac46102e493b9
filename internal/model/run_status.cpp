#include "internal/model/run_status.hpp"

#include <algorithm>
#include <cctype>

namespace wfrun::model {

std::string ToString(Status status) {
  switch (status) {
    case ::wfrun::v1::RUN_STATUS_WAITING:
      return "Waiting";
    case ::wfrun::v1::RUN_STATUS_BUILDING:
      return "Building";
    case ::wfrun::v1::RUN_STATUS_SUCCESS:
      return "Success";
    case ::wfrun::v1::RUN_STATUS_FAIL:
      return "Fail";
    case ::wfrun::v1::RUN_STATUS_STOPPED:
      return "Stopped";
    case ::wfrun::v1::RUN_STATUS_SKIPPED:
      return "Skipped";
    default:
      return "Unspecified";
  }
}

std::optional<Status> ParseStatus(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "waiting") return ::wfrun::v1::RUN_STATUS_WAITING;
  if (lowered == "building") return ::wfrun::v1::RUN_STATUS_BUILDING;
  if (lowered == "success") return ::wfrun::v1::RUN_STATUS_SUCCESS;
  if (lowered == "fail") return ::wfrun::v1::RUN_STATUS_FAIL;
  if (lowered == "stopped") return ::wfrun::v1::RUN_STATUS_STOPPED;
  if (lowered == "skipped") return ::wfrun::v1::RUN_STATUS_SKIPPED;
  return std::nullopt;
}

} // namespace wfrun::model
