#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "wfrun/v1.hpp"

namespace wfrun::model {

using Status = ::wfrun::v1::RunStatus;

constexpr bool IsTerminal(Status status) {
  return status == ::wfrun::v1::RUN_STATUS_SUCCESS || status == ::wfrun::v1::RUN_STATUS_FAIL || status == ::wfrun::v1::RUN_STATUS_STOPPED ||
         status == ::wfrun::v1::RUN_STATUS_SKIPPED;
}

std::string           ToString(Status status);
std::optional<Status> ParseStatus(std::string_view value);

} // namespace wfrun::model
