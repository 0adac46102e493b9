#pragma once

#include <string>
#include <vector>

#include "wfrun/v1.hpp"

namespace wfrun::serializer {

/*
  Blob codec for the two document columns of workflow_run.

  Encoding is protobuf JSON with proto field names. Decoding:
    - empty blob or the literal null  -> default value
    - unknown fields                  -> ignored (newer writers stay readable)
    - anything unparsable             -> util::SerializationError
*/
class Serializer {
 public:
  static std::string           EncodeSnapshot(const ::wfrun::v1::Workflow& workflow);
  static ::wfrun::v1::Workflow DecodeSnapshot(const std::string& blob);

  static std::string                       EncodeInfos(const std::vector<::wfrun::v1::RunInfo>& infos);
  static std::vector<::wfrun::v1::RunInfo> DecodeInfos(const std::string& blob);
};

} // namespace wfrun::serializer
