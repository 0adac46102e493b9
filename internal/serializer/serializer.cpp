#include "serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace wfrun::serializer {

namespace {

bool IsAbsent(const std::string& blob) {
  const auto first = blob.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return true;

  const auto       last    = blob.find_last_not_of(" \t\r\n");
  std::string_view trimmed = std::string_view(blob).substr(first, last - first + 1);
  return trimmed == "null";
}

std::string Encode(const google::protobuf::Message& message, const char* what) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::SerializationError(std::string(what) + ": " + status.ToString());
  }
  return json;
}

void Decode(const std::string& blob, google::protobuf::Message* message, const char* what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(blob, message, options);
  if (!status.ok()) {
    throw util::SerializationError(std::string(what) + ": " + status.ToString());
  }
}

} // namespace

std::string Serializer::EncodeSnapshot(const ::wfrun::v1::Workflow& workflow) {
  return Encode(workflow, "EncodeSnapshot");
}

::wfrun::v1::Workflow Serializer::DecodeSnapshot(const std::string& blob) {
  ::wfrun::v1::Workflow workflow;
  if (IsAbsent(blob)) return workflow;

  Decode(blob, &workflow, "DecodeSnapshot");
  return workflow;
}

std::string Serializer::EncodeInfos(const std::vector<::wfrun::v1::RunInfo>& infos) {
  ::wfrun::v1::RunInfoList list;
  for (const auto& info : infos) {
    *list.add_infos() = info;
  }
  return Encode(list, "EncodeInfos");
}

std::vector<::wfrun::v1::RunInfo> Serializer::DecodeInfos(const std::string& blob) {
  if (IsAbsent(blob)) return {};

  ::wfrun::v1::RunInfoList list;
  Decode(blob, &list, "DecodeInfos");
  return {list.infos().begin(), list.infos().end()};
}

} // namespace wfrun::serializer
