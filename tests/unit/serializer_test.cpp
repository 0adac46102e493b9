#include "internal/serializer/serializer.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using wfrun::serializer::Serializer;

wfrun::v1::Workflow MakeWorkflow() {
  wfrun::v1::Workflow workflow;
  workflow.set_id(42);
  workflow.set_name("HelloPipeline");
  workflow.set_project_id(7);
  workflow.set_project_key("PROJ");
  workflow.mutable_last_modified()->set_seconds(1700000000);
  (*workflow.mutable_metadata())["owner"] = "ci";

  auto* build = workflow.add_nodes();
  build->set_id(1);
  build->set_name("build");
  build->set_pipeline_name("build-pipeline");
  (*build->mutable_context())["environment"] = "staging";

  auto* deploy = workflow.add_nodes();
  deploy->set_id(2);
  deploy->set_name("deploy");
  deploy->set_pipeline_name("deploy-pipeline");
  deploy->add_parent_ids(1);
  return workflow;
}

void TestSnapshotRoundTrip() {
  const auto workflow = MakeWorkflow();

  const auto blob    = Serializer::EncodeSnapshot(workflow);
  const auto decoded = Serializer::DecodeSnapshot(blob);

  assert(blob.find("\"project_key\"") != std::string::npos);
  assert(google::protobuf::util::MessageDifferencer::Equals(workflow, decoded));
}

void TestInfosRoundTripPreservesOrder() {
  std::vector<wfrun::v1::RunInfo> infos(3);
  infos[0].set_message("queued");
  infos[1].set_message("compile error");
  infos[1].set_is_error(true);
  infos[1].set_node_id(1);
  infos[1].mutable_created()->set_seconds(1700000100);
  infos[2].set_message("retrying");

  const auto decoded = Serializer::DecodeInfos(Serializer::EncodeInfos(infos));

  assert(decoded.size() == infos.size());
  for (size_t i = 0; i < infos.size(); ++i) {
    assert(google::protobuf::util::MessageDifferencer::Equals(infos[i], decoded[i]));
  }
}

void TestAbsentBlobsDecodeToDefaults() {
  assert(Serializer::DecodeSnapshot("").nodes_size() == 0);
  assert(Serializer::DecodeSnapshot("null").id() == 0);
  assert(Serializer::DecodeSnapshot("  \n").name().empty());

  assert(Serializer::DecodeInfos("").empty());
  assert(Serializer::DecodeInfos(" null ").empty());
  assert(Serializer::DecodeInfos(Serializer::EncodeInfos({})).empty());
}

void TestUnknownFieldsAreIgnored() {
  const auto workflow = Serializer::DecodeSnapshot(R"({"id": "5", "name": "w", "added_later": {"x": 1}})");
  assert(workflow.id() == 5);
  assert(workflow.name() == "w");
}

void TestMalformedBlobIsSerializationError() {
  bool threw = false;
  try {
    (void)Serializer::DecodeSnapshot("{\"id\": ");
  } catch (const wfrun::util::SerializationError& e) {
    threw = std::string(e.what()).find("DecodeSnapshot") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)Serializer::DecodeInfos("[1, 2]");
  } catch (const wfrun::util::SerializationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSnapshotRoundTrip();
  TestInfosRoundTripPreservesOrder();
  TestAbsentBlobsDecodeToDefaults();
  TestUnknownFieldsAreIgnored();
  TestMalformedBlobIsSerializationError();

  std::cout << "wfrun_unit_serializer: pass\n";
  return 0;
}
