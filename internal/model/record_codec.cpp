#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::model {

using namespace launchpad::core::v1;

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message, const std::string& what) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::ConsistencyViolation("malformed " + what + " payload: " + std::string(status.message()));
  }
}

} // namespace

db::model::FireworkRecord ToRecord(const Firework& firework) {
  Firework blob = firework;
  blob.clear_fw_id();
  blob.clear_state();

  db::model::FireworkRecord record;
  record.fw_id = firework.fw_id();
  record.state = ToString(firework.state());
  record.data  = ToJson(blob);
  return record;
}

Firework FireworkFromRecord(const db::model::FireworkRecord& record) {
  Firework firework;
  FromJson(record.data, &firework, "firework " + std::to_string(record.fw_id));
  firework.set_fw_id(record.fw_id);
  firework.set_state(StateFromString(record.state));
  return firework;
}

db::model::WorkflowRecord ToRecord(const Workflow& workflow) {
  Workflow blob = workflow;
  blob.clear_wf_id();
  blob.clear_fireworks();

  db::model::WorkflowRecord record;
  record.wf_id = workflow.wf_id();
  record.data  = ToJson(blob);
  return record;
}

Workflow WorkflowFromRecord(const db::model::WorkflowRecord& record) {
  Workflow workflow;
  FromJson(record.data, &workflow, "workflow " + std::to_string(record.wf_id));
  workflow.set_wf_id(record.wf_id);
  return workflow;
}

db::model::LaunchRecord ToRecord(const Launch& launch) {
  Launch blob = launch;
  blob.clear_launch_id();
  blob.clear_fw_id();
  blob.clear_state();

  db::model::LaunchRecord record;
  record.launch_id = launch.launch_id();
  record.fw_id     = launch.fw_id();
  record.state     = ToString(launch.state());
  record.data      = ToJson(blob);
  return record;
}

Launch LaunchFromRecord(const db::model::LaunchRecord& record) {
  Launch launch;
  FromJson(record.data, &launch, "launch " + std::to_string(record.launch_id));
  launch.set_launch_id(record.launch_id);
  launch.set_fw_id(record.fw_id);
  launch.set_state(StateFromString(record.state));
  return launch;
}

} // namespace launchpad::model
