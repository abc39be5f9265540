#include "internal/model/record_codec.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "launchpad/v1.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using namespace launchpad::v1;

google::protobuf::Value Number(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

google::protobuf::Value Text(const std::string& s) {
  google::protobuf::Value value;
  value.set_string_value(s);
  return value;
}

Firework MakeNestedFirework() {
  Firework fw;
  fw.set_fw_id(42);
  fw.set_state(FIREWORK_STATE_READY);
  fw.set_name("σύνθεση ✓ 合成");

  auto& spec = *fw.mutable_spec()->mutable_fields();
  spec["_priority"] = Number(3);
  spec["label"]     = Text("naïve \"quoted\" \\ back");
  spec["flag"].set_bool_value(false);
  spec["nothing"].set_null_value(google::protobuf::NULL_VALUE);

  auto& nested = *spec["nested"].mutable_struct_value()->mutable_fields();
  nested["depth"] = Number(2);
  auto* list      = nested["items"].mutable_list_value();
  *list->add_values() = Number(1.5);
  *list->add_values() = Text("two");
  list->add_values()->mutable_struct_value();
  list->add_values()->mutable_list_value();

  auto* task = fw.add_tasks();
  task->set_name("JoinListTask");
  (*task->mutable_params()->mutable_fields())["outputs"] = Text("out");

  fw.add_launch_ids(7);
  fw.add_launch_ids(9);
  fw.mutable_created_on()->set_seconds(1'700'000'000);
  fw.mutable_created_on()->set_nanos(123'000'000);
  fw.mutable_updated_on()->set_seconds(1'700'000'100);
  return fw;
}

void TestFireworkRoundTrip() {
  const auto fw     = MakeNestedFirework();
  const auto record = launchpad::model::ToRecord(fw);

  assert(record.fw_id == 42);
  assert(record.state == "READY");

  const auto back = launchpad::model::FireworkFromRecord(record);
  assert(MessageDifferencer::Equals(fw, back));
}

void TestEmptyFireworkRoundTrip() {
  Firework fw;
  fw.set_fw_id(1);
  fw.set_state(FIREWORK_STATE_WAITING);

  const auto back = launchpad::model::FireworkFromRecord(launchpad::model::ToRecord(fw));
  assert(MessageDifferencer::Equals(fw, back));
}

void TestWorkflowRoundTripDropsHydratedFireworks() {
  Workflow wf;
  wf.set_wf_id(5);
  wf.set_name("pipeline");
  (*wf.mutable_metadata()->mutable_fields())["owner"] = Text("ops");
  (*wf.mutable_links())[1].add_children(2);
  (*wf.mutable_links())[1].add_children(3);
  (*wf.mutable_links())[2];
  (*wf.mutable_links())[3];
  (*wf.mutable_fw_states())[1] = FIREWORK_STATE_COMPLETED;
  (*wf.mutable_fw_states())[2] = FIREWORK_STATE_READY;
  (*wf.mutable_fw_states())[3] = FIREWORK_STATE_WAITING;
  wf.set_state(FIREWORK_STATE_RUNNING);
  wf.mutable_updated_on()->set_seconds(99);

  Workflow hydrated = wf;
  *hydrated.add_fireworks() = MakeNestedFirework();

  const auto record = launchpad::model::ToRecord(hydrated);
  assert(record.wf_id == 5);

  const auto back = launchpad::model::WorkflowFromRecord(record);
  assert(back.fireworks_size() == 0);
  assert(MessageDifferencer::Equals(wf, back));
}

void TestLaunchRoundTrip() {
  Launch launch;
  launch.set_launch_id(11);
  launch.set_fw_id(42);
  launch.set_state(FIREWORK_STATE_COMPLETED);
  launch.set_worker("worker-α");
  launch.set_host("node01");
  launch.set_launch_dir("/scratch/run 1");
  launch.mutable_last_pinged()->set_seconds(10);
  auto* entry = launch.add_state_history();
  entry->set_state(FIREWORK_STATE_RUNNING);
  entry->mutable_at()->set_seconds(5);
  entry = launch.add_state_history();
  entry->set_state(FIREWORK_STATE_COMPLETED);
  entry->mutable_at()->set_seconds(12);

  auto* action = launch.mutable_action();
  (*action->mutable_update_spec()->mutable_fields())["x"] = Number(1);
  auto* push = action->add_mod_spec_push();
  push->set_key("acc");
  *push->mutable_value() = Text("v");
  auto* detour = action->add_detours();
  detour->set_mode(EXTENSION_MODE_DETOUR);
  detour->mutable_workflow()->add_fireworks()->set_fw_id(-1);
  action->set_defuse_children(true);

  const auto record = launchpad::model::ToRecord(launch);
  assert(record.launch_id == 11);
  assert(record.fw_id == 42);
  assert(record.state == "COMPLETED");

  const auto back = launchpad::model::LaunchFromRecord(record);
  assert(MessageDifferencer::Equals(launch, back));
}

void TestUnknownBlobFieldsAreIgnored() {
  launchpad::db::model::FireworkRecord record;
  record.fw_id = 3;
  record.state = "WAITING";
  record.data  = R"({"name":"future","added_in_v2":{"a":1}})";

  const auto fw = launchpad::model::FireworkFromRecord(record);
  assert(fw.name() == "future");
  assert(fw.state() == FIREWORK_STATE_WAITING);
}

void TestMalformedBlobIsConsistencyViolation() {
  launchpad::db::model::FireworkRecord record;
  record.fw_id = 3;
  record.state = "WAITING";
  record.data  = "{not json";

  bool threw = false;
  try {
    (void)launchpad::model::FireworkFromRecord(record);
  } catch (const launchpad::util::ConsistencyViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownStateIsConsistencyViolation() {
  launchpad::db::model::LaunchRecord record;
  record.launch_id = 1;
  record.fw_id     = 1;
  record.state     = "EXPLODED";
  record.data      = "{}";

  bool threw = false;
  try {
    (void)launchpad::model::LaunchFromRecord(record);
  } catch (const launchpad::util::ConsistencyViolation&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFireworkRoundTrip();
  TestEmptyFireworkRoundTrip();
  TestWorkflowRoundTripDropsHydratedFireworks();
  TestLaunchRoundTrip();
  TestUnknownBlobFieldsAreIgnored();
  TestMalformedBlobIsConsistencyViolation();
  TestUnknownStateIsConsistencyViolation();

  std::cout << "launchpad_unit_record_codec: pass\n";
  return 0;
}
