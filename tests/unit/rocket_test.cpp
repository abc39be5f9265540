#include "internal/rocket/rocket.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/tasks/dataflow_tasks.hpp"
#include "internal/tasks/task_registry.hpp"
#include "internal/util/errors.hpp"
#include "launchpad/v1.hpp"

namespace {

using namespace launchpad::v1;
using google::protobuf::Struct;
using google::protobuf::Value;
using launchpad::core::LaunchPad;
using launchpad::tasks::TaskRegistry;

const launchpad::checkout::WorkerInfo kWorker{"rocket", "localhost", "/tmp"};

// Squares spec["xs"] into y and hands y to the children.
class SquareTask final : public launchpad::tasks::Task {
 public:
  FWAction Run(const Struct& spec, const Struct&) override {
    const double x = spec.fields().at("xs").number_value();
    FWAction     action;
    (*action.mutable_update_spec()->mutable_fields())["y"].set_number_value(x * x);
    (*action.mutable_child_update_spec()->mutable_fields())["y"].set_number_value(x * x);
    return action;
  }
};

class FailTask final : public launchpad::tasks::Task {
 public:
  FWAction Run(const Struct&, const Struct&) override {
    throw std::runtime_error("boom");
  }
};

TaskRegistry MakeRegistry() {
  TaskRegistry registry;
  launchpad::tasks::RegisterBuiltinTasks(registry);
  registry.Register("SquareTask", [] { return std::make_unique<SquareTask>(); });
  registry.Register("FailTask", [] { return std::make_unique<FailTask>(); });
  return registry;
}

Value Strings(std::initializer_list<const char*> items) {
  Value value;
  for (const auto* item : items) value.mutable_list_value()->add_values()->set_string_value(item);
  return value;
}

Task* AddTask(Firework* fw, const std::string& name) {
  auto* task = fw->add_tasks();
  task->set_name(name);
  return task;
}

template <typename Error>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestJoinTasksPassDataDownstream() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  WorkflowSpec spec;
  auto*        first = spec.add_fireworks();
  first->set_fw_id(1);
  (*first->mutable_spec()->mutable_fields())["a"].set_number_value(1);
  (*first->mutable_spec()->mutable_fields())["b"].set_string_value("two");
  auto& join_dict = *AddTask(first, launchpad::tasks::JoinDictTask::kName)->mutable_params()->mutable_fields();
  join_dict["inputs"]  = Strings({"a", "b"});
  join_dict["outputs"].set_string_value("joined");
  (*join_dict["rename"].mutable_struct_value()->mutable_fields())["b"].set_string_value("beta");

  auto* second = spec.add_fireworks();
  second->set_fw_id(2);
  auto& join_list = *AddTask(second, launchpad::tasks::JoinListTask::kName)->mutable_params()->mutable_fields();
  join_list["inputs"].set_string_value("joined");
  join_list["outputs"].set_string_value("all");
  (*spec.mutable_links())[1].add_children(2);

  const auto id = lp.SubmitWorkflow(spec).id_map;
  assert(launchpad::rocket::RapidFire(lp, registry, kWorker) == 2);

  const auto joined = lp.GetFirework(id.at(1)).spec().fields().at("joined").struct_value();
  assert(joined.fields().at("a").number_value() == 1);
  assert(joined.fields().at("beta").string_value() == "two");
  assert(!joined.fields().contains("b"));

  const auto downstream = lp.GetFirework(id.at(2));
  assert(downstream.state() == FIREWORK_STATE_COMPLETED);
  assert(downstream.spec().fields().contains("joined"));
  const auto& all = downstream.spec().fields().at("all").list_value();
  assert(all.values_size() == 1);
  assert(all.values(0).struct_value().fields().at("beta").string_value() == "two");

  const auto launch = lp.GetLaunch(downstream.launch_ids(0));
  assert(launch.action().stored_data().fields().contains("all"));
}

WorkflowSpec ForeachWorkflow(Value xs) {
  WorkflowSpec spec;
  auto*        fan_out = spec.add_fireworks();
  fan_out->set_fw_id(1);
  (*fan_out->mutable_spec()->mutable_fields())["xs"] = std::move(xs);
  auto& params = *AddTask(fan_out, launchpad::tasks::ForeachTask::kName)->mutable_params()->mutable_fields();
  params["split"].set_string_value("xs");
  (*params["task"].mutable_struct_value()->mutable_fields())["name"].set_string_value("SquareTask");

  auto* fan_in = spec.add_fireworks();
  fan_in->set_fw_id(2);
  auto& join = *AddTask(fan_in, launchpad::tasks::JoinListTask::kName)->mutable_params()->mutable_fields();
  join["inputs"].set_string_value("y");
  join["outputs"].set_string_value("ys");
  (*spec.mutable_links())[1].add_children(2);
  return spec;
}

void TestForeachFansOutThroughDetours() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  Value xs;
  for (const double x : {1.0, 2.0, 3.0}) xs.mutable_list_value()->add_values()->set_number_value(x);
  const auto submitted = lp.SubmitWorkflow(ForeachWorkflow(xs));

  // The fan-out and its three branches, then the fan-in.
  assert(launchpad::rocket::RapidFire(lp, registry, kWorker) == 5);

  const auto wf = lp.GetWorkflowByFireworkId(submitted.id_map.at(1));
  assert(wf.wf_id() == submitted.wf_id);
  assert(wf.fireworks_size() == 5);
  assert(wf.state() == FIREWORK_STATE_COMPLETED);

  std::set<double> squares;
  for (const auto& fw : wf.fireworks()) {
    if (fw.fw_id() == submitted.id_map.at(1) || fw.fw_id() == submitted.id_map.at(2)) continue;
    const double x = fw.spec().fields().at("xs").number_value();
    const double y = fw.spec().fields().at("y").number_value();
    assert(y == x * x);
    squares.insert(y);
    // Every branch feeds the fan-in.
    assert(wf.links().at(fw.fw_id()).children(0) == submitted.id_map.at(2));
  }
  assert((squares == std::set<double>{1, 4, 9}));

  const auto fan_in = lp.GetFirework(submitted.id_map.at(2));
  assert(squares.contains(fan_in.spec().fields().at("y").number_value()));
  assert(fan_in.spec().fields().at("ys").list_value().values_size() == 1);
}

void TestForeachOverEmptyListDefusesWorkflow() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  Value empty;
  empty.mutable_list_value();
  const auto id = lp.SubmitWorkflow(ForeachWorkflow(empty)).id_map;

  assert(launchpad::rocket::RapidFire(lp, registry, kWorker) == 1);
  assert(lp.GetFirework(id.at(1)).state() == FIREWORK_STATE_COMPLETED);
  assert(lp.GetFirework(id.at(2)).state() == FIREWORK_STATE_DEFUSED);
  assert(lp.GetWorkflowByFireworkId(id.at(1)).state() == FIREWORK_STATE_DEFUSED);
}

void TestTaskFailureFizzles() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  WorkflowSpec spec;
  auto*        fw = spec.add_fireworks();
  fw->set_fw_id(1);
  (*fw->mutable_spec()->mutable_fields())["xs"].set_number_value(3);
  AddTask(fw, "SquareTask");
  AddTask(fw, "FailTask");
  spec.add_fireworks()->set_fw_id(2);
  (*spec.mutable_links())[1].add_children(2);
  const auto id = lp.SubmitWorkflow(spec).id_map;

  assert(launchpad::rocket::LaunchRocket(lp, registry, kWorker));

  const auto failed = lp.GetFirework(id.at(1));
  assert(failed.state() == FIREWORK_STATE_FIZZLED);
  // Output of the task that did succeed is not committed.
  assert(!failed.spec().fields().contains("y"));
  assert(lp.GetFirework(id.at(2)).state() == FIREWORK_STATE_DEFUSED);

  const auto  launch    = lp.GetLaunch(failed.launch_ids(0));
  const auto& exception = launch.action().stored_data().fields().at("_exception").struct_value().fields();
  assert(exception.at("message").string_value() == "boom");
  assert(exception.at("task_index").number_value() == 1);
  assert(exception.at("task").string_value() == "FailTask");

  assert(!launchpad::rocket::LaunchRocket(lp, registry, kWorker));
}

void TestUnknownTaskFizzles() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  WorkflowSpec spec;
  AddTask(spec.add_fireworks(), "NoSuchTask");
  spec.mutable_fireworks(0)->set_fw_id(1);
  lp.SubmitWorkflow(spec);

  assert(launchpad::rocket::LaunchRocket(lp, registry, kWorker, 1));
  const auto fw      = lp.GetFirework(1);
  const auto message = lp.GetLaunch(fw.launch_ids(0)).action().stored_data().fields().at("_exception").struct_value().fields().at("message");
  assert(fw.state() == FIREWORK_STATE_FIZZLED);
  assert(message.string_value().find("NoSuchTask") != std::string::npos);
}

void TestRapidFireHonorsLimit() {
  LaunchPad  lp(std::make_shared<launchpad::db::memory::MemoryRepository>());
  const auto registry = MakeRegistry();

  WorkflowSpec spec;
  for (int i = 1; i <= 4; ++i) spec.add_fireworks()->set_fw_id(i);
  lp.SubmitWorkflow(spec);

  assert(launchpad::rocket::RapidFire(lp, registry, kWorker, 3) == 3);
  assert(lp.GetFireworkIds(FIREWORK_STATE_READY).size() == 1);
  assert(launchpad::rocket::RapidFire(lp, registry, kWorker) == 1);
  assert(lp.GetFireworkIds(FIREWORK_STATE_COMPLETED).size() == 4);
}

void TestRegistry() {
  auto registry = MakeRegistry();
  assert(registry.Contains(launchpad::tasks::ForeachTask::kName));
  assert(registry.Names().size() == 5);

  assert(Throws<launchpad::util::AlreadyExists>([&] { registry.Register("SquareTask", [] { return std::make_unique<SquareTask>(); }); }));
  assert(Throws<launchpad::util::InvalidArgument>([&] { registry.Register("Empty", nullptr); }));
  assert(Throws<launchpad::util::NotFound>([&] { registry.Create("Missing"); }));
}

void TestTaskParamValidation() {
  launchpad::tasks::JoinListTask join_list;
  launchpad::tasks::ForeachTask  foreach_task;

  Struct spec;
  (*spec.mutable_fields())["scalar"].set_number_value(1);

  Struct no_outputs;
  (*no_outputs.mutable_fields())["inputs"].set_string_value("scalar");
  assert(Throws<launchpad::util::InvalidArgument>([&] { join_list.Run(spec, no_outputs); }));

  Struct missing_input;
  (*missing_input.mutable_fields())["inputs"].set_string_value("absent");
  (*missing_input.mutable_fields())["outputs"].set_string_value("out");
  assert(Throws<launchpad::util::InvalidArgument>([&] { join_list.Run(spec, missing_input); }));

  Struct split_scalar;
  (*split_scalar.mutable_fields())["split"].set_string_value("scalar");
  (*(*split_scalar.mutable_fields())["task"].mutable_struct_value()->mutable_fields())["name"].set_string_value("SquareTask");
  assert(Throws<launchpad::util::InvalidArgument>([&] { foreach_task.Run(spec, split_scalar); }));
}

} // namespace

int main() {
  TestJoinTasksPassDataDownstream();
  TestForeachFansOutThroughDetours();
  TestForeachOverEmptyListDefusesWorkflow();
  TestTaskFailureFizzles();
  TestUnknownTaskFizzles();
  TestRapidFireHonorsLimit();
  TestRegistry();
  TestTaskParamValidation();

  std::cout << "launchpad_unit_rocket: pass\n";
  return 0;
}
