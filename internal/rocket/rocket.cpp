#include "rocket.hpp"

#include <exception>
#include <string>

#include "internal/model/spec_update.hpp"
#include "internal/observability/logging.hpp"

namespace launchpad::rocket {

using namespace launchpad::core::v1;

bool LaunchRocket(core::LaunchPad& launchpad, const tasks::TaskRegistry& registry, const checkout::WorkerInfo& worker, std::optional<int64_t> fw_id) {
  auto claim = launchpad.Checkout(worker, fw_id);
  if (!claim) return false;

  const auto& fw        = claim->firework;
  const auto  launch_id = claim->launch.launch_id();

  auto     spec = fw.spec();
  FWAction merged;
  int      step = 0;
  try {
    for (; step < fw.tasks_size(); ++step) {
      const auto& task   = fw.tasks(step);
      auto        action = registry.Create(task.name())->Run(spec, task.params());

      model::ApplyUpdateSpec(spec, action.update_spec());
      model::ApplyModSpecPush(spec, action.mod_spec_push());
      model::MergeAction(merged, action);
    }
  } catch (const std::exception& e) {
    LAUNCHPAD_LOG_WARN("task failed, fizzling launch", {observability::IntField("fw_id", fw.fw_id()), observability::IntField("launch_id", launch_id),
                                                        observability::IntField("task_index", step), observability::StringField("error", e.what())});

    FWAction failed;
    auto&    exception = *(*failed.mutable_stored_data()->mutable_fields())["_exception"].mutable_struct_value()->mutable_fields();
    exception["message"].set_string_value(e.what());
    exception["task_index"].set_number_value(step);
    if (step < fw.tasks_size()) exception["task"].set_string_value(fw.tasks(step).name());

    launchpad.Complete(launch_id, failed, FIREWORK_STATE_FIZZLED);
    return true;
  }

  launchpad.Complete(launch_id, merged, FIREWORK_STATE_COMPLETED);
  return true;
}

uint64_t RapidFire(core::LaunchPad& launchpad, const tasks::TaskRegistry& registry, const checkout::WorkerInfo& worker, uint64_t max_launches) {
  uint64_t launched = 0;
  while (max_launches == 0 || launched < max_launches) {
    if (!LaunchRocket(launchpad, registry, worker)) break;
    ++launched;
  }
  LAUNCHPAD_LOG_INFO("rapidfire finished", {observability::IntField("launches", static_cast<int64_t>(launched))});
  return launched;
}

} // namespace launchpad::rocket
