#include "task_registry.hpp"

#include "internal/tasks/dataflow_tasks.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::tasks {

void TaskRegistry::Register(const std::string& name, Factory factory) {
  if (!factory) {
    throw util::InvalidArgument("task '" + name + "' registered without a factory");
  }
  if (!factories_.emplace(name, std::move(factory)).second) {
    throw util::AlreadyExists("task '" + name + "' already registered");
  }
}

std::unique_ptr<Task> TaskRegistry::Create(const std::string& name) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    throw util::NotFound("unknown task '" + name + "'");
  }
  return it->second();
}

bool TaskRegistry::Contains(const std::string& name) const {
  return factories_.contains(name);
}

std::vector<std::string> TaskRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto& [name, _] : factories_) names.push_back(name);
  return names;
}

void RegisterBuiltinTasks(TaskRegistry& registry) {
  registry.Register(JoinDictTask::kName, [] { return std::make_unique<JoinDictTask>(); });
  registry.Register(JoinListTask::kName, [] { return std::make_unique<JoinListTask>(); });
  registry.Register(ForeachTask::kName, [] { return std::make_unique<ForeachTask>(); });
}

} // namespace launchpad::tasks
