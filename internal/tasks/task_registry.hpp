#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/tasks/task.hpp"

namespace launchpad::tasks {

// Name -> factory. Built once at process start, read-only afterwards.
class TaskRegistry {
 public:
  using Factory = std::function<std::unique_ptr<Task>()>;

  // Throws util::AlreadyExists for a duplicate name.
  void Register(const std::string& name, Factory factory);

  // Throws util::NotFound for an unknown name.
  std::unique_ptr<Task> Create(const std::string& name) const;

  bool Contains(const std::string& name) const;

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, Factory> factories_;
};

// JoinDictTask, JoinListTask, ForeachTask.
void RegisterBuiltinTasks(TaskRegistry& registry);

} // namespace launchpad::tasks
