#pragma once

#include "internal/tasks/task.hpp"

namespace launchpad::tasks {

/*
  Data-flow tasks. Results are written to the current spec and to every
  direct child's spec, and recorded in stored_data.
*/

// Params: inputs (list of spec keys), outputs (spec key), rename
// (optional object, input key -> output key). Collects the inputs into
// the object at outputs, extending an existing object.
class JoinDictTask final : public Task {
 public:
  static constexpr char kName[] = "JoinDictTask";

  launchpad::core::v1::FWAction Run(const google::protobuf::Struct& spec, const google::protobuf::Struct& params) override;
};

// Params: inputs (list of spec keys), outputs (spec key). Appends the
// inputs to the list at outputs.
class JoinListTask final : public Task {
 public:
  static constexpr char kName[] = "JoinListTask";

  launchpad::core::v1::FWAction Run(const google::protobuf::Struct& spec, const google::protobuf::Struct& params) override;
};

// Params: split (spec key of a list), task (object {name, params}).
// Detours one firework per element, each running task with spec[split]
// replaced by its element. An empty list defuses the workflow.
class ForeachTask final : public Task {
 public:
  static constexpr char kName[] = "ForeachTask";

  launchpad::core::v1::FWAction Run(const google::protobuf::Struct& spec, const google::protobuf::Struct& params) override;
};

} // namespace launchpad::tasks
