#pragma once

#include <google/protobuf/struct.pb.h>

#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::tasks {

/*
  Unit of work inside a firework.

  Run receives the firework's working spec (including updates made by
  earlier tasks of the same firework) and the task's own params. Bad
  params or spec content throw util::InvalidArgument; any exception
  fizzles the launch.
*/
class Task {
 public:
  virtual ~Task() = default;

  virtual launchpad::core::v1::FWAction Run(const google::protobuf::Struct& spec, const google::protobuf::Struct& params) = 0;
};

} // namespace launchpad::tasks
