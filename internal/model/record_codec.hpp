#pragma once

#include "internal/db/model/firework_record.hpp"
#include "internal/db/model/launch_record.hpp"
#include "internal/db/model/workflow_record.hpp"
#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::model {

/*
  Entity <-> row codec.

  Each entity is split into the indexed scalar columns and a JSON blob
  (protobuf JSON mapping, proto field names) holding everything else.
  Unknown blob fields are ignored on read so stored content can evolve.

  FromRecord throws util::ConsistencyViolation on a malformed blob or an
  unknown state column.
*/

db::model::FireworkRecord  ToRecord(const launchpad::core::v1::Firework& firework);
launchpad::core::v1::Firework FireworkFromRecord(const db::model::FireworkRecord& record);

// Hydrated fireworks are never persisted.
db::model::WorkflowRecord  ToRecord(const launchpad::core::v1::Workflow& workflow);
launchpad::core::v1::Workflow WorkflowFromRecord(const db::model::WorkflowRecord& record);

db::model::LaunchRecord  ToRecord(const launchpad::core::v1::Launch& launch);
launchpad::core::v1::Launch LaunchFromRecord(const db::model::LaunchRecord& record);

} // namespace launchpad::model
