#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <google/protobuf/map.h>

#include "internal/db/api/transaction.hpp"
#include "internal/model/workflow_graph.hpp"
#include "internal/workflow/workflow_store.hpp"
#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::workflow {

/*
  Summary state of a workflow from its member states, first match wins:

    all ARCHIVED                      -> ARCHIVED
    all COMPLETED                     -> COMPLETED
    any FIZZLED                       -> FIZZLED
    any DEFUSED                       -> DEFUSED
    any PAUSED                        -> PAUSED
    any RUNNING/RESERVED, or COMPLETED
    mixed with pending members        -> RUNNING
    any READY                         -> READY
    otherwise                         -> WAITING
*/
launchpad::core::v1::FireworkState DeriveWorkflowState(const google::protobuf::Map<int64_t, launchpad::core::v1::FireworkState>& states);

// State of a pending node given its parents: DEFUSED if any parent is
// FIZZLED or DEFUSED, READY if every parent is COMPLETED (roots are
// always READY), WAITING otherwise.
launchpad::core::v1::FireworkState
ReadinessFromParents(const model::WorkflowGraph& graph, const google::protobuf::Map<int64_t, launchpad::core::v1::FireworkState>& states, int64_t fw_id);

/*
  RefreshEngine

  Propagates the consequences of one node's state change through its
  workflow. The caller persists the node's own new state first; the
  engine reads everything back inside the same transaction.

  Only nodes in WAITING or READY are ever moved by propagation. Nodes
  whose state did not change are not rewritten, and a refresh that
  changes nothing leaves the store untouched.
*/
class RefreshEngine {
 public:
  explicit RefreshEngine(std::shared_ptr<WorkflowStore> store);

  // One propagation step from fw_id. Returns the ids whose state changed,
  // ascending. Throws util::NotFound / util::ConsistencyViolation.
  std::vector<int64_t> Refresh(db::Transaction& tx, int64_t fw_id);

  // Refreshes each seed, then every node changed by a previous step,
  // breadth-first, until no further state changes. Returns all changed
  // ids in the order they first changed.
  std::vector<int64_t> RefreshUntilStable(db::Transaction& tx, const std::vector<int64_t>& seeds);

  std::vector<int64_t> RefreshUntilStable(db::Transaction& tx, int64_t fw_id) {
    return RefreshUntilStable(tx, std::vector<int64_t>{fw_id});
  }

 private:
  std::shared_ptr<WorkflowStore> store_;
};

} // namespace launchpad::workflow
