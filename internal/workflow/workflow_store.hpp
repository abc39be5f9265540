#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::workflow {

// A workflow payload together with the authoritative record of every
// member, read inside one transaction.
struct WorkflowSnapshot {
  launchpad::core::v1::Workflow                    workflow;
  std::map<int64_t, launchpad::core::v1::Firework> fireworks;
};

/*
  Typed access to the repository for the workflow components.

  Every call runs inside the caller's transaction and re-reads the
  store; nothing is cached between calls.
*/
class WorkflowStore {
 public:
  explicit WorkflowStore(std::shared_ptr<db::Repository> repository);

  db::Repository& Repository() {
    return *repository_;
  }

  std::optional<launchpad::core::v1::Firework> FindFirework(db::Transaction& tx, int64_t fw_id);

  // Throws util::NotFound.
  launchpad::core::v1::Firework GetFirework(db::Transaction& tx, int64_t fw_id);

  void PutFirework(db::Transaction& tx, const launchpad::core::v1::Firework& firework);
  void PutFireworks(db::Transaction& tx, const std::vector<launchpad::core::v1::Firework>& fireworks);

  std::vector<int64_t> FindFireworkIds(db::Transaction& tx, launchpad::core::v1::FireworkState state, std::size_t limit = 0);

  // Throws util::NotFound for an unknown firework and
  // util::ConsistencyViolation for a firework with no membership row.
  int64_t GetWorkflowId(db::Transaction& tx, int64_t fw_id);

  // A workflow referenced by the membership index must exist; a missing
  // payload is a util::ConsistencyViolation.
  launchpad::core::v1::Workflow GetWorkflow(db::Transaction& tx, int64_t wf_id);

  void PutWorkflow(db::Transaction& tx, const launchpad::core::v1::Workflow& workflow);

  void PutMemberships(db::Transaction& tx, int64_t wf_id, const std::vector<int64_t>& fw_ids);

  // Membership index -> payload -> every member. The workflow's links
  // must contain fw_id and every member must have a record.
  WorkflowSnapshot LoadSnapshot(db::Transaction& tx, int64_t fw_id);

  // Throws util::NotFound.
  launchpad::core::v1::Launch GetLaunch(db::Transaction& tx, int64_t launch_id);

  void InsertLaunch(db::Transaction& tx, const launchpad::core::v1::Launch& launch);
  void UpdateLaunch(db::Transaction& tx, const launchpad::core::v1::Launch& launch);

  std::vector<launchpad::core::v1::Launch> FindLaunches(db::Transaction& tx, launchpad::core::v1::FireworkState state);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace launchpad::workflow
