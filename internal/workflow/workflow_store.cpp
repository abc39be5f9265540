#include "workflow_store.hpp"

#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/model/record_codec.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::workflow {

using namespace launchpad::core::v1;

WorkflowStore::WorkflowStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<Firework> WorkflowStore::FindFirework(db::Transaction& tx, int64_t fw_id) {
  auto record = repository_->GetFirework(tx, fw_id);
  if (!record) return std::nullopt;
  return model::FireworkFromRecord(*record);
}

Firework WorkflowStore::GetFirework(db::Transaction& tx, int64_t fw_id) {
  auto firework = FindFirework(tx, fw_id);
  if (!firework) {
    throw util::NotFound("firework " + std::to_string(fw_id) + " not found");
  }
  return *firework;
}

void WorkflowStore::PutFirework(db::Transaction& tx, const Firework& firework) {
  db::ThrowIfDbError(repository_->UpsertFirework(tx, model::ToRecord(firework)), "write firework " + std::to_string(firework.fw_id()));
}

void WorkflowStore::PutFireworks(db::Transaction& tx, const std::vector<Firework>& fireworks) {
  std::vector<db::model::FireworkRecord> records;
  records.reserve(fireworks.size());
  for (const auto& firework : fireworks) {
    records.push_back(model::ToRecord(firework));
  }
  db::ThrowIfDbError(repository_->UpsertFireworks(tx, records), "write fireworks");
}

std::vector<int64_t> WorkflowStore::FindFireworkIds(db::Transaction& tx, FireworkState state, std::size_t limit) {
  return repository_->FindFireworkIdsByState(tx, model::ToString(state), limit);
}

int64_t WorkflowStore::GetWorkflowId(db::Transaction& tx, int64_t fw_id) {
  if (auto wf_id = repository_->GetWorkflowIdForFirework(tx, fw_id)) {
    return *wf_id;
  }
  if (repository_->GetFirework(tx, fw_id)) {
    throw util::ConsistencyViolation("firework " + std::to_string(fw_id) + " has no owning workflow");
  }
  throw util::NotFound("firework " + std::to_string(fw_id) + " not found");
}

Workflow WorkflowStore::GetWorkflow(db::Transaction& tx, int64_t wf_id) {
  auto record = repository_->GetWorkflow(tx, wf_id);
  if (!record) {
    throw util::ConsistencyViolation("workflow " + std::to_string(wf_id) + " is referenced but missing");
  }
  return model::WorkflowFromRecord(*record);
}

void WorkflowStore::PutWorkflow(db::Transaction& tx, const Workflow& workflow) {
  db::ThrowIfDbError(repository_->UpsertWorkflow(tx, model::ToRecord(workflow)), "write workflow " + std::to_string(workflow.wf_id()));
}

void WorkflowStore::PutMemberships(db::Transaction& tx, int64_t wf_id, const std::vector<int64_t>& fw_ids) {
  std::vector<db::model::MappingRecord> rows;
  rows.reserve(fw_ids.size());
  for (const auto fw_id : fw_ids) {
    rows.push_back({fw_id, wf_id});
  }
  db::ThrowIfDbError(repository_->UpsertMappings(tx, rows), "write membership for workflow " + std::to_string(wf_id));
}

WorkflowSnapshot WorkflowStore::LoadSnapshot(db::Transaction& tx, int64_t fw_id) {
  const auto wf_id = GetWorkflowId(tx, fw_id);

  WorkflowSnapshot snapshot;
  snapshot.workflow = GetWorkflow(tx, wf_id);

  const auto& links = snapshot.workflow.links();
  if (!links.contains(fw_id)) {
    throw util::ConsistencyViolation("workflow " + std::to_string(wf_id) + " does not list member firework " + std::to_string(fw_id));
  }

  for (const auto& [member, link] : links) {
    auto firework = FindFirework(tx, member);
    if (!firework) {
      throw util::ConsistencyViolation("workflow " + std::to_string(wf_id) + " references missing firework " + std::to_string(member));
    }
    for (const auto child : link.children()) {
      if (!links.contains(child)) {
        throw util::ConsistencyViolation("workflow " + std::to_string(wf_id) + " links to non-member " + std::to_string(child));
      }
    }
    snapshot.fireworks.emplace(member, std::move(*firework));
  }
  return snapshot;
}

Launch WorkflowStore::GetLaunch(db::Transaction& tx, int64_t launch_id) {
  auto record = repository_->GetLaunch(tx, launch_id);
  if (!record) {
    throw util::NotFound("launch " + std::to_string(launch_id) + " not found");
  }
  return model::LaunchFromRecord(*record);
}

void WorkflowStore::InsertLaunch(db::Transaction& tx, const Launch& launch) {
  db::ThrowIfDbError(repository_->InsertLaunch(tx, model::ToRecord(launch)), "insert launch " + std::to_string(launch.launch_id()));
}

void WorkflowStore::UpdateLaunch(db::Transaction& tx, const Launch& launch) {
  db::ThrowIfDbError(repository_->UpdateLaunch(tx, model::ToRecord(launch)), "update launch " + std::to_string(launch.launch_id()));
}

std::vector<Launch> WorkflowStore::FindLaunches(db::Transaction& tx, FireworkState state) {
  std::vector<Launch> out;
  for (const auto& record : repository_->FindLaunchesByState(tx, model::ToString(state))) {
    out.push_back(model::LaunchFromRecord(record));
  }
  return out;
}

} // namespace launchpad::workflow
