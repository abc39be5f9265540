#include "memory_repository.hpp"

#include <limits>

#include "memory_tx.hpp"

namespace launchpad::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result MemoryRepository::NextId(Transaction& t, const std::string& counter, int64_t quantity, int64_t& first_id) {
  if (quantity < 1) return Result::Err(ErrorCode::InvalidArgument, "quantity must be positive");

  auto& s       = TX(t).Mutable();
  auto [it, _]  = s.counters.try_emplace(counter, 1);
  const auto id = it->second;
  if (id > std::numeric_limits<int64_t>::max() - quantity) {
    return Result::Err(ErrorCode::ResourceExhausted, "counter " + counter + " exhausted");
  }

  first_id   = id;
  it->second = id + quantity;
  return Result::Ok();
}

Result MemoryRepository::ResetCounters(Transaction& t) {
  for (auto& [_, value] : TX(t).Mutable().counters) {
    value = 1;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Fireworks
// ------------------------------------------------------------------

std::optional<model::FireworkRecord> MemoryRepository::GetFirework(Transaction& t, int64_t fw_id) {
  const auto& s  = TX(t).View();
  auto        it = s.fireworks.find(fw_id);
  if (it == s.fireworks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertFirework(Transaction& t, const model::FireworkRecord& r) {
  TX(t).Mutable().fireworks[r.fw_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertFireworks(Transaction& t, const std::vector<model::FireworkRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.fireworks[r.fw_id] = r;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteFirework(Transaction& t, int64_t fw_id) {
  TX(t).Mutable().fireworks.erase(fw_id);
  return Result::Ok();
}

std::vector<int64_t> MemoryRepository::FindFireworkIdsByState(Transaction& t, const std::string& state, std::size_t limit) {
  std::vector<int64_t> out;
  for (const auto& [id, record] : TX(t).View().fireworks) {
    if (record.state != state) continue;
    out.push_back(id);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

std::vector<int64_t> MemoryRepository::ListFireworkIds(Transaction& t) {
  std::vector<int64_t> out;
  for (const auto& [id, _] : TX(t).View().fireworks) out.push_back(id);
  return out;
}

// ------------------------------------------------------------------
// Workflows
// ------------------------------------------------------------------

std::optional<model::WorkflowRecord> MemoryRepository::GetWorkflow(Transaction& t, int64_t wf_id) {
  const auto& s  = TX(t).View();
  auto        it = s.workflows.find(wf_id);
  if (it == s.workflows.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertWorkflow(Transaction& t, const model::WorkflowRecord& r) {
  TX(t).Mutable().workflows[r.wf_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteWorkflow(Transaction& t, int64_t wf_id) {
  TX(t).Mutable().workflows.erase(wf_id);
  return Result::Ok();
}

std::vector<int64_t> MemoryRepository::ListWorkflowIds(Transaction& t) {
  std::vector<int64_t> out;
  for (const auto& [id, _] : TX(t).View().workflows) out.push_back(id);
  return out;
}

// ------------------------------------------------------------------
// Membership
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMappings(Transaction& t, const std::vector<model::MappingRecord>& rows) {
  auto& s = TX(t).Mutable();
  for (const auto& row : rows) {
    s.mapping[row.fw_id] = row.wf_id;
  }
  return Result::Ok();
}

std::optional<int64_t> MemoryRepository::GetWorkflowIdForFirework(Transaction& t, int64_t fw_id) {
  const auto& s  = TX(t).View();
  auto        it = s.mapping.find(fw_id);
  if (it == s.mapping.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteMapping(Transaction& t, int64_t fw_id) {
  TX(t).Mutable().mapping.erase(fw_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Launches
// ------------------------------------------------------------------

Result MemoryRepository::InsertLaunch(Transaction& t, const model::LaunchRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.launches.contains(r.launch_id)) return Result::Err(ErrorCode::AlreadyExists, "launch " + std::to_string(r.launch_id));
  s.launches[r.launch_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateLaunch(Transaction& t, const model::LaunchRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.launches.contains(r.launch_id)) return Result::Err(ErrorCode::NotFound, "launch " + std::to_string(r.launch_id));
  s.launches[r.launch_id] = r;
  return Result::Ok();
}

std::optional<model::LaunchRecord> MemoryRepository::GetLaunch(Transaction& t, int64_t launch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.launches.find(launch_id);
  if (it == s.launches.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LaunchRecord> MemoryRepository::FindLaunchesByState(Transaction& t, const std::string& state) {
  std::vector<model::LaunchRecord> out;
  for (const auto& [_, record] : TX(t).View().launches) {
    if (record.state == state) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::Clear(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.fireworks.clear();
  s.workflows.clear();
  s.mapping.clear();
  s.launches.clear();
  return Result::Ok();
}

} // namespace launchpad::db::memory
