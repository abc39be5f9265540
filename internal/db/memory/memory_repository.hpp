#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace launchpad::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result NextId(Transaction&, const std::string& counter, int64_t quantity, int64_t& first_id) override;
  Result ResetCounters(Transaction&) override;

  std::optional<model::FireworkRecord> GetFirework(Transaction&, int64_t fw_id) override;
  Result UpsertFirework(Transaction&, const model::FireworkRecord&) override;
  Result UpsertFireworks(Transaction&, const std::vector<model::FireworkRecord>&) override;
  Result DeleteFirework(Transaction&, int64_t fw_id) override;
  std::vector<int64_t> FindFireworkIdsByState(Transaction&, const std::string& state, std::size_t limit) override;
  std::vector<int64_t> ListFireworkIds(Transaction&) override;

  std::optional<model::WorkflowRecord> GetWorkflow(Transaction&, int64_t wf_id) override;
  Result UpsertWorkflow(Transaction&, const model::WorkflowRecord&) override;
  Result DeleteWorkflow(Transaction&, int64_t wf_id) override;
  std::vector<int64_t> ListWorkflowIds(Transaction&) override;

  Result UpsertMappings(Transaction&, const std::vector<model::MappingRecord>&) override;
  std::optional<int64_t> GetWorkflowIdForFirework(Transaction&, int64_t fw_id) override;
  Result DeleteMapping(Transaction&, int64_t fw_id) override;

  Result InsertLaunch(Transaction&, const model::LaunchRecord&) override;
  Result UpdateLaunch(Transaction&, const model::LaunchRecord&) override;
  std::optional<model::LaunchRecord> GetLaunch(Transaction&, int64_t launch_id) override;
  std::vector<model::LaunchRecord> FindLaunchesByState(Transaction&, const std::string& state) override;

  Result Clear(Transaction&) override;

private:
  friend class MemoryTransaction;

  // Ordered maps so id scans come back ascending like the SQL backend.
  struct State {
    std::map<std::string, int64_t>             counters;
    std::map<int64_t, model::FireworkRecord>   fireworks;
    std::map<int64_t, model::WorkflowRecord>   workflows;
    std::map<int64_t, int64_t>                 mapping;
    std::map<int64_t, model::LaunchRecord>     launches;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
