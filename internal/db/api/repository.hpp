#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/firework_record.hpp"
#include "internal/db/model/launch_record.hpp"
#include "internal/db/model/mapping_record.hpp"
#include "internal/db/model/workflow_record.hpp"

namespace launchpad::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Counter read-then-advance is atomic with the rest of the transaction
  - A workflow payload and its membership rows commit together

  The DB is the source of truth for:
    firework state
    workflow structure
    membership
    launches
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Counters (meta table)
  // ---------------------------------------------------------------------

  // Returns the current value in first_id and advances the counter by
  // quantity. Unknown counters start at 1.
  virtual Result NextId(Transaction&, const std::string& counter, int64_t quantity, int64_t& first_id) = 0;

  // Every known counter back to 1.
  virtual Result ResetCounters(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Fireworks
  // ---------------------------------------------------------------------

  virtual std::optional<model::FireworkRecord> GetFirework(Transaction&, int64_t fw_id) = 0;

  // Insert or full overwrite.
  virtual Result UpsertFirework(Transaction&, const model::FireworkRecord&) = 0;

  virtual Result UpsertFireworks(Transaction&, const std::vector<model::FireworkRecord>&) = 0;

  // Only used when ids are reassigned.
  virtual Result DeleteFirework(Transaction&, int64_t fw_id) = 0;

  // Ascending fw_id. limit 0 = no limit.
  virtual std::vector<int64_t> FindFireworkIdsByState(Transaction&, const std::string& state, std::size_t limit) = 0;

  virtual std::vector<int64_t> ListFireworkIds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Workflows
  // ---------------------------------------------------------------------

  virtual std::optional<model::WorkflowRecord> GetWorkflow(Transaction&, int64_t wf_id) = 0;

  virtual Result UpsertWorkflow(Transaction&, const model::WorkflowRecord&) = 0;

  virtual Result DeleteWorkflow(Transaction&, int64_t wf_id) = 0;

  virtual std::vector<int64_t> ListWorkflowIds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Membership index
  // ---------------------------------------------------------------------

  virtual Result UpsertMappings(Transaction&, const std::vector<model::MappingRecord>&) = 0;

  virtual std::optional<int64_t> GetWorkflowIdForFirework(Transaction&, int64_t fw_id) = 0;

  virtual Result DeleteMapping(Transaction&, int64_t fw_id) = 0;

  // ---------------------------------------------------------------------
  // Launches
  // ---------------------------------------------------------------------

  virtual Result InsertLaunch(Transaction&, const model::LaunchRecord&) = 0;

  virtual Result UpdateLaunch(Transaction&, const model::LaunchRecord&) = 0;

  virtual std::optional<model::LaunchRecord> GetLaunch(Transaction&, int64_t launch_id) = 0;

  // Ascending launch_id.
  virtual std::vector<model::LaunchRecord> FindLaunchesByState(Transaction&, const std::string& state) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Wipes fireworks, workflows, mapping and launches. Counters are left
  // alone; pair with ResetCounters.
  virtual Result Clear(Transaction&) = 0;
};

} // namespace launchpad::db
