#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkout/checkout_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ids/id_allocator.hpp"
#include "internal/workflow/graph_writer.hpp"
#include "internal/workflow/refresh_engine.hpp"
#include "internal/workflow/workflow_store.hpp"
#include "launchpad/v1.hpp"

namespace launchpad::core {

struct LaunchPadOptions {
  checkout::CheckoutOptions checkout;

  // Attempts for every other read-modify-write operation; 0 retries
  // until the transaction commits.
  uint32_t max_transaction_attempts = 0;

  // When false ResetStore accepts any password.
  bool require_reset_password = true;
};

struct SubmitResult {
  int64_t                    wf_id = 0;
  std::map<int64_t, int64_t> id_map;
};

/*
  LaunchPad

  Single entry point for workflow submission, inspection, state changes
  and worker checkout. Every operation runs in one repository
  transaction; no state is cached between calls, so several LaunchPad
  instances may share a repository.

  Errors are reported as util:: exceptions.
*/
class LaunchPad {
 public:
  explicit LaunchPad(std::shared_ptr<db::Repository> repository, LaunchPadOptions options = {});

  SubmitResult SubmitWorkflow(const launchpad::core::v1::WorkflowSpec& spec);

  launchpad::core::v1::Firework GetFirework(int64_t fw_id);

  // With its fireworks hydrated, ascending fw_id.
  launchpad::core::v1::Workflow GetWorkflowByFireworkId(int64_t fw_id);

  launchpad::core::v1::Launch GetLaunch(int64_t launch_id);

  // Ascending. nullopt = every firework.
  std::vector<int64_t> GetFireworkIds(std::optional<launchpad::core::v1::FireworkState> state = std::nullopt);
  std::vector<int64_t> GetWorkflowIds();

  std::optional<checkout::Claim> Checkout(const checkout::WorkerInfo& worker, std::optional<int64_t> fw_id = std::nullopt);

  launchpad::core::v1::Firework Complete(int64_t launch_id, const launchpad::core::v1::FWAction& action,
                                         launchpad::core::v1::FireworkState final_state = launchpad::core::v1::FIREWORK_STATE_COMPLETED);

  void                 PingLaunch(int64_t launch_id);
  std::vector<int64_t> DetectLostRuns(std::optional<std::chrono::milliseconds> expiration = std::nullopt);

  launchpad::core::v1::Firework PauseFirework(int64_t fw_id);
  launchpad::core::v1::Firework ResumeFirework(int64_t fw_id);
  launchpad::core::v1::Firework DefuseFirework(int64_t fw_id);
  launchpad::core::v1::Firework ReigniteFirework(int64_t fw_id);
  launchpad::core::v1::Firework RerunFirework(int64_t fw_id);

  // Addressed by any member firework.
  launchpad::core::v1::Workflow PauseWorkflow(int64_t fw_id);
  launchpad::core::v1::Workflow DefuseWorkflow(int64_t fw_id);
  launchpad::core::v1::Workflow ReigniteWorkflow(int64_t fw_id);
  launchpad::core::v1::Workflow ArchiveWorkflow(int64_t fw_id);

  // Standalone id reservation.
  int64_t NextId(const std::string& counter, int64_t quantity = 1);

  // Deletes every entity and rewinds all counters. The password is
  // today's UTC date (YYYY-MM-DD) unless the check is disabled.
  void ResetStore(const std::string& password);

 private:
  launchpad::core::v1::Workflow HydrateWorkflow(db::Transaction& tx, int64_t fw_id);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<workflow::WorkflowStore>       store_;
  std::shared_ptr<ids::IdAllocator>              ids_;
  std::shared_ptr<workflow::RefreshEngine>       refresh_;
  std::shared_ptr<workflow::GraphWriter>         writer_;
  std::shared_ptr<checkout::CheckoutCoordinator> coordinator_;
  LaunchPadOptions                               options_;
};

} // namespace launchpad::core
