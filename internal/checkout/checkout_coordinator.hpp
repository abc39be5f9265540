#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkout/selection_policy.hpp"
#include "internal/ids/id_allocator.hpp"
#include "internal/workflow/graph_writer.hpp"
#include "internal/workflow/refresh_engine.hpp"
#include "internal/workflow/workflow_store.hpp"
#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::checkout {

struct CheckoutOptions {
  // Attempts per claim or completion before giving up with
  // util::ConcurrentClaimLost (util::TransactionConflict for completion).
  // 0 retries until the transaction commits.
  uint32_t max_claim_retries = 0;

  // Empty = lowest fw_id first.
  SelectionComparator comparator;

  std::chrono::milliseconds lost_run_expiration = std::chrono::hours(4);
};

struct WorkerInfo {
  std::string worker;
  std::string host;
  std::string launch_dir;
};

struct Claim {
  launchpad::core::v1::Firework firework;
  launchpad::core::v1::Launch   launch;
};

/*
  CheckoutCoordinator

  Hands READY fireworks to workers and records their outcome.

  CRITICAL GUARANTEES:

  - A READY firework is claimed by at most one caller. Claim, launch
    creation and the READY -> RUNNING transition commit in one
    transaction; a caller that loses the race retries with a fresh view.
  - Completion, the action's effects and the resulting refresh commit
    together or not at all.
*/
class CheckoutCoordinator {
 public:
  CheckoutCoordinator(std::shared_ptr<workflow::WorkflowStore> store, std::shared_ptr<ids::IdAllocator> ids,
                      std::shared_ptr<workflow::RefreshEngine> refresh, std::shared_ptr<workflow::GraphWriter> writer,
                      CheckoutOptions options = {});

  // Claims the best READY firework, or the given one. Returns nullopt
  // when nothing is READY. A targeted firework that is not READY throws
  // util::InvalidTransition.
  std::optional<Claim> Checkout(const WorkerInfo& worker, std::optional<int64_t> fw_id = std::nullopt);

  // Records the outcome of a RUNNING launch and applies its action.
  // final_state must be COMPLETED or FIZZLED.
  launchpad::core::v1::Firework Complete(int64_t launch_id, const launchpad::core::v1::FWAction& action,
                                         launchpad::core::v1::FireworkState final_state);

  void PingLaunch(int64_t launch_id);

  // Fizzles RUNNING launches not pinged within expiration and returns
  // their fireworks to READY. Returns the affected launch ids.
  std::vector<int64_t> DetectLostRuns(std::optional<std::chrono::milliseconds> expiration = std::nullopt);

  const CheckoutOptions& Options() const {
    return options_;
  }

 private:
  std::optional<launchpad::core::v1::Firework> SelectCandidate(db::Transaction& tx);

  void ApplyAction(db::Transaction& tx, launchpad::core::v1::Firework& fw, const launchpad::core::v1::FWAction& action,
                   std::vector<int64_t>& refresh_seeds);

  std::shared_ptr<workflow::WorkflowStore> store_;
  std::shared_ptr<ids::IdAllocator>        ids_;
  std::shared_ptr<workflow::RefreshEngine> refresh_;
  std::shared_ptr<workflow::GraphWriter>   writer_;
  CheckoutOptions                          options_;
};

} // namespace launchpad::checkout
