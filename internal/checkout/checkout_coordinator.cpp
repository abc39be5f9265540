#include "checkout_coordinator.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/model/spec_update.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/workflow_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace launchpad::checkout {

using namespace launchpad::core::v1;

namespace {

void RecordState(Launch& launch, FireworkState state, const google::protobuf::Timestamp& at) {
  launch.set_state(state);
  auto* entry = launch.add_state_history();
  entry->set_state(state);
  *entry->mutable_at() = at;
}

} // namespace

CheckoutCoordinator::CheckoutCoordinator(std::shared_ptr<workflow::WorkflowStore> store, std::shared_ptr<ids::IdAllocator> ids,
                                         std::shared_ptr<workflow::RefreshEngine> refresh, std::shared_ptr<workflow::GraphWriter> writer,
                                         CheckoutOptions options)
    : store_(std::move(store)), ids_(std::move(ids)), refresh_(std::move(refresh)), writer_(std::move(writer)), options_(std::move(options)) {
}

std::optional<Firework> CheckoutCoordinator::SelectCandidate(db::Transaction& tx) {
  if (!options_.comparator) {
    const auto ready = store_->FindFireworkIds(tx, FIREWORK_STATE_READY, 1);
    if (ready.empty()) return std::nullopt;
    return store_->GetFirework(tx, ready.front());
  }

  std::optional<Firework> best;
  for (const auto id : store_->FindFireworkIds(tx, FIREWORK_STATE_READY)) {
    auto candidate = store_->GetFirework(tx, id);
    if (!best || options_.comparator(candidate, *best)) {
      best = std::move(candidate);
    }
  }
  return best;
}

std::optional<Claim> CheckoutCoordinator::Checkout(const WorkerInfo& worker, std::optional<int64_t> fw_id) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx = store_->Repository().Begin();

      std::optional<Firework> candidate;
      if (fw_id) {
        candidate = store_->GetFirework(*tx, *fw_id);
        if (candidate->state() != FIREWORK_STATE_READY) {
          throw util::InvalidTransition("firework " + std::to_string(*fw_id) + " is " + model::ToString(candidate->state()) + ", not READY");
        }
      } else {
        candidate = SelectCandidate(*tx);
      }

      if (!candidate) {
        tx->Commit();
        return std::nullopt;
      }

      auto&      fw  = *candidate;
      const auto now = util::ToProto(util::Now());

      Launch launch;
      launch.set_launch_id(ids_->Next(*tx, ids::kLaunchCounter));
      launch.set_fw_id(fw.fw_id());
      launch.set_worker(worker.worker);
      launch.set_host(worker.host);
      launch.set_launch_dir(worker.launch_dir);
      *launch.mutable_created_on()  = now;
      *launch.mutable_last_pinged() = now;
      RecordState(launch, FIREWORK_STATE_RESERVED, now);
      RecordState(launch, FIREWORK_STATE_RUNNING, now);
      store_->InsertLaunch(*tx, launch);

      fw.set_state(FIREWORK_STATE_RUNNING);
      fw.add_launch_ids(launch.launch_id());
      *fw.mutable_updated_on() = now;
      store_->PutFirework(*tx, fw);

      refresh_->Refresh(*tx, fw.fw_id());
      tx->Commit();

      LAUNCHPAD_LOG_INFO("firework checked out", {observability::IntField("fw_id", fw.fw_id()), observability::IntField("launch_id", launch.launch_id()),
                                                  observability::StringField("worker", worker.worker)});
      return Claim{std::move(fw), std::move(launch)};
    } catch (const util::TransactionConflict&) {
      if (options_.max_claim_retries != 0 && attempt >= options_.max_claim_retries) {
        throw util::ConcurrentClaimLost("checkout lost " + std::to_string(attempt) + " consecutive claim races");
      }
      LAUNCHPAD_LOG_DEBUG("checkout claim raced, retrying", {observability::IntField("attempt", attempt)});
      std::this_thread::yield();
    }
  }
}

void CheckoutCoordinator::ApplyAction(db::Transaction& tx, Firework& fw, const FWAction& action, std::vector<int64_t>& refresh_seeds) {
  const auto wf_id = store_->GetWorkflowId(tx, fw.fw_id());
  const auto now   = util::ToProto(util::Now());

  for (const auto& detour : action.detours()) {
    const auto inserted = writer_->Insert(tx, detour.workflow(), workflow::ExtensionTarget{wf_id, detour.mode(), fw.fw_id()});
    refresh_seeds.insert(refresh_seeds.end(), inserted.fw_ids.begin(), inserted.fw_ids.end());
    refresh_seeds.insert(refresh_seeds.end(), inserted.relinked.begin(), inserted.relinked.end());
  }

  // Detours are in place, so children here include any new roots.
  const auto                 wf = store_->GetWorkflow(tx, wf_id);
  const model::WorkflowGraph graph(wf.links());

  const bool update_children = !action.child_update_spec().fields().empty();
  if (update_children || action.defuse_children()) {
    for (const auto child_id : graph.Children(fw.fw_id())) {
      auto child = store_->GetFirework(tx, child_id);
      if (update_children) {
        model::ApplyUpdateSpec(*child.mutable_spec(), action.child_update_spec());
      }
      if (action.defuse_children() && model::CanDefuse(child.state())) {
        child.set_state(FIREWORK_STATE_DEFUSED);
        refresh_seeds.push_back(child_id);
      }
      *child.mutable_updated_on() = now;
      store_->PutFirework(tx, child);
    }
  }

  if (action.defuse_workflow()) {
    for (const auto member_id : graph.Nodes()) {
      auto member = store_->GetFirework(tx, member_id);
      const auto state = member.state();
      if (!model::IsPending(state) && state != FIREWORK_STATE_PAUSED) continue;
      member.set_state(FIREWORK_STATE_DEFUSED);
      *member.mutable_updated_on() = now;
      store_->PutFirework(tx, member);
      refresh_seeds.push_back(member_id);
    }
  }
}

Firework CheckoutCoordinator::Complete(int64_t launch_id, const FWAction& action, FireworkState final_state) {
  if (final_state != FIREWORK_STATE_COMPLETED && final_state != FIREWORK_STATE_FIZZLED) {
    throw util::InvalidArgument("launch can only finish COMPLETED or FIZZLED, not " + model::ToString(final_state));
  }

  auto result = db::RunInTransaction(store_->Repository(), options_.max_claim_retries, "complete", [&](db::Transaction& tx) {
    auto launch = store_->GetLaunch(tx, launch_id);
    if (launch.state() != FIREWORK_STATE_RUNNING) {
      throw util::InvalidTransition("launch " + std::to_string(launch_id) + " is " + model::ToString(launch.state()) + ", not RUNNING");
    }

    auto fw = store_->GetFirework(tx, launch.fw_id());
    if (!model::IsActive(fw.state())) {
      throw util::InvalidTransition("firework " + std::to_string(fw.fw_id()) + " is " + model::ToString(fw.state()) + ", not running");
    }

    const auto now = util::ToProto(util::Now());
    RecordState(launch, final_state, now);
    *launch.mutable_completed_on() = now;
    *launch.mutable_action()       = action;
    store_->UpdateLaunch(tx, launch);

    model::ApplyUpdateSpec(*fw.mutable_spec(), action.update_spec());
    model::ApplyModSpecPush(*fw.mutable_spec(), action.mod_spec_push());
    fw.set_state(final_state);
    *fw.mutable_updated_on() = now;
    store_->PutFirework(tx, fw);

    std::vector<int64_t> seeds{fw.fw_id()};
    ApplyAction(tx, fw, action, seeds);
    refresh_->RefreshUntilStable(tx, seeds);

    return store_->GetFirework(tx, fw.fw_id());
  });

  LAUNCHPAD_LOG_INFO("launch completed", {observability::IntField("launch_id", launch_id), observability::IntField("fw_id", result.fw_id()),
                                          observability::StringField("state", model::ToString(final_state))});
  return result;
}

void CheckoutCoordinator::PingLaunch(int64_t launch_id) {
  db::RunInTransaction(store_->Repository(), options_.max_claim_retries, "ping", [&](db::Transaction& tx) {
    auto launch = store_->GetLaunch(tx, launch_id);
    if (launch.state() != FIREWORK_STATE_RUNNING) {
      throw util::InvalidTransition("launch " + std::to_string(launch_id) + " is " + model::ToString(launch.state()) + ", not RUNNING");
    }
    *launch.mutable_last_pinged() = util::ToProto(util::Now());
    store_->UpdateLaunch(tx, launch);
  });
}

std::vector<int64_t> CheckoutCoordinator::DetectLostRuns(std::optional<std::chrono::milliseconds> expiration) {
  const auto cutoff = util::Now() - expiration.value_or(options_.lost_run_expiration);

  auto lost = db::RunInTransaction(store_->Repository(), options_.max_claim_retries, "detect_lost_runs", [&](db::Transaction& tx) {
    std::vector<int64_t> launch_ids;
    std::vector<int64_t> seeds;
    const auto           now = util::ToProto(util::Now());

    for (auto& launch : store_->FindLaunches(tx, FIREWORK_STATE_RUNNING)) {
      if (util::FromProto(launch.last_pinged()) >= cutoff) continue;

      RecordState(launch, FIREWORK_STATE_FIZZLED, now);
      (*launch.mutable_action()->mutable_stored_data()->mutable_fields())["_lost_run"].set_bool_value(true);
      store_->UpdateLaunch(tx, launch);
      launch_ids.push_back(launch.launch_id());

      auto fw = store_->GetFirework(tx, launch.fw_id());
      const bool current_launch = fw.launch_ids_size() > 0 && fw.launch_ids(fw.launch_ids_size() - 1) == launch.launch_id();
      if (!model::IsActive(fw.state()) || !current_launch) continue;

      // Back to pending; the refresh recomputes READY from the parents.
      fw.set_state(FIREWORK_STATE_WAITING);
      *fw.mutable_updated_on() = now;
      store_->PutFirework(tx, fw);
      seeds.push_back(fw.fw_id());
    }

    refresh_->RefreshUntilStable(tx, seeds);
    return launch_ids;
  });

  for (const auto id : lost) {
    LAUNCHPAD_LOG_WARN("lost run detected", {observability::IntField("launch_id", id)});
  }
  return lost;
}

} // namespace launchpad::checkout
