#include "launchpad.hpp"

#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/workflow_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace launchpad::core {

using namespace launchpad::core::v1;

namespace {

std::string Describe(const Firework& fw, const char* verb) {
  return "firework " + std::to_string(fw.fw_id()) + " in state " + model::ToString(fw.state()) + " cannot be " + verb;
}

void SetState(Firework& fw, FireworkState state) {
  fw.set_state(state);
  *fw.mutable_updated_on() = util::ToProto(util::Now());
}

} // namespace

LaunchPad::LaunchPad(std::shared_ptr<db::Repository> repository, LaunchPadOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  store_       = std::make_shared<workflow::WorkflowStore>(repository_);
  ids_         = std::make_shared<ids::IdAllocator>(repository_);
  refresh_     = std::make_shared<workflow::RefreshEngine>(store_);
  writer_      = std::make_shared<workflow::GraphWriter>(store_, ids_);
  coordinator_ = std::make_shared<checkout::CheckoutCoordinator>(store_, ids_, refresh_, writer_, options_.checkout);
}

// ---------------------------------------------------------------------
// Submission and queries
// ---------------------------------------------------------------------

SubmitResult LaunchPad::SubmitWorkflow(const WorkflowSpec& spec) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "submit_workflow", [&](db::Transaction& tx) {
    auto inserted = writer_->Insert(tx, spec);
    return SubmitResult{inserted.wf_id, std::move(inserted.id_map)};
  });
}

Firework LaunchPad::GetFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, 1, "get_firework", [&](db::Transaction& tx) { return store_->GetFirework(tx, fw_id); });
}

Workflow LaunchPad::HydrateWorkflow(db::Transaction& tx, int64_t fw_id) {
  auto snapshot = store_->LoadSnapshot(tx, fw_id);
  auto wf       = std::move(snapshot.workflow);
  for (auto& [_, fw] : snapshot.fireworks) {
    *wf.add_fireworks() = std::move(fw);
  }
  return wf;
}

Workflow LaunchPad::GetWorkflowByFireworkId(int64_t fw_id) {
  return db::RunInTransaction(*repository_, 1, "get_workflow", [&](db::Transaction& tx) { return HydrateWorkflow(tx, fw_id); });
}

Launch LaunchPad::GetLaunch(int64_t launch_id) {
  return db::RunInTransaction(*repository_, 1, "get_launch", [&](db::Transaction& tx) { return store_->GetLaunch(tx, launch_id); });
}

std::vector<int64_t> LaunchPad::GetFireworkIds(std::optional<FireworkState> state) {
  return db::RunInTransaction(*repository_, 1, "list_fireworks", [&](db::Transaction& tx) {
    if (state) return store_->FindFireworkIds(tx, *state);
    return repository_->ListFireworkIds(tx);
  });
}

std::vector<int64_t> LaunchPad::GetWorkflowIds() {
  return db::RunInTransaction(*repository_, 1, "list_workflows", [&](db::Transaction& tx) { return repository_->ListWorkflowIds(tx); });
}

// ---------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------

std::optional<checkout::Claim> LaunchPad::Checkout(const checkout::WorkerInfo& worker, std::optional<int64_t> fw_id) {
  return coordinator_->Checkout(worker, fw_id);
}

Firework LaunchPad::Complete(int64_t launch_id, const FWAction& action, FireworkState final_state) {
  return coordinator_->Complete(launch_id, action, final_state);
}

void LaunchPad::PingLaunch(int64_t launch_id) {
  coordinator_->PingLaunch(launch_id);
}

std::vector<int64_t> LaunchPad::DetectLostRuns(std::optional<std::chrono::milliseconds> expiration) {
  return coordinator_->DetectLostRuns(expiration);
}

// ---------------------------------------------------------------------
// Firework state changes
// ---------------------------------------------------------------------

Firework LaunchPad::PauseFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "pause_firework", [&](db::Transaction& tx) {
    auto fw = store_->GetFirework(tx, fw_id);
    if (!model::CanPause(fw.state())) throw util::InvalidTransition(Describe(fw, "paused"));
    SetState(fw, FIREWORK_STATE_PAUSED);
    store_->PutFirework(tx, fw);
    refresh_->RefreshUntilStable(tx, fw_id);
    return store_->GetFirework(tx, fw_id);
  });
}

Firework LaunchPad::ResumeFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "resume_firework", [&](db::Transaction& tx) {
    auto fw = store_->GetFirework(tx, fw_id);
    if (fw.state() != FIREWORK_STATE_PAUSED) throw util::InvalidTransition(Describe(fw, "resumed"));
    SetState(fw, FIREWORK_STATE_WAITING);
    store_->PutFirework(tx, fw);
    refresh_->RefreshUntilStable(tx, fw_id);
    return store_->GetFirework(tx, fw_id);
  });
}

Firework LaunchPad::DefuseFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "defuse_firework", [&](db::Transaction& tx) {
    auto fw = store_->GetFirework(tx, fw_id);
    if (!model::CanDefuse(fw.state())) throw util::InvalidTransition(Describe(fw, "defused"));
    SetState(fw, FIREWORK_STATE_DEFUSED);
    store_->PutFirework(tx, fw);
    refresh_->RefreshUntilStable(tx, fw_id);
    return store_->GetFirework(tx, fw_id);
  });
}

Firework LaunchPad::ReigniteFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "reignite_firework", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    auto& fw      = snapshot.fireworks.at(fw_id);
    if (fw.state() != FIREWORK_STATE_DEFUSED) throw util::InvalidTransition(Describe(fw, "reignited"));

    const model::WorkflowGraph graph(snapshot.workflow.links());
    std::vector<int64_t>       seeds{fw_id};
    SetState(fw, FIREWORK_STATE_WAITING);
    store_->PutFirework(tx, fw);

    // A defused descendant comes back only once none of its parents is
    // still defused or fizzled.
    const auto descendants = graph.Descendants(fw_id);
    for (bool progress = true; progress;) {
      progress = false;
      for (const auto id : descendants) {
        auto& node = snapshot.fireworks.at(id);
        if (node.state() != FIREWORK_STATE_DEFUSED) continue;

        bool blocked = false;
        for (const auto parent : graph.Parents(id)) {
          const auto ps = snapshot.fireworks.at(parent).state();
          blocked       = blocked || ps == FIREWORK_STATE_DEFUSED || ps == FIREWORK_STATE_FIZZLED;
        }
        if (blocked) continue;

        SetState(node, FIREWORK_STATE_WAITING);
        store_->PutFirework(tx, node);
        seeds.push_back(id);
        progress = true;
      }
    }

    refresh_->RefreshUntilStable(tx, seeds);
    return store_->GetFirework(tx, fw_id);
  });
}

Firework LaunchPad::RerunFirework(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "rerun_firework", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    auto& fw      = snapshot.fireworks.at(fw_id);
    if (!model::CanRerun(fw.state())) throw util::InvalidTransition(Describe(fw, "rerun"));

    const model::WorkflowGraph graph(snapshot.workflow.links());
    const auto                 descendants = graph.Descendants(fw_id);
    for (const auto id : descendants) {
      const auto& node = snapshot.fireworks.at(id);
      if (model::IsActive(node.state())) {
        throw util::InvalidTransition("firework " + std::to_string(fw_id) + " cannot be rerun while descendant " + std::to_string(id) + " is " +
                                      model::ToString(node.state()));
      }
    }

    std::vector<int64_t> seeds{fw_id};
    SetState(fw, FIREWORK_STATE_WAITING);
    store_->PutFirework(tx, fw);

    for (const auto id : descendants) {
      auto&      node  = snapshot.fireworks.at(id);
      const auto state = node.state();
      if (state == FIREWORK_STATE_PAUSED || state == FIREWORK_STATE_ARCHIVED || state == FIREWORK_STATE_WAITING) continue;
      SetState(node, FIREWORK_STATE_WAITING);
      store_->PutFirework(tx, node);
      seeds.push_back(id);
    }

    refresh_->RefreshUntilStable(tx, seeds);
    LAUNCHPAD_LOG_INFO("firework rerun", {observability::IntField("fw_id", fw_id), observability::IntField("reset", static_cast<int64_t>(seeds.size()))});
    return store_->GetFirework(tx, fw_id);
  });
}

// ---------------------------------------------------------------------
// Workflow state changes
// ---------------------------------------------------------------------

namespace {

// Moves every member accepted by pick to next; returns the moved ids.
template <typename Pick>
std::vector<int64_t> MoveMembers(workflow::WorkflowStore& store, db::Transaction& tx, workflow::WorkflowSnapshot& snapshot, Pick pick,
                                 FireworkState next) {
  std::vector<int64_t> moved;
  for (auto& [id, fw] : snapshot.fireworks) {
    if (!pick(fw.state())) continue;
    SetState(fw, next);
    store.PutFirework(tx, fw);
    moved.push_back(id);
  }
  return moved;
}

} // namespace

Workflow LaunchPad::PauseWorkflow(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "pause_workflow", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    auto moved    = MoveMembers(*store_, tx, snapshot, [](FireworkState s) { return model::CanPause(s); }, FIREWORK_STATE_PAUSED);
    moved.push_back(fw_id);
    refresh_->RefreshUntilStable(tx, moved);
    return HydrateWorkflow(tx, fw_id);
  });
}

Workflow LaunchPad::DefuseWorkflow(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "defuse_workflow", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    auto moved    = MoveMembers(*store_, tx, snapshot, [](FireworkState s) { return model::CanDefuse(s); }, FIREWORK_STATE_DEFUSED);
    moved.push_back(fw_id);
    refresh_->RefreshUntilStable(tx, moved);
    return HydrateWorkflow(tx, fw_id);
  });
}

Workflow LaunchPad::ReigniteWorkflow(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "reignite_workflow", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    auto moved    = MoveMembers(*store_, tx, snapshot, [](FireworkState s) { return s == FIREWORK_STATE_DEFUSED; }, FIREWORK_STATE_WAITING);
    moved.push_back(fw_id);
    refresh_->RefreshUntilStable(tx, moved);
    return HydrateWorkflow(tx, fw_id);
  });
}

Workflow LaunchPad::ArchiveWorkflow(int64_t fw_id) {
  return db::RunInTransaction(*repository_, options_.max_transaction_attempts, "archive_workflow", [&](db::Transaction& tx) {
    auto snapshot = store_->LoadSnapshot(tx, fw_id);
    for (const auto& [id, fw] : snapshot.fireworks) {
      if (model::IsActive(fw.state())) {
        throw util::InvalidTransition("workflow " + std::to_string(snapshot.workflow.wf_id()) + " cannot be archived while firework " +
                                      std::to_string(id) + " is " + model::ToString(fw.state()));
      }
    }
    auto moved = MoveMembers(*store_, tx, snapshot, [](FireworkState s) { return s != FIREWORK_STATE_ARCHIVED; }, FIREWORK_STATE_ARCHIVED);
    moved.push_back(fw_id);
    refresh_->RefreshUntilStable(tx, moved);
    LAUNCHPAD_LOG_INFO("workflow archived", {observability::IntField("wf_id", snapshot.workflow.wf_id())});
    return HydrateWorkflow(tx, fw_id);
  });
}

// ---------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------

int64_t LaunchPad::NextId(const std::string& counter, int64_t quantity) {
  return ids_->Next(counter, quantity);
}

void LaunchPad::ResetStore(const std::string& password) {
  if (options_.require_reset_password && password != util::TodayUtc()) {
    throw util::InvalidArgument("reset password rejected; expected today's date (YYYY-MM-DD, UTC)");
  }

  db::RunInTransaction(*repository_, options_.max_transaction_attempts, "reset", [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->Clear(tx), "clear store");
    ids_->Reset(tx);
  });
  LAUNCHPAD_LOG_WARN("store reset");
}

} // namespace launchpad::core
