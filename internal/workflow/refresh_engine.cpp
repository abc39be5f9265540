#include "refresh_engine.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace launchpad::workflow {

using namespace launchpad::core::v1;

FireworkState DeriveWorkflowState(const google::protobuf::Map<int64_t, FireworkState>& states) {
  if (states.empty()) return FIREWORK_STATE_WAITING;

  std::map<FireworkState, std::size_t> counts;
  for (const auto& [_, state] : states) {
    ++counts[state];
  }
  auto count = [&](FireworkState s) -> std::size_t {
    auto it = counts.find(s);
    return it == counts.end() ? 0 : it->second;
  };

  const auto total = states.size();
  if (count(FIREWORK_STATE_ARCHIVED) == total) return FIREWORK_STATE_ARCHIVED;
  if (count(FIREWORK_STATE_COMPLETED) == total) return FIREWORK_STATE_COMPLETED;
  if (count(FIREWORK_STATE_FIZZLED) > 0) return FIREWORK_STATE_FIZZLED;
  if (count(FIREWORK_STATE_DEFUSED) > 0) return FIREWORK_STATE_DEFUSED;
  if (count(FIREWORK_STATE_PAUSED) > 0) return FIREWORK_STATE_PAUSED;
  if (count(FIREWORK_STATE_RUNNING) > 0 || count(FIREWORK_STATE_RESERVED) > 0 || count(FIREWORK_STATE_COMPLETED) > 0) {
    return FIREWORK_STATE_RUNNING;
  }
  if (count(FIREWORK_STATE_READY) > 0) return FIREWORK_STATE_READY;
  return FIREWORK_STATE_WAITING;
}

FireworkState ReadinessFromParents(const model::WorkflowGraph& graph, const google::protobuf::Map<int64_t, FireworkState>& states, int64_t fw_id) {
  bool ready = true;
  for (const auto parent : graph.Parents(fw_id)) {
    auto it = states.find(parent);
    if (it == states.end()) {
      ready = false;
      continue;
    }
    if (it->second == FIREWORK_STATE_FIZZLED || it->second == FIREWORK_STATE_DEFUSED) return FIREWORK_STATE_DEFUSED;
    ready = ready && it->second == FIREWORK_STATE_COMPLETED;
  }
  return ready ? FIREWORK_STATE_READY : FIREWORK_STATE_WAITING;
}

RefreshEngine::RefreshEngine(std::shared_ptr<WorkflowStore> store) : store_(std::move(store)) {
}

std::vector<int64_t> RefreshEngine::Refresh(db::Transaction& tx, int64_t fw_id) {
  auto snapshot = store_->LoadSnapshot(tx, fw_id);
  auto& wf      = snapshot.workflow;

  const model::WorkflowGraph graph(wf.links());

  google::protobuf::Map<int64_t, FireworkState> states;
  for (const auto& [id, firework] : snapshot.fireworks) {
    states[id] = firework.state();
  }

  std::set<int64_t> changed;
  auto set_state = [&](int64_t id, FireworkState next) {
    if (states[id] == next) return;
    states[id] = next;
    changed.insert(id);
  };

  if (model::IsPending(states[fw_id])) {
    set_state(fw_id, ReadinessFromParents(graph, states, fw_id));
  }

  const auto current = states[fw_id];
  if (current == FIREWORK_STATE_COMPLETED) {
    for (const auto child : graph.Children(fw_id)) {
      if (model::IsPending(states[child])) {
        set_state(child, ReadinessFromParents(graph, states, child));
      }
    }
  } else if (current == FIREWORK_STATE_FIZZLED || current == FIREWORK_STATE_DEFUSED) {
    // Defuse pending descendants; a node in any other state stops the walk.
    std::deque<int64_t> queue(graph.Children(fw_id).begin(), graph.Children(fw_id).end());
    std::set<int64_t>   seen;
    while (!queue.empty()) {
      const auto id = queue.front();
      queue.pop_front();
      if (!seen.insert(id).second) continue;
      if (!model::IsPending(states[id])) continue;
      set_state(id, FIREWORK_STATE_DEFUSED);
      for (const auto child : graph.Children(id)) queue.push_back(child);
    }
  }

  const auto now = util::ToProto(util::Now());

  std::vector<Firework> updates;
  for (const auto id : changed) {
    auto& firework = snapshot.fireworks.at(id);
    firework.set_state(states[id]);
    *firework.mutable_updated_on() = now;
    updates.push_back(firework);
  }
  if (!updates.empty()) {
    store_->PutFireworks(tx, updates);
  }

  bool cache_dirty = wf.fw_states_size() != static_cast<int>(states.size());
  for (const auto& [id, state] : states) {
    auto it = wf.fw_states().find(id);
    if (it == wf.fw_states().end() || it->second != state) {
      cache_dirty = true;
      break;
    }
  }
  const auto derived = DeriveWorkflowState(states);
  if (derived != wf.state()) cache_dirty = true;

  if (cache_dirty) {
    *wf.mutable_fw_states() = states;
    wf.set_state(derived);
    *wf.mutable_updated_on() = now;
    store_->PutWorkflow(tx, wf);
  }

  if (!changed.empty()) {
    LAUNCHPAD_LOG_DEBUG("refresh changed fireworks",
                        {observability::IntField("fw_id", fw_id), observability::IntField("wf_id", wf.wf_id()),
                         observability::IntField("changed", static_cast<int64_t>(changed.size()))});
  }

  return {changed.begin(), changed.end()};
}

std::vector<int64_t> RefreshEngine::RefreshUntilStable(db::Transaction& tx, const std::vector<int64_t>& seeds) {
  std::vector<int64_t> all_changed;
  std::set<int64_t>    recorded;
  std::deque<int64_t>  queue(seeds.begin(), seeds.end());

  while (!queue.empty()) {
    const auto id = queue.front();
    queue.pop_front();
    for (const auto changed : Refresh(tx, id)) {
      if (recorded.insert(changed).second) all_changed.push_back(changed);
      queue.push_back(changed);
    }
  }
  return all_changed;
}

} // namespace launchpad::workflow
