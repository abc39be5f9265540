#include "graph_writer.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "internal/model/workflow_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/refresh_engine.hpp"

namespace launchpad::workflow {

using namespace launchpad::core::v1;

namespace {

using LinksMap = google::protobuf::Map<int64_t, Links>;

// Every firework becomes a key; children deduplicated and sorted.
LinksMap NormalizeLinks(const WorkflowSpec& spec, const std::set<int64_t>& ids) {
  LinksMap links;
  for (const auto id : ids) {
    links[id];
  }

  for (const auto& [parent, link] : spec.links()) {
    if (!ids.contains(parent)) {
      throw util::InvalidArgument("link from unknown firework " + std::to_string(parent));
    }
    std::set<int64_t> children(links[parent].children().begin(), links[parent].children().end());
    for (const auto child : link.children()) {
      if (!ids.contains(child)) {
        throw util::InvalidArgument("link to unknown firework " + std::to_string(child));
      }
      if (child == parent) {
        throw util::InvalidArgument("firework " + std::to_string(parent) + " links to itself");
      }
      children.insert(child);
    }
    links[parent].clear_children();
    for (const auto child : children) links[parent].add_children(child);
  }
  return links;
}

void AddChild(Links& links, int64_t child) {
  if (std::find(links.children().begin(), links.children().end(), child) == links.children().end()) {
    links.add_children(child);
  }
}

} // namespace

GraphWriter::GraphWriter(std::shared_ptr<WorkflowStore> store, std::shared_ptr<ids::IdAllocator> ids)
    : store_(std::move(store)), ids_(std::move(ids)) {
}

InsertResult GraphWriter::Insert(db::Transaction& tx, const WorkflowSpec& spec, const std::optional<ExtensionTarget>& target) {
  if (spec.fireworks().empty()) {
    throw util::InvalidArgument("workflow must contain at least one firework");
  }

  std::set<int64_t> provisional;
  for (const auto& fw : spec.fireworks()) {
    if (!provisional.insert(fw.fw_id()).second) {
      throw util::InvalidArgument("duplicate firework id " + std::to_string(fw.fw_id()) + " in workflow");
    }
  }

  const auto spec_links = NormalizeLinks(spec, provisional);
  const model::WorkflowGraph spec_graph(spec_links);
  spec_graph.RequireAcyclic();

  const bool linked = target && target->mode != EXTENSION_MODE_UNLINKED;

  // Ascending provisional order, one contiguous block.
  InsertResult result;
  const auto first = ids_->Next(tx, ids::kFireworkCounter, static_cast<int64_t>(provisional.size()));
  {
    int64_t next = first;
    for (const auto id : provisional) {
      result.id_map[id] = next;
      result.fw_ids.push_back(next);
      ++next;
    }
  }

  const auto now = util::ToProto(util::Now());

  std::vector<Firework> fireworks;
  fireworks.reserve(spec.fireworks_size());
  for (const auto& source : spec.fireworks()) {
    Firework fw = source;
    fw.set_fw_id(result.id_map.at(source.fw_id()));
    fw.clear_launch_ids();

    const bool root = spec_graph.Parents(source.fw_id()).empty();
    fw.set_state(root && !linked ? FIREWORK_STATE_READY : FIREWORK_STATE_WAITING);

    *fw.mutable_created_on() = now;
    *fw.mutable_updated_on() = now;
    fireworks.push_back(std::move(fw));
  }
  std::sort(fireworks.begin(), fireworks.end(), [](const Firework& a, const Firework& b) { return a.fw_id() < b.fw_id(); });

  Workflow wf;
  if (!target) {
    wf.set_wf_id(ids_->Next(tx, ids::kWorkflowCounter));
    wf.set_name(spec.name());
    *wf.mutable_metadata() = spec.metadata();
    *wf.mutable_created_on() = now;
  } else {
    wf = store_->GetWorkflow(tx, target->wf_id);
    if (linked && !wf.links().contains(target->anchor_fw_id)) {
      throw util::InvalidArgument("firework " + std::to_string(target->anchor_fw_id) + " is not a member of workflow " +
                                  std::to_string(target->wf_id));
    }
  }
  result.wf_id = wf.wf_id();

  auto& links = *wf.mutable_links();
  for (const auto& [parent, link] : spec_links) {
    auto& dst = links[result.id_map.at(parent)];
    for (const auto child : link.children()) {
      dst.add_children(result.id_map.at(child));
    }
  }

  if (linked) {
    std::vector<int64_t> new_roots;
    std::vector<int64_t> new_leaves;
    for (const auto id : spec_graph.Roots()) new_roots.push_back(result.id_map.at(id));
    for (const auto id : spec_graph.Leaves()) new_leaves.push_back(result.id_map.at(id));

    auto& anchor = links[target->anchor_fw_id];
    if (target->mode == EXTENSION_MODE_DETOUR) {
      // The anchor's former children now wait on the detour's leaves.
      std::vector<int64_t> former(anchor.children().begin(), anchor.children().end());
      anchor.clear_children();
      for (const auto leaf : new_leaves) {
        for (const auto child : former) AddChild(links[leaf], child);
      }
      result.relinked = former;
    }
    for (const auto root : new_roots) AddChild(anchor, root);
  }

  for (const auto& fw : fireworks) {
    (*wf.mutable_fw_states())[fw.fw_id()] = fw.state();
  }
  wf.set_state(DeriveWorkflowState(wf.fw_states()));
  *wf.mutable_updated_on() = now;

  store_->PutFireworks(tx, fireworks);
  store_->PutMemberships(tx, wf.wf_id(), result.fw_ids);
  store_->PutWorkflow(tx, wf);

  LAUNCHPAD_LOG_INFO(target ? "workflow extended" : "workflow created",
                     {observability::IntField("wf_id", wf.wf_id()), observability::IntField("first_fw_id", first),
                      observability::IntField("fireworks", static_cast<int64_t>(fireworks.size()))});
  return result;
}

} // namespace launchpad::workflow
