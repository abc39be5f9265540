#include "workflow_graph.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <string>

#include "internal/util/errors.hpp"

namespace launchpad::model {

namespace {
const std::vector<int64_t> kEmpty;
}

WorkflowGraph::WorkflowGraph(const LinksMap& links) {
  for (const auto& [parent, link] : links) {
    auto& children = children_[parent];
    parents_.try_emplace(parent);
    for (const auto child : link.children()) {
      children.push_back(child);
      children_.try_emplace(child);
      parents_[child].push_back(parent);
    }
  }
  // Map iteration order is unspecified.
  for (auto& [_, parents] : parents_) std::sort(parents.begin(), parents.end());
}

bool WorkflowGraph::Contains(int64_t id) const {
  return children_.contains(id);
}

std::vector<int64_t> WorkflowGraph::Nodes() const {
  std::vector<int64_t> out;
  out.reserve(children_.size());
  for (const auto& [id, _] : children_) out.push_back(id);
  return out;
}

const std::vector<int64_t>& WorkflowGraph::Children(int64_t id) const {
  auto it = children_.find(id);
  return it == children_.end() ? kEmpty : it->second;
}

const std::vector<int64_t>& WorkflowGraph::Parents(int64_t id) const {
  auto it = parents_.find(id);
  return it == parents_.end() ? kEmpty : it->second;
}

std::vector<int64_t> WorkflowGraph::Roots() const {
  std::vector<int64_t> out;
  for (const auto& [id, parents] : parents_) {
    if (parents.empty()) out.push_back(id);
  }
  return out;
}

std::vector<int64_t> WorkflowGraph::Leaves() const {
  std::vector<int64_t> out;
  for (const auto& [id, children] : children_) {
    if (children.empty()) out.push_back(id);
  }
  return out;
}

std::vector<int64_t> WorkflowGraph::Descendants(int64_t id) const {
  std::vector<int64_t> out;
  std::set<int64_t>    seen{id};
  std::deque<int64_t>  queue{id};

  while (!queue.empty()) {
    const auto current = queue.front();
    queue.pop_front();
    for (const auto child : Children(current)) {
      if (!seen.insert(child).second) continue;
      out.push_back(child);
      queue.push_back(child);
    }
  }
  return out;
}

void WorkflowGraph::RequireAcyclic() const {
  // Kahn's algorithm: anything left with incoming edges sits on a cycle.
  std::map<int64_t, std::size_t> in_degree;
  std::deque<int64_t>            queue;
  for (const auto& [id, parents] : parents_) {
    in_degree[id] = parents.size();
    if (parents.empty()) queue.push_back(id);
  }

  std::size_t visited = 0;
  while (!queue.empty()) {
    const auto current = queue.front();
    queue.pop_front();
    ++visited;
    for (const auto child : Children(current)) {
      if (--in_degree[child] == 0) queue.push_back(child);
    }
  }

  if (visited != in_degree.size()) {
    throw util::InvalidArgument("workflow links contain a cycle (" + std::to_string(in_degree.size() - visited) + " fireworks unreachable)");
  }
}

} // namespace launchpad::model
