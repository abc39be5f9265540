#include "internal/model/workflow_graph.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using launchpad::model::WorkflowGraph;

WorkflowGraph::LinksMap Links(const std::vector<std::pair<int64_t, int64_t>>& edges, const std::vector<int64_t>& nodes) {
  WorkflowGraph::LinksMap links;
  for (const auto id : nodes) links[id];
  for (const auto& [parent, child] : edges) links[parent].add_children(child);
  return links;
}

void TestDiamondAdjacency() {
  const WorkflowGraph graph(Links({{1, 2}, {1, 3}, {2, 4}, {3, 4}}, {1, 2, 3, 4}));

  assert(graph.Nodes() == (std::vector<int64_t>{1, 2, 3, 4}));
  assert(graph.Roots() == std::vector<int64_t>{1});
  assert(graph.Leaves() == std::vector<int64_t>{4});
  assert(graph.Children(1) == (std::vector<int64_t>{2, 3}));
  assert(graph.Parents(4) == (std::vector<int64_t>{2, 3}));
  assert(graph.Parents(1).empty());
  assert(graph.Contains(3));
  assert(!graph.Contains(5));

  const auto descendants = graph.Descendants(1);
  assert(descendants.size() == 3);
  assert(descendants.back() == 4);
  assert(graph.Descendants(4).empty());

  graph.RequireAcyclic();
}

void TestChildOnlyNodesAreMembers() {
  // 3 never appears as a key.
  WorkflowGraph::LinksMap links;
  links[1].add_children(2);
  links[2].add_children(3);
  const WorkflowGraph graph(links);

  assert(graph.Contains(3));
  assert(graph.Leaves() == std::vector<int64_t>{3});
  assert(graph.Parents(3) == std::vector<int64_t>{2});
}

void TestCycleIsRejected() {
  const WorkflowGraph graph(Links({{1, 2}, {2, 3}, {3, 1}}, {1, 2, 3}));

  bool threw = false;
  try {
    graph.RequireAcyclic();
  } catch (const launchpad::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDisconnectedComponents() {
  const WorkflowGraph graph(Links({{1, 2}}, {1, 2, 7}));

  assert(graph.Roots() == (std::vector<int64_t>{1, 7}));
  assert(graph.Leaves() == (std::vector<int64_t>{2, 7}));
  assert(graph.Descendants(7).empty());
}

} // namespace

int main() {
  TestDiamondAdjacency();
  TestChildOnlyNodesAreMembers();
  TestCycleIsRejected();
  TestDisconnectedComponents();

  std::cout << "launchpad_unit_workflow_graph: pass\n";
  return 0;
}
