#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <google/protobuf/map.h>

#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::model {

/*
  Adjacency view over a links map (parent -> children).

  Nodes are the keys of the map plus every referenced child. The view
  copies what it needs; the links map may be modified afterwards.
*/
class WorkflowGraph {
 public:
  using LinksMap = google::protobuf::Map<int64_t, launchpad::core::v1::Links>;

  explicit WorkflowGraph(const LinksMap& links);

  bool Contains(int64_t id) const;

  // Ascending ids.
  std::vector<int64_t> Nodes() const;

  const std::vector<int64_t>& Children(int64_t id) const;
  // Ascending ids.
  const std::vector<int64_t>& Parents(int64_t id) const;

  std::vector<int64_t> Roots() const;
  std::vector<int64_t> Leaves() const;

  // Transitive children in breadth-first order, without id itself.
  std::vector<int64_t> Descendants(int64_t id) const;

  // Throws util::InvalidArgument if the links contain a cycle.
  void RequireAcyclic() const;

 private:
  std::map<int64_t, std::vector<int64_t>> children_;
  std::map<int64_t, std::vector<int64_t>> parents_;
};

} // namespace launchpad::model
