#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/ids/id_allocator.hpp"
#include "internal/workflow/workflow_store.hpp"
#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::workflow {

// Where a submitted graph goes when it is not a new workflow.
struct ExtensionTarget {
  int64_t                                wf_id = 0;
  launchpad::core::v1::ExtensionMode     mode  = launchpad::core::v1::EXTENSION_MODE_UNLINKED;
  // Required for ADDITION and DETOUR.
  int64_t                                anchor_fw_id = 0;
};

struct InsertResult {
  int64_t                    wf_id = 0;
  std::map<int64_t, int64_t> id_map; // provisional -> assigned
  std::vector<int64_t>       fw_ids; // assigned, ascending
  // Existing nodes whose parents changed (DETOUR rewiring).
  std::vector<int64_t>       relinked;
};

/*
  GraphWriter

  Validates a workflow spec, assigns permanent ids to its fireworks and
  writes the fireworks, membership rows and workflow payload inside the
  caller's transaction.

  Provisional ids are only meaningful within the spec. Permanent ids
  are allocated as one contiguous block in ascending provisional order.
*/
class GraphWriter {
 public:
  GraphWriter(std::shared_ptr<WorkflowStore> store, std::shared_ptr<ids::IdAllocator> ids);

  // Throws util::InvalidArgument for an empty graph, duplicate ids,
  // links to unknown ids or a cycle.
  InsertResult Insert(db::Transaction& tx, const launchpad::core::v1::WorkflowSpec& spec,
                      const std::optional<ExtensionTarget>& target = std::nullopt);

 private:
  std::shared_ptr<WorkflowStore>    store_;
  std::shared_ptr<ids::IdAllocator> ids_;
};

} // namespace launchpad::workflow
