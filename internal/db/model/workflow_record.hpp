#pragma once

#include <cstdint>
#include <string>

namespace launchpad::db::model {

/*
  Persistent workflow row.

  The payload is always rewritten wholesale; there is no partial
  workflow update.
*/

struct WorkflowRecord {
  int64_t wf_id = 0;

  // links, name, metadata, timestamps, cached member states
  std::string data;
};

} // namespace launchpad::db::model
