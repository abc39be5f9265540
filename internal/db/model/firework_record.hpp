#pragma once

#include <cstdint>
#include <string>

namespace launchpad::db::model {

/*
  Persistent firework row.

  Only the columns that are queried upon are pulled out; everything
  else lives in the JSON blob.
*/

struct FireworkRecord {
  int64_t fw_id = 0;

  // READY, WAITING, ... (indexed)
  std::string state;

  // opaque JSON (tasks, spec, launch ids, timestamps)
  std::string data;
};

} // namespace launchpad::db::model
