#pragma once

#include <cstdint>

namespace launchpad::db::model {

/*
  Membership index row: which workflow owns a firework.
  Exactly one row per firework.
*/

struct MappingRecord {
  int64_t fw_id = 0;
  int64_t wf_id = 0;
};

} // namespace launchpad::db::model
