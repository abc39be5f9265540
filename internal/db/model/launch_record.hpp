#pragma once

#include <cstdint>
#include <string>

namespace launchpad::db::model {

struct LaunchRecord {
  int64_t launch_id = 0;
  int64_t fw_id     = 0;

  // RUNNING, COMPLETED, FIZZLED (indexed, lost-run detection scans it)
  std::string state;

  // worker, host, launch dir, heartbeat, history, action
  std::string data;
};

} // namespace launchpad::db::model
