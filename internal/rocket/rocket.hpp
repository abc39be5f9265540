#pragma once

#include <cstdint>
#include <optional>

#include "internal/checkout/checkout_coordinator.hpp"
#include "internal/core/launchpad.hpp"
#include "internal/tasks/task_registry.hpp"

namespace launchpad::rocket {

/*
  Runs one firework in the calling thread: checkout, every task in
  order against a working spec, then Complete with the merged action.

  A task that throws fizzles the launch with the error message stored
  under stored_data._exception. Store errors propagate.

  Returns false when nothing was READY.
*/
bool LaunchRocket(core::LaunchPad& launchpad, const tasks::TaskRegistry& registry, const checkout::WorkerInfo& worker,
                  std::optional<int64_t> fw_id = std::nullopt);

// Launches until nothing is READY or max_launches rockets ran (0 = no
// limit). Returns the number of launches.
uint64_t RapidFire(core::LaunchPad& launchpad, const tasks::TaskRegistry& registry, const checkout::WorkerInfo& worker, uint64_t max_launches = 0);

} // namespace launchpad::rocket
