#pragma once

#include <string>

#include "launchpad/core/v1/state.pb.h"

namespace launchpad::model {

using launchpad::core::v1::FireworkState;

constexpr bool IsTerminal(FireworkState state) {
  return state == launchpad::core::v1::FIREWORK_STATE_COMPLETED || state == launchpad::core::v1::FIREWORK_STATE_FIZZLED ||
         state == launchpad::core::v1::FIREWORK_STATE_ARCHIVED;
}

// Claimed by a worker.
constexpr bool IsActive(FireworkState state) {
  return state == launchpad::core::v1::FIREWORK_STATE_RESERVED || state == launchpad::core::v1::FIREWORK_STATE_RUNNING;
}

// Readiness is still derived from the parents.
constexpr bool IsPending(FireworkState state) {
  return state == launchpad::core::v1::FIREWORK_STATE_WAITING || state == launchpad::core::v1::FIREWORK_STATE_READY;
}

constexpr bool CanPause(FireworkState from) {
  return IsPending(from) || from == launchpad::core::v1::FIREWORK_STATE_RESERVED;
}

constexpr bool CanDefuse(FireworkState from) {
  return CanPause(from) || from == launchpad::core::v1::FIREWORK_STATE_PAUSED;
}

constexpr bool CanRerun(FireworkState from) {
  return from == launchpad::core::v1::FIREWORK_STATE_COMPLETED || from == launchpad::core::v1::FIREWORK_STATE_FIZZLED ||
         from == launchpad::core::v1::FIREWORK_STATE_DEFUSED;
}

// "READY", "WAITING", ... as stored in the indexed state column.
std::string ToString(FireworkState state);

// Throws util::ConsistencyViolation for unknown names.
FireworkState StateFromString(const std::string& name);

} // namespace launchpad::model
