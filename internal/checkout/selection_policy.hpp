#pragma once

#include <functional>

#include "launchpad/core/v1/firework.pb.h"

namespace launchpad::checkout {

// True when a should be handed out before b.
using SelectionComparator = std::function<bool(const launchpad::core::v1::Firework& a, const launchpad::core::v1::Firework& b)>;

// Spec key holding a numeric priority; higher runs first.
inline constexpr char kPriorityKey[] = "_priority";

SelectionComparator LowestIdFirst();

// Higher "_priority" first, missing or non-numeric counts as 0; ties
// break on the lower fw_id.
SelectionComparator HighestPriorityFirst();

double PriorityOf(const launchpad::core::v1::Firework& firework);

} // namespace launchpad::checkout
