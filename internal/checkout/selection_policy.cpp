#include "selection_policy.hpp"

namespace launchpad::checkout {

using launchpad::core::v1::Firework;

double PriorityOf(const Firework& firework) {
  const auto& fields = firework.spec().fields();
  auto        it     = fields.find(kPriorityKey);
  if (it == fields.end() || !it->second.has_number_value()) return 0.0;
  return it->second.number_value();
}

SelectionComparator LowestIdFirst() {
  return [](const Firework& a, const Firework& b) { return a.fw_id() < b.fw_id(); };
}

SelectionComparator HighestPriorityFirst() {
  return [](const Firework& a, const Firework& b) {
    const auto pa = PriorityOf(a);
    const auto pb = PriorityOf(b);
    if (pa != pb) return pa > pb;
    return a.fw_id() < b.fw_id();
  };
}

} // namespace launchpad::checkout
