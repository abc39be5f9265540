#include "state_machine.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace launchpad::model {

namespace {
constexpr std::string_view kPrefix = "FIREWORK_STATE_";
}

std::string ToString(FireworkState state) {
  const std::string name = launchpad::core::v1::FireworkState_Name(state);
  if (name.rfind(kPrefix, 0) == 0) {
    return name.substr(kPrefix.size());
  }
  return name;
}

FireworkState StateFromString(const std::string& name) {
  FireworkState state = launchpad::core::v1::FIREWORK_STATE_UNSPECIFIED;
  if (!launchpad::core::v1::FireworkState_Parse(std::string(kPrefix) + name, &state) || state == launchpad::core::v1::FIREWORK_STATE_UNSPECIFIED) {
    throw util::ConsistencyViolation("unknown firework state '" + name + "'");
  }
  return state;
}

} // namespace launchpad::model
