#pragma once

#include <memory>

namespace launchpad::core {
class LaunchPad;
}

namespace launchpad::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<launchpad::core::LaunchPad> launchpad;
};

} // namespace launchpad::service
