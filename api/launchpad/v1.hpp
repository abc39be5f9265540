#pragma once

#include "launchpad/core/v1/state.pb.h"
#include "launchpad/core/v1/firework.pb.h"

#include "launchpad/services/v1/launchpad_service.pb.h"

namespace launchpad::v1 {
using namespace ::launchpad::core::v1;
using namespace ::launchpad::services::v1;
}
