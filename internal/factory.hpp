#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/launchpad.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/launchpad_service.hpp"

namespace launchpad::factory {

/*
  Application

  Owns the long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<core::LaunchPad>           launchpad;
  std::shared_ptr<service::LaunchPadService> service;
};

// SQLite when configured (schema bootstrapped on open), memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const launchpad::runtime::config::RuntimeConfig& config);

core::LaunchPadOptions BuildLaunchPadOptions(const launchpad::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application. It is the ONLY place allowed to
  know concrete DB types.
*/
Application Build(const launchpad::runtime::config::RuntimeConfig& config);

} // namespace launchpad::factory
