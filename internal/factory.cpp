#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/checkout/selection_policy.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace launchpad::factory {

using launchpad::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();

    db::sqlite::SqliteOptions options;
    if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
    options.wal_mode = sqlite.wal_mode();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);

    LAUNCHPAD_LOG_INFO("sqlite repository opened", {observability::StringField("path", sqlite.path()), observability::BoolField("wal", options.wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  LAUNCHPAD_LOG_INFO("memory repository in use; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::LaunchPadOptions BuildLaunchPadOptions(const RuntimeConfig& config) {
  core::LaunchPadOptions options;

  const auto& checkout = config.checkout();
  options.checkout.max_claim_retries = checkout.max_claim_retries();
  if (checkout.selection_policy() == launchpad::runtime::config::SELECTION_POLICY_PRIORITY) {
    options.checkout.comparator = checkout::HighestPriorityFirst();
  }

  if (config.maintenance().has_lost_run_expiration()) {
    const auto expiration = util::ToMillis(config.maintenance().lost_run_expiration());
    if (expiration.count() > 0) options.checkout.lost_run_expiration = expiration;
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  app.launchpad  = std::make_shared<core::LaunchPad>(app.repository, BuildLaunchPadOptions(config));

  service::ServiceContext ctx;
  ctx.launchpad = app.launchpad;
  app.service   = std::make_shared<service::LaunchPadService>(ctx);

  return app;
}

} // namespace launchpad::factory
