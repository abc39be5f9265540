#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/launchpad.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/ids/id_allocator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "launchpad/v1.hpp"

namespace {

using launchpad::db::ErrorCode;
using launchpad::db::Repository;
using launchpad::db::Transaction;
using launchpad::db::memory::MemoryRepository;
using launchpad::db::model::FireworkRecord;
using launchpad::db::model::LaunchRecord;
using launchpad::db::model::MappingRecord;
using launchpad::db::model::WorkflowRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // Optimistic backends fail the later of two overlapping commits;
  // locking backends serialize whole transactions instead.
  bool optimistic = true;
};

void VerifyFireworkReadWrite(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertFirework(*tx, FireworkRecord{.fw_id = 3, .state = "READY", .data = R"({"name":"c"})"}));
    assert(repo.UpsertFireworks(*tx, {FireworkRecord{.fw_id = 1, .state = "READY", .data = "{}"},
                                      FireworkRecord{.fw_id = 2, .state = "WAITING", .data = "{}"},
                                      FireworkRecord{.fw_id = 4, .state = "READY", .data = "{}"}}));
    // Visible inside the writing transaction.
    assert(repo.GetFirework(*tx, 3).has_value());
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto fw = repo.GetFirework(*tx, 3);
  assert(fw.has_value());
  assert(fw->state == "READY");
  assert(fw->data == R"({"name":"c"})");
  assert(!repo.GetFirework(*tx, 99).has_value());

  assert((repo.FindFireworkIdsByState(*tx, "READY", 0) == std::vector<int64_t>{1, 3, 4}));
  assert((repo.FindFireworkIdsByState(*tx, "READY", 2) == std::vector<int64_t>{1, 3}));
  assert(repo.FindFireworkIdsByState(*tx, "FIZZLED", 0).empty());
  assert((repo.ListFireworkIds(*tx) == std::vector<int64_t>{1, 2, 3, 4}));

  assert(repo.UpsertFirework(*tx, FireworkRecord{.fw_id = 3, .state = "RUNNING", .data = "{}"}));
  assert((repo.FindFireworkIdsByState(*tx, "READY", 0) == std::vector<int64_t>{1, 4}));
  assert(repo.DeleteFirework(*tx, 4));
  assert(!repo.GetFirework(*tx, 4).has_value());
  tx->Commit();
}

void VerifyWorkflowAndMapping(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertWorkflow(*tx, WorkflowRecord{.wf_id = 7, .data = R"({"name":"wf"})"}));
  assert(repo.UpsertMappings(*tx, {MappingRecord{.fw_id = 1, .wf_id = 7}, MappingRecord{.fw_id = 2, .wf_id = 7}}));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.GetWorkflow(*tx, 7)->data == R"({"name":"wf"})");
  assert(repo.GetWorkflowIdForFirework(*tx, 2) == 7);
  assert(!repo.GetWorkflowIdForFirework(*tx, 3).has_value());
  assert((repo.ListWorkflowIds(*tx) == std::vector<int64_t>{7}));

  // Re-pointing a firework replaces its row.
  assert(repo.UpsertMappings(*tx, {MappingRecord{.fw_id = 2, .wf_id = 8}}));
  assert(repo.GetWorkflowIdForFirework(*tx, 2) == 8);
  assert(repo.DeleteMapping(*tx, 2));
  assert(!repo.GetWorkflowIdForFirework(*tx, 2).has_value());

  assert(repo.DeleteWorkflow(*tx, 7));
  assert(!repo.GetWorkflow(*tx, 7).has_value());
  tx->Commit();
}

void VerifyLaunches(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertLaunch(*tx, LaunchRecord{.launch_id = 2, .fw_id = 1, .state = "RUNNING", .data = "{}"}));
  assert(repo.InsertLaunch(*tx, LaunchRecord{.launch_id = 1, .fw_id = 3, .state = "RUNNING", .data = "{}"}));

  const auto duplicate = repo.InsertLaunch(*tx, LaunchRecord{.launch_id = 2, .fw_id = 1, .state = "RUNNING", .data = "{}"});
  assert(duplicate.code == ErrorCode::AlreadyExists);
  const auto missing = repo.UpdateLaunch(*tx, LaunchRecord{.launch_id = 9, .fw_id = 1, .state = "RUNNING", .data = "{}"});
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.UpdateLaunch(*tx, LaunchRecord{.launch_id = 2, .fw_id = 1, .state = "COMPLETED", .data = R"({"done":true})"}));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.GetLaunch(*tx, 2)->data == R"({"done":true})");
  const auto running = repo.FindLaunchesByState(*tx, "RUNNING");
  assert(running.size() == 1);
  assert(running[0].launch_id == 1);
  assert(running[0].fw_id == 3);
  tx->Commit();
}

void VerifyCounters(Repository& repo) {
  auto    tx    = repo.Begin();
  int64_t first = 0;
  assert(repo.NextId(*tx, "parity", 5, first));
  assert(first == 1);
  assert(repo.NextId(*tx, "parity", 1, first));
  assert(first == 6);
  assert(repo.NextId(*tx, "parity", 0, first).code == ErrorCode::InvalidArgument);
  tx->Commit();

  tx = repo.Begin();
  assert(repo.ResetCounters(*tx));
  assert(repo.NextId(*tx, "parity", 1, first));
  assert(first == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertFirework(*tx, FireworkRecord{.fw_id = 50, .state = "READY", .data = "{}"}));
    int64_t first = 0;
    assert(repo.NextId(*tx, "rollback", 10, first));
    tx->Rollback();
  }
  {
    // Dropped without commit.
    auto tx = repo.Begin();
    assert(repo.UpsertFirework(*tx, FireworkRecord{.fw_id = 51, .state = "READY", .data = "{}"}));
  }

  auto tx = repo.Begin();
  assert(!repo.GetFirework(*tx, 50).has_value());
  assert(!repo.GetFirework(*tx, 51).has_value());
  int64_t first = 0;
  assert(repo.NextId(*tx, "rollback", 1, first));
  assert(first == 1);
  tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, bool optimistic) {
  if (optimistic) {
    auto tx1 = repo.Begin();
    auto tx2 = repo.Begin();

    int64_t a = 0;
    int64_t b = 0;
    assert(repo.NextId(*tx1, "race", 1, a));
    assert(repo.NextId(*tx2, "race", 1, b));
    assert(a == b);

    tx1->Commit();
    bool threw = false;
    try {
      tx2->Commit();
    } catch (const launchpad::util::TransactionConflict&) {
      threw = true;
    }
    assert(threw);
    return;
  }

  // Locking backend: overlapping transactions from several threads run
  // one after another and every increment lands.
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&repo] {
      for (int i = 0; i < 25; ++i) {
        auto    tx    = repo.Begin();
        int64_t first = 0;
        assert(repo.NextId(*tx, "race", 1, first));
        tx->Commit();
      }
    });
  }
  for (auto& t : threads) t.join();

  auto    tx    = repo.Begin();
  int64_t first = 0;
  assert(repo.NextId(*tx, "race", 1, first));
  assert(first == 101);
  tx->Commit();
}

void VerifyClear(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.Clear(*tx));
  assert(repo.ListFireworkIds(*tx).empty());
  assert(repo.ListWorkflowIds(*tx).empty());
  assert(!repo.GetWorkflowIdForFirework(*tx, 1).has_value());
  assert(repo.FindLaunchesByState(*tx, "RUNNING").empty());

  // Counters survive a clear.
  int64_t first = 0;
  assert(repo.NextId(*tx, "parity", 1, first));
  assert(first == 2);
  tx->Commit();
}

// Same workflow driven through the facade on every backend.
void VerifyLaunchPadEndToEnd(const std::shared_ptr<Repository>& repo) {
  using namespace launchpad::v1;

  launchpad::core::LaunchPad lp(repo);
  lp.ResetStore(launchpad::util::TodayUtc());

  WorkflowSpec spec;
  spec.set_name("diamond");
  for (int i = 1; i <= 4; ++i) spec.add_fireworks()->set_fw_id(i);
  (*spec.mutable_links())[1].add_children(2);
  (*spec.mutable_links())[1].add_children(3);
  (*spec.mutable_links())[2].add_children(4);
  (*spec.mutable_links())[3].add_children(4);
  const auto submitted = lp.SubmitWorkflow(spec);

  const launchpad::checkout::WorkerInfo worker{"parity", "localhost", ""};
  int                                   launches = 0;
  while (auto claim = lp.Checkout(worker)) {
    lp.Complete(claim->launch.launch_id(), FWAction{});
    ++launches;
  }
  assert(launches == 4);

  const auto wf = lp.GetWorkflowByFireworkId(submitted.id_map.at(4));
  assert(wf.state() == FIREWORK_STATE_COMPLETED);
  assert(wf.fireworks_size() == 4);
  assert(lp.GetLaunch(4).fw_id() == submitted.id_map.at(4));
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    launchpad::core::LaunchPad lp(repo);
    launchpad::v1::WorkflowSpec spec;
    spec.set_name("durable");
    spec.add_fireworks()->set_fw_id(1);
    lp.SubmitWorkflow(spec);
  }

  backend.restart(repo);

  launchpad::core::LaunchPad lp(repo);
  const auto                 ids = lp.GetFireworkIds(launchpad::v1::FIREWORK_STATE_READY);
  assert(ids.size() == 1);
  const auto wf = lp.GetWorkflowByFireworkId(ids.front());
  assert(wf.name() == "durable");

  // Counters persisted as well.
  assert(lp.NextId(launchpad::ids::kFireworkCounter) == ids.front() + 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .optimistic       = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("launchpad_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<launchpad::db::sqlite::SqliteDB>(db_path);
    launchpad::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<launchpad::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
      .optimistic       = false,
  };
}

std::string TempDbPath(const std::string& tag) {
  return (std::filesystem::temp_directory_path() / ("launchpad_integration_" + tag + "_" + std::to_string(NowMs()) + ".db")).string();
}

void RemoveDbFiles(const std::string& path) {
  for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
    std::filesystem::remove(path + suffix);
  }
}

// Store failures on reads surface as errors, not as missing rows.
void VerifySqliteReadErrorsPropagate() {
  const auto path = TempDbPath("read_errors");
  auto       db   = std::make_shared<launchpad::db::sqlite::SqliteDB>(path);
  launchpad::db::sqlite::BootstrapSchema(*db);
  auto repo = std::make_shared<launchpad::db::sqlite::SqliteRepository>(db);

  {
    auto tx = repo->Begin();
    assert(repo->UpsertFirework(*tx, FireworkRecord{.fw_id = 1, .state = "READY", .data = "{}"}));
    assert(repo->UpsertMappings(*tx, {MappingRecord{.fw_id = 1, .wf_id = 1}}));
    tx->Commit();
  }
  db->Exec("DROP TABLE fireworks;");
  db->Exec("DROP TABLE workflows;");
  db->Exec("DROP TABLE mapping;");
  db->Exec("DROP TABLE launches;");

  auto read_fails = [&](const std::function<void(Transaction&)>& read) {
    auto tx = repo->Begin();
    try {
      read(*tx);
    } catch (const launchpad::util::NotFound&) {
      return false;
    } catch (const std::runtime_error&) {
      return true;
    }
    return false;
  };

  assert(read_fails([&](Transaction& tx) { (void)repo->GetFirework(tx, 1); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->FindFireworkIdsByState(tx, "READY", 1); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->ListFireworkIds(tx); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->GetWorkflow(tx, 1); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->ListWorkflowIds(tx); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->GetWorkflowIdForFirework(tx, 1); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->GetLaunch(tx, 1); }));
  assert(read_fails([&](Transaction& tx) { (void)repo->FindLaunchesByState(tx, "RUNNING"); }));

  // Checkout reports the failure instead of "nothing READY".
  launchpad::core::LaunchPad lp(repo);
  bool                       threw = false;
  try {
    (void)lp.Checkout({"worker", "host", ""});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  repo.reset();
  db.reset();
  RemoveDbFiles(path);
}

// Two connections on one file behave like two processes.
void VerifySqliteLockContentionIsConflict() {
  const auto                            path = TempDbPath("contention");
  launchpad::db::sqlite::SqliteOptions options{.busy_timeout_ms = 20, .wal_mode = false};

  auto db_a = std::make_shared<launchpad::db::sqlite::SqliteDB>(path, options);
  launchpad::db::sqlite::BootstrapSchema(*db_a);
  auto db_b = std::make_shared<launchpad::db::sqlite::SqliteDB>(path, options);

  launchpad::db::sqlite::SqliteRepository repo_a(db_a);
  launchpad::db::sqlite::SqliteRepository repo_b(db_b);

  {
    auto tx_a     = repo_a.Begin();
    bool conflict = false;
    try {
      auto tx_b = repo_b.Begin();
    } catch (const launchpad::util::TransactionConflict&) {
      conflict = true;
    }
    assert(conflict);
    tx_a->Commit();
  }

  // An open reader on the other connection blocks COMMIT.
  db_b->Exec("BEGIN; SELECT COUNT(*) FROM fireworks;");
  {
    auto tx = repo_a.Begin();
    assert(repo_a.UpsertFirework(*tx, FireworkRecord{.fw_id = 1, .state = "READY", .data = "{}"}));
    bool conflict = false;
    try {
      tx->Commit();
    } catch (const launchpad::util::TransactionConflict&) {
      conflict = true;
    }
    assert(conflict);
    assert(!tx->IsCommitted());
  }
  db_b->Exec("COMMIT;");

  {
    auto tx = repo_a.Begin();
    assert(!repo_a.GetFirework(*tx, 1).has_value());
    tx->Commit();
  }

  launchpad::db::RunInTransaction(repo_a, 0, "retry_after_conflict", [&](Transaction& tx) {
    assert(repo_a.UpsertFirework(tx, FireworkRecord{.fw_id = 1, .state = "READY", .data = "{}"}));
  });

  auto tx = repo_b.Begin();
  assert(repo_b.GetFirework(*tx, 1).has_value());
  tx->Commit();

  RemoveDbFiles(path);
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyFireworkReadWrite(*repo);
  VerifyWorkflowAndMapping(*repo);
  VerifyLaunches(*repo);
  VerifyCounters(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyConcurrentTransactions(*repo, backend.optimistic);
  VerifyClear(*repo);
  VerifyLaunchPadEndToEnd(repo);

  repo.reset();
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  VerifySqliteReadErrorsPropagate();
  VerifySqliteLockContentionIsConflict();

  std::cout << "launchpad_integration_repository_parity: pass\n";
  return 0;
}
