#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace launchpad::db::sqlite {

namespace {

// BEGIN and COMMIT fail with BUSY/LOCKED when another connection holds
// the database lock; those surface as a retryable conflict.
void ExecControl(sqlite3* db, const char* sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string msg = std::string(sql) + " " + (err ? err : sqlite3_errmsg(db));
  sqlite3_free(err);

  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw util::TransactionConflict(msg);
  }
  throw std::runtime_error(msg);
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->LockWriter()) {
  ExecControl(db_->Handle(), "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      LAUNCHPAD_LOG_WARN("sqlite rollback failed", {launchpad::observability::StringField("error", e.what())});
    }
  }
}

// A failed COMMIT leaves the transaction open; the destructor rolls it back.
void SqliteTransaction::Commit() {
  ExecControl(db_->Handle(), "COMMIT;");
  committed_ = true;
  finished_  = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  writer_.unlock();
}

} // namespace launchpad::db::sqlite
