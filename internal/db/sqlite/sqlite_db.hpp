#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace launchpad::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms = 5000;
  bool wal_mode        = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of the process; the
  writer mutex keeps transactions from interleaving on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Held by a transaction for its whole lifetime.
  std::unique_lock<std::mutex> LockWriter() {
    return std::unique_lock<std::mutex>(writer_mutex_);
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    writer_mutex_;
};

} // namespace launchpad::db::sqlite
