#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace launchpad::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS meta (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fireworks (fw_id INTEGER PRIMARY KEY, state TEXT NOT NULL, data TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS fireworks_state_idx ON fireworks(state, fw_id);",
      "CREATE TABLE IF NOT EXISTS workflows (wf_id INTEGER PRIMARY KEY, data TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS mapping (fw_id INTEGER PRIMARY KEY, wf_id INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS mapping_wf_idx ON mapping(wf_id);",
      "CREATE TABLE IF NOT EXISTS launches (launch_id INTEGER PRIMARY KEY, fw_id INTEGER NOT NULL, state TEXT NOT NULL, data TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS launches_state_idx ON launches(state, launch_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT name,value FROM meta LIMIT 1;");
  db.Exec("SELECT fw_id,state,data FROM fireworks LIMIT 1;");
  db.Exec("SELECT wf_id,data FROM workflows LIMIT 1;");
  db.Exec("SELECT fw_id,wf_id FROM mapping LIMIT 1;");
  db.Exec("SELECT launch_id,fw_id,state,data FROM launches LIMIT 1;");
}

} // namespace launchpad::db::sqlite
