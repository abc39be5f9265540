#pragma once

#include "sqlite_db.hpp"

namespace launchpad::db::sqlite {

/*
  Creates the launchpad tables if they are missing.

    meta       counter name -> next value
    fireworks  fw_id, state, data
    workflows  wf_id, data
    mapping    fw_id -> wf_id
    launches   launch_id, fw_id, state, data
*/
void BootstrapSchema(SqliteDB& db);

} // namespace launchpad::db::sqlite
