#include "sqlite_repository.hpp"

#include <limits>

#include <sqlite3.h>

#include "internal/db/api/errors.hpp"

namespace launchpad::db::sqlite {

using launchpad::db::ErrorCode;
using launchpad::db::Result;
using launchpad::db::ThrowIfDbError;

namespace {

Result Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// Finalizes on every return path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
        if (rc_ != SQLITE_OK) {
            if (st_) sqlite3_finalize(st_);
            st_ = nullptr;
        }
    }
    ~Statement() {
        if (st_) sqlite3_finalize(st_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }
    int rc() const { return rc_; }
    explicit operator bool() const { return st_ != nullptr; }

private:
    sqlite3_stmt* st_ = nullptr;
    int rc_ = SQLITE_OK;
};

// Reads have no Result to carry a failure, so a statement that did not
// prepare is thrown as a store error.
void RequirePrepared(sqlite3* db, const Statement& st, const char* what) {
    if (st) return;
    auto res = Translate(db, st.rc());
    if (res) res = Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    ThrowIfDbError(res, what);
}

// True on a row, false once the rows are exhausted. Any other step
// result is a store error, never an empty answer.
bool StepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    ThrowIfDbError(Translate(db, rc), what);
    return false;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::vector<int64_t> CollectIds(sqlite3* db, sqlite3_stmt* st, const char* what) {
    std::vector<int64_t> out;
    while (StepRow(db, st, what)) {
        out.push_back(ColI64(st, 0));
    }
    return out;
}

model::LaunchRecord ReadLaunch(sqlite3_stmt* st) {
    model::LaunchRecord r;
    r.launch_id = ColI64(st, 0);
    r.fw_id = ColI64(st, 1);
    r.state = ColText(st, 2);
    r.data = ColText(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result SqliteRepository::NextId(Transaction& t, const std::string& counter, int64_t quantity, int64_t& first_id) {
    if (quantity < 1)
        return Result::Err(ErrorCode::InvalidArgument, "quantity must be positive");

    auto* db = TX(t).Handle();

    {
        Statement st(db, "INSERT OR IGNORE INTO meta(name,value) VALUES(?,1);");
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(st.get(), 1, counter);
        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
    }

    int64_t current = 0;
    {
        Statement st(db, "SELECT value FROM meta WHERE name=?;");
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(st.get(), 1, counter);
        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_ROW) return Translate(db, rc == SQLITE_DONE ? SQLITE_INTERNAL : rc);
        current = ColI64(st.get(), 0);
    }

    if (current > std::numeric_limits<int64_t>::max() - quantity)
        return Result::Err(ErrorCode::ResourceExhausted, "counter " + counter + " exhausted");

    Statement st(db, "UPDATE meta SET value=? WHERE name=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(st.get(), 1, current + quantity);
    BindText(st.get(), 2, counter);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res) first_id = current;
    return res;
}

Result SqliteRepository::ResetCounters(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE meta SET value=1;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Fireworks
// ------------------------------------------------------------------

std::optional<model::FireworkRecord>
SqliteRepository::GetFirework(Transaction& t, int64_t fw_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT fw_id,state,data FROM fireworks WHERE fw_id=?;");
    RequirePrepared(db, st, "get firework");

    BindI64(st.get(), 1, fw_id);
    if (!StepRow(db, st.get(), "get firework")) return std::nullopt;

    model::FireworkRecord r;
    r.fw_id = ColI64(st.get(), 0);
    r.state = ColText(st.get(), 1);
    r.data = ColText(st.get(), 2);
    return r;
}

Result SqliteRepository::UpsertFirework(Transaction& t, const model::FireworkRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO fireworks(fw_id,state,data) VALUES(?,?,?) "
        "ON CONFLICT(fw_id) DO UPDATE SET state=excluded.state, data=excluded.data;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.fw_id);
    BindText(st.get(), 2, r.state);
    BindText(st.get(), 3, r.data);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertFireworks(Transaction& t, const std::vector<model::FireworkRecord>& records) {
    for (const auto& r : records) {
        auto res = UpsertFirework(t, r);
        if (!res) return res;
    }
    return Result::Ok();
}

Result SqliteRepository::DeleteFirework(Transaction& t, int64_t fw_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM fireworks WHERE fw_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, fw_id);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<int64_t>
SqliteRepository::FindFireworkIdsByState(Transaction& t, const std::string& state, std::size_t limit) {
    auto* db = TX(t).Handle();

    // LIMIT -1 means no limit in sqlite
    Statement st(db, "SELECT fw_id FROM fireworks WHERE state=? ORDER BY fw_id LIMIT ?;");
    RequirePrepared(db, st, "find fireworks by state");

    BindText(st.get(), 1, state);
    BindI64(st.get(), 2, limit == 0 ? -1 : static_cast<int64_t>(limit));
    return CollectIds(db, st.get(), "find fireworks by state");
}

std::vector<int64_t> SqliteRepository::ListFireworkIds(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT fw_id FROM fireworks ORDER BY fw_id;");
    RequirePrepared(db, st, "list fireworks");
    return CollectIds(db, st.get(), "list fireworks");
}

// ------------------------------------------------------------------
// Workflows
// ------------------------------------------------------------------

std::optional<model::WorkflowRecord>
SqliteRepository::GetWorkflow(Transaction& t, int64_t wf_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT wf_id,data FROM workflows WHERE wf_id=?;");
    RequirePrepared(db, st, "get workflow");

    BindI64(st.get(), 1, wf_id);
    if (!StepRow(db, st.get(), "get workflow")) return std::nullopt;

    model::WorkflowRecord r;
    r.wf_id = ColI64(st.get(), 0);
    r.data = ColText(st.get(), 1);
    return r;
}

Result SqliteRepository::UpsertWorkflow(Transaction& t, const model::WorkflowRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO workflows(wf_id,data) VALUES(?,?) "
        "ON CONFLICT(wf_id) DO UPDATE SET data=excluded.data;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.wf_id);
    BindText(st.get(), 2, r.data);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteWorkflow(Transaction& t, int64_t wf_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM workflows WHERE wf_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, wf_id);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<int64_t> SqliteRepository::ListWorkflowIds(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT wf_id FROM workflows ORDER BY wf_id;");
    RequirePrepared(db, st, "list workflows");
    return CollectIds(db, st.get(), "list workflows");
}

// ------------------------------------------------------------------
// Membership
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMappings(Transaction& t, const std::vector<model::MappingRecord>& rows) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO mapping(fw_id,wf_id) VALUES(?,?) "
        "ON CONFLICT(fw_id) DO UPDATE SET wf_id=excluded.wf_id;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& row : rows) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindI64(st.get(), 1, row.fw_id);
        BindI64(st.get(), 2, row.wf_id);
        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
    }
    return Result::Ok();
}

std::optional<int64_t> SqliteRepository::GetWorkflowIdForFirework(Transaction& t, int64_t fw_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT wf_id FROM mapping WHERE fw_id=?;");
    RequirePrepared(db, st, "get workflow id");

    BindI64(st.get(), 1, fw_id);
    if (!StepRow(db, st.get(), "get workflow id")) return std::nullopt;
    return ColI64(st.get(), 0);
}

Result SqliteRepository::DeleteMapping(Transaction& t, int64_t fw_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM mapping WHERE fw_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, fw_id);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Launches
// ------------------------------------------------------------------

Result SqliteRepository::InsertLaunch(Transaction& t, const model::LaunchRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO launches(launch_id,fw_id,state,data) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.launch_id);
    BindI64(st.get(), 2, r.fw_id);
    BindText(st.get(), 3, r.state);
    BindText(st.get(), 4, r.data);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res.code == ErrorCode::ConstraintViolation)
        return Result::Err(ErrorCode::AlreadyExists, "launch " + std::to_string(r.launch_id));
    return res;
}

Result SqliteRepository::UpdateLaunch(Transaction& t, const model::LaunchRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE launches SET fw_id=?,state=?,data=? WHERE launch_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.fw_id);
    BindText(st.get(), 2, r.state);
    BindText(st.get(), 3, r.data);
    BindI64(st.get(), 4, r.launch_id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "launch " + std::to_string(r.launch_id));
    return res;
}

std::optional<model::LaunchRecord>
SqliteRepository::GetLaunch(Transaction& t, int64_t launch_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT launch_id,fw_id,state,data FROM launches WHERE launch_id=?;");
    RequirePrepared(db, st, "get launch");

    BindI64(st.get(), 1, launch_id);
    if (!StepRow(db, st.get(), "get launch")) return std::nullopt;
    return ReadLaunch(st.get());
}

std::vector<model::LaunchRecord>
SqliteRepository::FindLaunchesByState(Transaction& t, const std::string& state) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT launch_id,fw_id,state,data FROM launches WHERE state=? ORDER BY launch_id;");
    RequirePrepared(db, st, "find launches by state");

    BindText(st.get(), 1, state);

    std::vector<model::LaunchRecord> out;
    while (StepRow(db, st.get(), "find launches by state")) {
        out.push_back(ReadLaunch(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteRepository::Clear(Transaction& t) {
    auto* db = TX(t).Handle();

    for (const char* sql : {"DELETE FROM fireworks;", "DELETE FROM workflows;", "DELETE FROM mapping;", "DELETE FROM launches;"}) {
        Statement st(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
    }
    return Result::Ok();
}

} // namespace launchpad::db::sqlite
