#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/util/time.hpp"

namespace wfrun::db::sqlite {

using wfrun::db::ErrorCode;
using wfrun::db::Result;

namespace {

constexpr const char* kRunColumns =
    "id,workflow_id,project_id,project_key,workflow_name,num,status,stop_requested,start_ms,last_modified_ms,workflow,infos";

constexpr const char* kNodeRunColumns = "id,workflow_run_id,workflow_node_id,sub_num,status,start_ms,done_ms,last_modified_ms";

// claims left behind by a crashed process are taken over after this long
constexpr uint64_t kStaleClaimMs = 10 * 60 * 1000;

std::string NewOwnerPrefix() {
    std::random_device rd;
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(8) << rd() << std::setw(8) << rd();
    return out.str();
}

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::RunRecord ReadRun(sqlite3_stmt* st) {
    model::RunRecord r;
    r.id               = ColI64(st, 0);
    r.workflow_id      = ColI64(st, 1);
    r.project_id       = ColI64(st, 2);
    r.project_key      = ColText(st, 3);
    r.workflow_name    = ColText(st, 4);
    r.number           = ColI64(st, 5);
    r.status           = ColI32(st, 6);
    r.stop_requested   = ColI32(st, 7) != 0;
    r.started_at_ms    = ColU64(st, 8);
    r.last_modified_ms = ColU64(st, 9);
    r.workflow_blob    = ColText(st, 10);
    r.infos_blob       = ColText(st, 11);
    return r;
}

static model::NodeRunRecord ReadNodeRun(sqlite3_stmt* st) {
    model::NodeRunRecord r;
    r.id               = ColI64(st, 0);
    r.workflow_run_id  = ColI64(st, 1);
    r.node_id          = ColI64(st, 2);
    r.sub_number       = ColI32(st, 3);
    r.status           = ColI32(st, 4);
    r.started_at_ms    = ColU64(st, 5);
    r.finished_at_ms   = ColU64(st, 6);
    r.last_modified_ms = ColU64(st, 7);
    return r;
}

SqliteRepository::SqliteRepository(std::string path, uint32_t busy_timeout_ms)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms), owner_prefix_(NewOwnerPrefix()) {}

std::unique_ptr<SqliteDB> SqliteRepository::Connect() const {
    return std::make_unique<SqliteDB>(path_, busy_timeout_ms_);
}

void SqliteRepository::Migrate() {
    auto db = Connect();
    sql::RunMigrations(*db, sql::SqliteSchema());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TransactionMode mode) {
    return std::make_unique<SqliteTransaction>(Connect(), mode, owner_prefix_ + "-" + std::to_string(next_tx_id_.fetch_add(1)));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::OpenForWrite(Transaction& t, sqlite3*& db) {
    auto& tx = TX(t);
    if (tx.ReadOnly()) {
        return Result::Err(ErrorCode::InternalError, "write in read-only transaction");
    }
    return tx.Open(db);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

static Result Prepare(sqlite3* db, const std::string& sql, Statement& st) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
    st.reset(raw);
    if (rc != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, std::string("prepare: ") + sqlite3_errmsg(db));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Numbering
// ------------------------------------------------------------------

Result SqliteRepository::NextRunNumber(int64_t workflow_id, int64_t& number) {
    std::unique_ptr<SqliteDB> conn;
    try {
        conn = Connect();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::IOError, e.what());
    }
    auto* db = conn->Handle();

    // autocommit: the increment is durable regardless of the caller's transaction
    const char* sql =
        "INSERT INTO workflow_sequence(workflow_id,current_value) VALUES(?,1) "
        "ON CONFLICT(workflow_id) DO UPDATE SET current_value=current_value+1 "
        "RETURNING current_value;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto r = Prepare(db, sql, st); !r) return r;

    BindI64(st.get(), 1, workflow_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    number = ColI64(st.get(), 0);

    rc = sqlite3_step(st.get());
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, model::RunRecord& r) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    const char* sql =
        "INSERT INTO workflow_run(workflow_id,project_id,project_key,workflow_name,num,status,stop_requested,start_ms,last_modified_ms,workflow,infos)"
        " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;

    BindI64(st.get(), 1, r.workflow_id);
    BindI64(st.get(), 2, r.project_id);
    BindText(st.get(), 3, r.project_key);
    BindText(st.get(), 4, r.workflow_name);
    BindI64(st.get(), 5, r.number);
    BindI32(st.get(), 6, r.status);
    BindI32(st.get(), 7, r.stop_requested ? 1 : 0);
    BindU64(st.get(), 8, r.started_at_ms);
    BindU64(st.get(), 9, r.last_modified_ms);
    BindText(st.get(), 10, r.workflow_blob);
    BindText(st.get(), 11, r.infos_blob);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    const char* sql =
        "UPDATE workflow_run SET workflow_id=?,project_id=?,project_key=?,workflow_name=?,num=?,status=?,stop_requested=?,"
        "start_ms=?,last_modified_ms=?,workflow=?,infos=? WHERE id=?;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;

    BindI64(st.get(), 1, r.workflow_id);
    BindI64(st.get(), 2, r.project_id);
    BindText(st.get(), 3, r.project_key);
    BindText(st.get(), 4, r.workflow_name);
    BindI64(st.get(), 5, r.number);
    BindI32(st.get(), 6, r.status);
    BindI32(st.get(), 7, r.stop_requested ? 1 : 0);
    BindU64(st.get(), 8, r.started_at_ms);
    BindU64(st.get(), 9, r.last_modified_ms);
    BindText(st.get(), 10, r.workflow_blob);
    BindText(st.get(), 11, r.infos_blob);
    BindI64(st.get(), 12, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "run " + std::to_string(r.id));
    return Result::Ok();
}

Result SqliteRepository::FindRun(Transaction& t, const RunSelector& selector, std::optional<model::RunRecord>& out) {
    out.reset();
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    std::string sql = std::string("SELECT ") + kRunColumns + " FROM workflow_run WHERE ";
    switch (selector.kind) {
        case RunSelector::Kind::kByNumber:
            sql += "project_key=? AND workflow_name=? AND num=?;";
            break;
        case RunSelector::Kind::kLatest:
            sql += "project_key=? AND workflow_name=? ORDER BY num DESC LIMIT 1;";
            break;
        case RunSelector::Kind::kById:
            sql += "id=?;";
            break;
        case RunSelector::Kind::kByIdAndProject:
            sql += "project_key=? AND id=?;";
            break;
    }

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;

    switch (selector.kind) {
        case RunSelector::Kind::kByNumber:
            BindText(st.get(), 1, selector.project_key);
            BindText(st.get(), 2, selector.workflow_name);
            BindI64(st.get(), 3, selector.number);
            break;
        case RunSelector::Kind::kLatest:
            BindText(st.get(), 1, selector.project_key);
            BindText(st.get(), 2, selector.workflow_name);
            break;
        case RunSelector::Kind::kById:
            BindI64(st.get(), 1, selector.run_id);
            break;
        case RunSelector::Kind::kByIdAndProject:
            BindText(st.get(), 1, selector.project_key);
            BindI64(st.get(), 2, selector.run_id);
            break;
    }

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
        out = ReadRun(st.get());
        return Result::Ok();
    }
    return Translate(db, rc);
}

Result SqliteRepository::LockRun(Transaction& t, int64_t run_id) {
    auto& tx = TX(t);
    if (tx.ReadOnly()) {
        return Result::Err(ErrorCode::InternalError, "lock in read-only transaction");
    }

    // claimed before BEGIN IMMEDIATE so a contended run never waits on the database lock
    const uint64_t now_ms = util::ToUnixMillis(util::Now());
    if (auto claim = tx.Claim(run_id, now_ms, now_ms - std::min(now_ms, kStaleClaimMs)); !claim) return claim;

    sqlite3* db = nullptr;
    if (auto open = tx.Open(db); !open) return open;

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, "SELECT id FROM workflow_run WHERE id=?;", st); !p) return p;
    BindI64(st.get(), 1, run_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "run " + std::to_string(run_id));
    return Translate(db, rc);
}

Result SqliteRepository::CountRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, int64_t& count) {
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, "SELECT COUNT(1) FROM workflow_run WHERE project_key=? AND workflow_name=?;", st); !p) return p;
    BindText(st.get(), 1, project_key);
    BindText(st.get(), 2, workflow_name);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) return Translate(db, rc);
    count = ColI64(st.get(), 0);
    return Result::Ok();
}

Result SqliteRepository::ListRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, const Pagination& pagination,
                                  std::vector<model::RunRecord>& out) {
    out.clear();
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    const std::string sql = std::string("SELECT ") + kRunColumns +
                            " FROM workflow_run WHERE project_key=? AND workflow_name=? ORDER BY start_ms DESC, id DESC LIMIT ? OFFSET ?;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;
    BindText(st.get(), 1, project_key);
    BindText(st.get(), 2, workflow_name);
    BindI64(st.get(), 3, static_cast<int64_t>(pagination.limit));
    BindI64(st.get(), 4, static_cast<int64_t>(pagination.offset));

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadRun(st.get()));
    }
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Node runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertNodeRun(Transaction& t, model::NodeRunRecord& r) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    const char* sql =
        "INSERT INTO workflow_node_run(workflow_run_id,workflow_node_id,sub_num,status,start_ms,done_ms,last_modified_ms)"
        " VALUES(?,?,?,?,?,?,?);";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;

    BindI64(st.get(), 1, r.workflow_run_id);
    BindI64(st.get(), 2, r.node_id);
    BindI32(st.get(), 3, r.sub_number);
    BindI32(st.get(), 4, r.status);
    BindU64(st.get(), 5, r.started_at_ms);
    BindU64(st.get(), 6, r.finished_at_ms);
    BindU64(st.get(), 7, r.last_modified_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

Result SqliteRepository::UpdateNodeRun(Transaction& t, const model::NodeRunRecord& r) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    const char* sql = "UPDATE workflow_node_run SET status=?,start_ms=?,done_ms=?,last_modified_ms=? WHERE id=?;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;

    BindI32(st.get(), 1, r.status);
    BindU64(st.get(), 2, r.started_at_ms);
    BindU64(st.get(), 3, r.finished_at_ms);
    BindU64(st.get(), 4, r.last_modified_ms);
    BindI64(st.get(), 5, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "node run " + std::to_string(r.id));
    return Result::Ok();
}

Result SqliteRepository::ListNodeRuns(Transaction& t, int64_t run_id, std::vector<model::NodeRunRecord>& out) {
    out.clear();
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    const std::string sql =
        std::string("SELECT ") + kNodeRunColumns + " FROM workflow_node_run WHERE workflow_run_id=? ORDER BY sub_num DESC, id ASC;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;
    BindI64(st.get(), 1, run_id);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadNodeRun(st.get()));
    }
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Tags
// ------------------------------------------------------------------

Result SqliteRepository::DeleteRunTags(Transaction& t, int64_t run_id) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, "DELETE FROM workflow_run_tag WHERE workflow_run_id=?;", st); !p) return p;
    BindI64(st.get(), 1, run_id);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertRunTags(Transaction& t, const std::vector<model::RunTagRecord>& tags) {
    sqlite3* db = nullptr;
    if (auto open = OpenForWrite(t, db); !open) return open;

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, "INSERT INTO workflow_run_tag(workflow_run_id,tag,value) VALUES(?,?,?);", st); !p) return p;

    for (const auto& tag : tags) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindI64(st.get(), 1, tag.workflow_run_id);
        BindText(st.get(), 2, tag.tag);
        BindText(st.get(), 3, tag.value);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

Result SqliteRepository::ListRunTags(Transaction& t, int64_t run_id, std::vector<model::RunTagRecord>& out) {
    out.clear();
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, "SELECT workflow_run_id,tag,value FROM workflow_run_tag WHERE workflow_run_id=? ORDER BY tag, value;", st); !p)
        return p;
    BindI64(st.get(), 1, run_id);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back({ColI64(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
    }
    return Translate(db, rc);
}

Result SqliteRepository::ListWorkflowTagValues(Transaction& t, const std::string& project_key, const std::string& workflow_name,
                                               std::vector<model::RunTagRecord>& out) {
    out.clear();
    sqlite3* db = nullptr;
    if (auto open = TX(t).Open(db); !open) return open;

    const char* sql =
        "SELECT DISTINCT t.tag, t.value FROM workflow_run_tag t JOIN workflow_run r ON r.id = t.workflow_run_id"
        " WHERE r.project_key=? AND r.workflow_name=? ORDER BY t.tag, t.value;";

    Statement st(nullptr, &sqlite3_finalize);
    if (auto p = Prepare(db, sql, st); !p) return p;
    BindText(st.get(), 1, project_key);
    BindText(st.get(), 2, workflow_name);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back({0, ColText(st.get(), 0), ColText(st.get(), 1)});
    }
    return Translate(db, rc);
}

} // namespace wfrun::db::sqlite
