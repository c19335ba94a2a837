#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace agentmem {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Installs a progress handler that interrupts the running statement once the
// call context expires or is cancelled. Removed again on scope exit.
class ProgressGuard {
public:
    ProgressGuard(sqlite3* db, const CallContext& ctx) : db_(db) {
        if (ctx.deadline || ctx.cancel) {
            sqlite3_progress_handler(db_, 1000, &ProgressGuard::on_progress,
                                     const_cast<CallContext*>(&ctx));
            installed_ = true;
        }
    }
    ~ProgressGuard() {
        if (installed_) sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }
    ProgressGuard(const ProgressGuard&) = delete;
    ProgressGuard& operator=(const ProgressGuard&) = delete;

private:
    static int on_progress(void* arg) {
        const auto* ctx = static_cast<const CallContext*>(arg);
        return (ctx->cancelled() || ctx->expired()) ? 1 : 0;
    }

    sqlite3* db_;
    bool installed_ = false;
};

static constexpr MemoryCategory kAllCategories[] = {
    MemoryCategory::Instruction, MemoryCategory::Preference,
    MemoryCategory::StyleCorrection, MemoryCategory::General,
    MemoryCategory::Context, MemoryCategory::History,
};

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw DependencyUnavailable("SqliteStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw DependencyUnavailable("SqliteStore: " + msg);
    }
}

void SqliteStore::init_schema() {
    // rowid order is the store order returned by list_active
    exec("CREATE TABLE IF NOT EXISTS agent_memories ("
         "  agent_id   TEXT NOT NULL,"
         "  key        TEXT NOT NULL,"
         "  value      TEXT NOT NULL,"
         "  category   TEXT NOT NULL,"
         "  embedding  BLOB,"
         "  updated_at INTEGER NOT NULL,"
         "  expires_at INTEGER,"
         "  UNIQUE (agent_id, key)"
         ");");
    exec("CREATE INDEX IF NOT EXISTS agent_memories_agent_category"
         " ON agent_memories (agent_id, category);");
}

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw DependencyUnavailable(std::string("SqliteStore: ") + sqlite3_errmsg(db));
    }
}

// Turns a failed step into the matching exception. SQLITE_INTERRUPT comes
// from ProgressGuard, so report it the way the call context would.
[[noreturn]] static void throw_step_error(sqlite3* db, int rc, const CallContext& ctx) {
    if (rc == SQLITE_INTERRUPT) {
        ctx.check("sqlite store");
        throw DependencyUnavailable("sqlite store: interrupted");
    }
    throw DependencyUnavailable(std::string("SqliteStore: ") + sqlite3_errmsg(db));
}

// Read embedding BLOB: NULL column = not computed, a zero-length BLOB or one
// that is not a whole number of floats = present but empty.
static std::optional<Embedding> read_embedding(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;

    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0 || static_cast<size_t>(bytes) % sizeof(float) != 0) {
        return Embedding{};
    }

    Embedding emb(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(emb.data(), blob, static_cast<size_t>(bytes));
    return emb;
}

// Columns: key, value, category, embedding, updated_at, expires_at
static const char* kRecordColumns =
    "key, value, category, embedding, updated_at, expires_at";

static std::optional<MemoryRecord> record_from_stmt(sqlite3_stmt* stmt) {
    MemoryRecord record;
    if (auto* v = sqlite3_column_text(stmt, 0)) record.key   = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 1)) record.value = reinterpret_cast<const char*>(v);

    std::string cat;
    if (auto* v = sqlite3_column_text(stmt, 2)) cat = reinterpret_cast<const char*>(v);
    auto category = category_from_string(cat);
    if (!category) {
        std::cerr << "[sqlite] Skipping memory '" << record.key
                  << "' with unknown category '" << cat << "'\n";
        return std::nullopt;
    }
    record.category = *category;

    record.embedding = read_embedding(stmt, 3);
    record.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        record.expires_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    }
    return record;
}

// Restricts a query to rows whose category parses, optionally within one
// group. Matches category_from_string so count_active and list_active agree.
static std::string category_clause(std::optional<MemoryGroup> group) {
    std::string clause = " AND UPPER(TRIM(category)) IN (";
    bool first = true;
    for (auto cat : kAllCategories) {
        if (group && group_of(cat) != *group) continue;
        if (!first) clause += ',';
        clause += '\'' + category_to_string(cat) + '\'';
        first = false;
    }
    clause += ")";
    return clause;
}

uint32_t SqliteStore::count_active(const std::string& agent_id, uint64_t now,
                                   const CallContext& ctx) {
    ctx.check("sqlite store");
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressGuard progress(db_, ctx);

    std::string sql = "SELECT COUNT(*) FROM agent_memories"
        " WHERE agent_id = ? AND (expires_at IS NULL OR expires_at > ?)" +
        category_clause(std::nullopt) + ";";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(now));

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_ROW) throw_step_error(db_, rc, ctx);
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

std::vector<MemoryRecord> SqliteStore::list_active(const std::string& agent_id,
                                                   std::optional<MemoryGroup> group,
                                                   uint64_t now,
                                                   const CallContext& ctx) {
    ctx.check("sqlite store");
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressGuard progress(db_, ctx);

    std::string sql = std::string("SELECT ") + kRecordColumns +
        " FROM agent_memories"
        " WHERE agent_id = ? AND (expires_at IS NULL OR expires_at > ?)";
    sql += category_clause(group);
    sql += " ORDER BY rowid;";

    StmtGuard g;
    prepare(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(now));

    std::vector<MemoryRecord> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        if (auto record = record_from_stmt(g.stmt)) {
            results.push_back(std::move(*record));
        }
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, ctx);
    return results;
}

void SqliteStore::upsert(const std::string& agent_id, const MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    // ON CONFLICT keeps the rowid, so an updated record keeps its list position
    StmtGuard g;
    prepare(db_,
            "INSERT INTO agent_memories"
            " (agent_id, key, value, category, embedding, updated_at, expires_at)"
            " VALUES (?, ?, ?, ?, ?, ?, ?)"
            " ON CONFLICT (agent_id, key) DO UPDATE SET"
            "  value = excluded.value,"
            "  category = excluded.category,"
            "  embedding = excluded.embedding,"
            "  updated_at = excluded.updated_at,"
            "  expires_at = excluded.expires_at;", g);

    std::string cat = category_to_string(record.category);
    sqlite3_bind_text(g.stmt, 1, agent_id.c_str(),     -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, record.key.c_str(),   -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, record.value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, cat.c_str(),          -1, SQLITE_TRANSIENT);
    if (!record.embedding) {
        sqlite3_bind_null(g.stmt, 5);
    } else if (record.embedding->empty()) {
        sqlite3_bind_zeroblob(g.stmt, 5, 0);
    } else {
        sqlite3_bind_blob(g.stmt, 5, record.embedding->data(),
                          static_cast<int>(record.embedding->size() * sizeof(float)),
                          SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(g.stmt, 6, static_cast<sqlite3_int64>(record.updated_at));
    if (record.expires_at) {
        sqlite3_bind_int64(g.stmt, 7, static_cast<sqlite3_int64>(*record.expires_at));
    } else {
        sqlite3_bind_null(g.stmt, 7);
    }

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, CallContext{});
}

std::optional<MemoryRecord> SqliteStore::get(const std::string& agent_id,
                                             const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kRecordColumns +
            " FROM agent_memories WHERE agent_id = ? AND key = ?;", g);
    sqlite3_bind_text(g.stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, key.c_str(),      -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return record_from_stmt(g.stmt);
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, CallContext{});
    return std::nullopt;
}

bool SqliteStore::forget(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "DELETE FROM agent_memories WHERE agent_id = ? AND key = ?;", g);
    sqlite3_bind_text(g.stmt, 1, agent_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, key.c_str(),      -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, CallContext{});
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "DELETE FROM agent_memories"
                 " WHERE expires_at IS NOT NULL AND expires_at <= ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(now));

    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE) throw_step_error(db_, rc, CallContext{});
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

} // namespace agentmem
