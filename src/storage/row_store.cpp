/*
 * HiveMem C++ - SQLite row store Implementation
 */
#include <hivemem/storage/row_store.hpp>
#include <hivemem/core/logger.hpp>

namespace hivemem {

namespace {

const char* kRowColumns =
    "partition, key, value, owner, access_level, team_id, swarm_id, "
    "created_at, updated_at, expires_at";

Row row_from_stmt(const Statement& stmt) {
    Row row;
    row.ns = stmt.column_text(0);
    row.key = stmt.column_text(1);
    row.value = stmt.column_text(2);
    row.owner = stmt.column_text(3);
    row.access_level = stmt.column_text(4);
    row.team_id = stmt.column_text(5);
    row.swarm_id = stmt.column_text(6);
    row.created_at = stmt.column_int64(7);
    row.updated_at = stmt.column_int64(8);
    row.expires_at = stmt.column_int64(9);
    return row;
}

} // anonymous namespace

SqliteRowStore::SqliteRowStore(Database& db) : db_(db) {}

bool SqliteRowStore::ensure_schema() {
    return db_.ensure_table("memory_entries", {
        "CREATE TABLE IF NOT EXISTS memory_entries ("
        "  key TEXT NOT NULL,"
        "  partition TEXT NOT NULL DEFAULT 'default',"
        "  value TEXT NOT NULL,"
        "  owner TEXT NOT NULL DEFAULT 'system',"
        "  access_level TEXT NOT NULL DEFAULT 'private',"
        "  team_id TEXT,"
        "  swarm_id TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL DEFAULT 0,"
        "  PRIMARY KEY (key, partition)"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_memory_partition ON memory_entries(partition)",
        "CREATE INDEX IF NOT EXISTS idx_memory_expires ON memory_entries(expires_at)",
        "CREATE INDEX IF NOT EXISTS idx_memory_owner ON memory_entries(owner)"
    });
}

Status SqliteRowStore::put(const Row& row) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, db_.last_error());
    }

    // created_at survives replacement of an existing row
    Statement stmt(db_,
        "INSERT INTO memory_entries "
        "(partition, key, value, owner, access_level, team_id, swarm_id, created_at, updated_at, expires_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(key, partition) DO UPDATE SET "
        "  value = excluded.value, owner = excluded.owner, access_level = excluded.access_level,"
        "  team_id = excluded.team_id, swarm_id = excluded.swarm_id,"
        "  updated_at = excluded.updated_at, expires_at = excluded.expires_at");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, row.ns);
    stmt.bind_text(2, row.key);
    stmt.bind_text(3, row.value);
    stmt.bind_text(4, row.owner);
    stmt.bind_text(5, row.access_level);
    stmt.bind_text_or_null(6, row.team_id);
    stmt.bind_text_or_null(7, row.swarm_id);
    stmt.bind_int64(8, row.created_at);
    stmt.bind_int64(9, row.updated_at);
    stmt.bind_int64(10, row.expires_at);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Status::ok();
}

Result<Row> SqliteRowStore::get(const std::string& ns, const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<Row>::fail(ErrorCode::STORAGE, db_.last_error());
    }

    Statement stmt(db_, std::string("SELECT ") + kRowColumns +
                        " FROM memory_entries WHERE partition = ? AND key = ?");
    if (!stmt.ok()) {
        return Result<Row>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, ns);
    stmt.bind_text(2, key);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<Row>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<Row>::fail(ErrorCode::NOT_FOUND, "no entry " + ns + ":" + key);
    }
    return Result<Row>::ok(row_from_stmt(stmt));
}

Result<std::vector<Row>> SqliteRowStore::scan(const RowScan& scan) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<Row>>::fail(ErrorCode::STORAGE, db_.last_error());
    }

    std::string sql = std::string("SELECT ") + kRowColumns + " FROM memory_entries WHERE 1=1";
    if (!scan.ns.empty()) sql += " AND partition = ?";
    if (!scan.key_like.empty()) sql += " AND key LIKE ? ESCAPE '\\'";
    if (scan.live_at > 0) sql += " AND (expires_at = 0 OR expires_at > ?)";
    sql += " ORDER BY partition, key";
    if (scan.limit > 0) sql += " LIMIT " + std::to_string(scan.limit);

    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return Result<std::vector<Row>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    int idx = 1;
    if (!scan.ns.empty()) stmt.bind_text(idx++, scan.ns);
    if (!scan.key_like.empty()) stmt.bind_text(idx++, scan.key_like);
    if (scan.live_at > 0) stmt.bind_int64(idx++, scan.live_at);

    std::vector<Row> rows;
    while (stmt.step_row()) {
        rows.push_back(row_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<Row>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<Row>>::ok(std::move(rows));
}

Result<int> SqliteRowStore::remove(const std::string& ns, const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<int>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "DELETE FROM memory_entries WHERE partition = ? AND key = ?");
    if (!stmt.ok()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, ns);
    stmt.bind_text(2, key);
    if (!stmt.run()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<int>::ok(db_.changes());
}

Result<int> SqliteRowStore::remove_namespace(const std::string& ns) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<int>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "DELETE FROM memory_entries WHERE partition = ?");
    if (!stmt.ok()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, ns);
    if (!stmt.run()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<int>::ok(db_.changes());
}

Result<int> SqliteRowStore::remove_expired(int64_t now) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<int>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "DELETE FROM memory_entries WHERE expires_at != 0 AND expires_at <= ?");
    if (!stmt.ok()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_int64(1, now);
    if (!stmt.run()) {
        return Result<int>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<int>::ok(db_.changes());
}

Result<int64_t> SqliteRowStore::count(const std::string& ns, int64_t live_at) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    std::string sql = "SELECT COUNT(*) FROM memory_entries WHERE 1=1";
    if (!ns.empty()) sql += " AND partition = ?";
    if (live_at > 0) sql += " AND (expires_at = 0 OR expires_at > ?)";

    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }
    int idx = 1;
    if (!ns.empty()) stmt.bind_text(idx++, ns);
    if (live_at > 0) stmt.bind_int64(idx++, live_at);
    if (!stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<std::vector<std::string>> SqliteRowStore::namespaces() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<std::string>>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "SELECT DISTINCT partition FROM memory_entries ORDER BY partition");
    if (!stmt.ok()) {
        return Result<std::vector<std::string>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    std::vector<std::string> out;
    while (stmt.step_row()) {
        out.push_back(stmt.column_text(0));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<std::string>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace hivemem
