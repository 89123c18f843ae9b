/*
 * HiveMem C++ - Blackboard Implementation
 */
#include <hivemem/coordination/blackboard.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

Blackboard::Blackboard(EngineContext& ctx) : ctx_(ctx) {}

bool Blackboard::ensure_schema() {
    return ctx_.db.ensure_table("hints", {
        "CREATE TABLE IF NOT EXISTS hints ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  partition TEXT NOT NULL DEFAULT 'default',"
        "  key TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL DEFAULT 0"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_hints_key ON hints(partition, key)",
        "CREATE INDEX IF NOT EXISTS idx_hints_expires ON hints(expires_at)"
    });
}

Result<int64_t> Blackboard::post_hint(const std::string& key, const Json& value,
                                      const std::string& partition, int64_t ttl_seconds) {
    if (key.empty() || partition.empty()) {
        return Result<int64_t>::fail(ErrorCode::VALIDATION, "hint requires a key and partition");
    }
    if (ttl_seconds < 0) {
        return Result<int64_t>::fail(ErrorCode::VALIDATION, "hint ttlSeconds must be >= 0");
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    int64_t now = ctx_.now_ms();
    Statement stmt(ctx_.db,
        "INSERT INTO hints (partition, key, value, created_at, expires_at) VALUES (?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, partition);
    stmt.bind_text(2, key);
    stmt.bind_text(3, value.dump());
    stmt.bind_int64(4, now);
    stmt.bind_int64(5, ttl_seconds == 0 ? 0 : now + ttl_seconds * 1000);
    if (!stmt.run()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }

    int64_t id = ctx_.db.last_insert_rowid();
    LOG_DEBUG("[Blackboard] Hint %lld posted: %s:%s", static_cast<long long>(id),
              partition.c_str(), key.c_str());
    return Result<int64_t>::ok(id);
}

Result<std::vector<Hint>> Blackboard::read_hints(const std::string& pattern,
                                                 const std::string& partition, int limit) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<Hint>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    Statement stmt(ctx_.db,
        "SELECT id, partition, key, value, created_at, expires_at FROM hints "
        "WHERE partition = ? AND key LIKE ? ESCAPE '\\' AND (expires_at = 0 OR expires_at > ?) "
        "ORDER BY created_at DESC, id DESC LIMIT ?");
    if (!stmt.ok()) {
        return Result<std::vector<Hint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, partition);
    stmt.bind_text(2, pattern.empty() ? "%" : glob_to_like(pattern));
    stmt.bind_int64(3, ctx_.now_ms());
    stmt.bind_int64(4, limit > 0 ? limit : 100);

    std::vector<Hint> hints;
    while (stmt.step_row()) {
        Hint h;
        h.id = stmt.column_int64(0);
        h.partition = stmt.column_text(1);
        h.key = stmt.column_text(2);
        h.value = Json::parse(stmt.column_text(3), nullptr, false);
        if (h.value.is_discarded()) {
            h.value = stmt.column_text(3);
        }
        h.created_at = stmt.column_int64(4);
        h.expires_at = stmt.column_int64(5);
        hints.push_back(h);
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<Hint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<Hint>>::ok(std::move(hints));
}

int Blackboard::sweep_expired() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        LOG_ERROR("[Blackboard] Sweep skipped: %s", ctx_.db.last_error().c_str());
        return 0;
    }
    Statement stmt(ctx_.db, "DELETE FROM hints WHERE expires_at != 0 AND expires_at <= ?");
    if (!stmt.ok()) return 0;
    stmt.bind_int64(1, ctx_.now_ms());
    if (!stmt.run()) {
        LOG_ERROR("[Blackboard] Sweep failed: %s", stmt.error().c_str());
        return 0;
    }
    return ctx_.db.changes();
}

Result<int64_t> Blackboard::count() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM hints");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
