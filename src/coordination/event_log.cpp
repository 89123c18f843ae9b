/*
 * HiveMem C++ - Event log Implementation
 */
#include <hivemem/coordination/event_log.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

EventLog::EventLog(EngineContext& ctx) : ctx_(ctx) {}

bool EventLog::ensure_schema() {
    return ctx_.db.ensure_table("events", {
        "CREATE TABLE IF NOT EXISTS events ("
        "  id TEXT PRIMARY KEY,"
        "  type TEXT NOT NULL,"
        "  payload TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  source TEXT NOT NULL,"
        "  ttl INTEGER NOT NULL DEFAULT 2592000,"
        "  expires_at INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_events_type ON events(type, timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_events_source ON events(source)",
        "CREATE INDEX IF NOT EXISTS idx_events_expires ON events(expires_at)"
    });
}

Result<std::string> EventLog::append(const std::string& type, const Json& payload, const std::string& source) {
    if (type.empty()) {
        return Result<std::string>::fail(ErrorCode::VALIDATION, "event requires a type");
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::string>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    int64_t now = ctx_.now_ms();
    std::string id = "event-" + generate_uuid();

    Statement stmt(ctx_.db,
        "INSERT INTO events (id, type, payload, timestamp, source, ttl, expires_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Result<std::string>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, id);
    stmt.bind_text(2, type);
    stmt.bind_text(3, payload.dump());
    stmt.bind_int64(4, now);
    stmt.bind_text(5, source.empty() ? "unknown" : source);
    stmt.bind_int64(6, EVENT_TTL_SECONDS);
    stmt.bind_int64(7, now + EVENT_TTL_SECONDS * 1000);
    if (!stmt.run()) {
        return Result<std::string>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::string>::ok(id);
}

Result<std::vector<Event>> EventLog::query(const EventQuery& q) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<Event>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    std::string sql =
        "SELECT id, type, payload, timestamp, source, expires_at FROM events WHERE expires_at > ?";
    if (!q.type.empty()) sql += " AND type = ?";
    if (!q.source.empty()) sql += " AND source = ?";
    if (q.since > 0) sql += " AND timestamp >= ?";
    if (q.until > 0) sql += " AND timestamp <= ?";
    sql += " ORDER BY timestamp DESC LIMIT ?";

    Statement stmt(ctx_.db, sql);
    if (!stmt.ok()) {
        return Result<std::vector<Event>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    int idx = 1;
    stmt.bind_int64(idx++, ctx_.now_ms());
    if (!q.type.empty()) stmt.bind_text(idx++, q.type);
    if (!q.source.empty()) stmt.bind_text(idx++, q.source);
    if (q.since > 0) stmt.bind_int64(idx++, q.since);
    if (q.until > 0) stmt.bind_int64(idx++, q.until);
    stmt.bind_int64(idx++, q.limit > 0 ? q.limit : 100);

    std::vector<Event> events;
    while (stmt.step_row()) {
        Event e;
        e.id = stmt.column_text(0);
        e.type = stmt.column_text(1);
        e.payload = Json::parse(stmt.column_text(2), nullptr, false);
        if (e.payload.is_discarded()) {
            e.payload = Json();
        }
        e.timestamp = stmt.column_int64(3);
        e.source = stmt.column_text(4);
        e.expires_at = stmt.column_int64(5);
        events.push_back(e);
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<Event>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<Event>>::ok(std::move(events));
}

Result<std::vector<Event>> EventLog::by_source(const std::string& source, int limit) {
    EventQuery q;
    q.source = source;
    q.limit = limit;
    return query(q);
}

int EventLog::sweep_expired() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        LOG_ERROR("[EventLog] Sweep skipped: %s", ctx_.db.last_error().c_str());
        return 0;
    }
    Statement stmt(ctx_.db, "DELETE FROM events WHERE expires_at <= ?");
    if (!stmt.ok()) return 0;
    stmt.bind_int64(1, ctx_.now_ms());
    if (!stmt.run()) {
        LOG_ERROR("[EventLog] Sweep failed: %s", stmt.error().c_str());
        return 0;
    }
    return ctx_.db.changes();
}

Result<int64_t> EventLog::count() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM events");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
