/*
 * HiveMem C++ - Agent registry Implementation
 */
#include <hivemem/coordination/agent_registry.hpp>
#include <hivemem/core/logger.hpp>

namespace hivemem {

namespace {

const char* kAgentColumns = "id, type, capabilities, status, performance, created_at, updated_at";

AgentRecord agent_from_stmt(const Statement& stmt) {
    AgentRecord a;
    a.id = stmt.column_text(0);
    a.type = stmt.column_text(1);
    Json caps = Json::parse(stmt.column_text(2), nullptr, false);
    if (caps.is_array()) {
        for (const auto& c : caps) {
            if (c.is_string()) a.capabilities.push_back(c.get<std::string>());
        }
    }
    a.status = stmt.column_text(3);
    a.performance = Json::parse(stmt.column_text(4), nullptr, false);
    if (a.performance.is_discarded()) {
        a.performance = Json::object();
    }
    a.created_at = stmt.column_int64(5);
    a.updated_at = stmt.column_int64(6);
    return a;
}

} // anonymous namespace

Json AgentRecord::to_json() const {
    Json j;
    j["id"] = id;
    j["type"] = type;
    j["capabilities"] = capabilities;
    j["status"] = status;
    j["performance"] = performance;
    j["createdAt"] = created_at;
    j["updatedAt"] = updated_at;
    return j;
}

AgentRegistry::AgentRegistry(EngineContext& ctx) : ctx_(ctx) {}

bool AgentRegistry::is_known_status(const std::string& status) {
    return status == "active" || status == "idle" || status == "terminated";
}

bool AgentRegistry::ensure_schema() {
    return ctx_.db.ensure_table("agent_registry", {
        "CREATE TABLE IF NOT EXISTS agent_registry ("
        "  id TEXT PRIMARY KEY,"
        "  type TEXT NOT NULL,"
        "  capabilities TEXT NOT NULL,"
        "  status TEXT NOT NULL,"
        "  performance TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_agent_status ON agent_registry(status)"
    });
}

Status AgentRegistry::register_agent(const AgentRecord& agent) {
    if (agent.id.empty() || agent.type.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "agent requires id and type");
    }
    if (!is_known_status(agent.status)) {
        return Status::fail(ErrorCode::VALIDATION, "unknown agent status: " + agent.status);
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    int64_t now = ctx_.now_ms();
    Statement stmt(ctx_.db,
        "INSERT OR IGNORE INTO agent_registry "
        "(id, type, capabilities, status, performance, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    Json caps = agent.capabilities;
    Json perf = agent.performance.is_null() ? Json::object() : agent.performance;
    stmt.bind_text(1, agent.id);
    stmt.bind_text(2, agent.type);
    stmt.bind_text(3, caps.dump());
    stmt.bind_text(4, agent.status);
    stmt.bind_text(5, perf.dump());
    stmt.bind_int64(6, now);
    stmt.bind_int64(7, now);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    if (ctx_.db.changes() == 0) {
        return Status::fail(ErrorCode::VALIDATION, "agent already registered: " + agent.id);
    }

    LOG_INFO("[AgentRegistry] Registered %s (%s, %d capabilities)", agent.id.c_str(), agent.type.c_str(),
             static_cast<int>(agent.capabilities.size()));
    return Status::ok();
}

Result<AgentRecord> AgentRegistry::get(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<AgentRecord>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kAgentColumns + " FROM agent_registry WHERE id = ?");
    if (!stmt.ok()) {
        return Result<AgentRecord>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<AgentRecord>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<AgentRecord>::fail(ErrorCode::NOT_FOUND, "agent not found: " + id);
    }
    return Result<AgentRecord>::ok(agent_from_stmt(stmt));
}

Status AgentRegistry::update_column(const std::string& id, const char* sql, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, sql);
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, value);
    stmt.bind_int64(2, ctx_.now_ms());
    stmt.bind_text(3, id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    if (ctx_.db.changes() == 0) {
        return Status::fail(ErrorCode::NOT_FOUND, "agent not found: " + id);
    }
    return Status::ok();
}

Status AgentRegistry::update_status(const std::string& id, const std::string& status) {
    if (!is_known_status(status)) {
        return Status::fail(ErrorCode::VALIDATION, "unknown agent status: " + status);
    }
    Status s = update_column(id, "UPDATE agent_registry SET status = ?, updated_at = ? WHERE id = ?", status);
    if (s) {
        LOG_DEBUG("[AgentRegistry] %s is now %s", id.c_str(), status.c_str());
    }
    return s;
}

Status AgentRegistry::update_performance(const std::string& id, const Json& performance) {
    if (!performance.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "performance must be an object");
    }
    return update_column(id, "UPDATE agent_registry SET performance = ?, updated_at = ? WHERE id = ?",
                         performance.dump());
}

Result<std::vector<AgentRecord>> AgentRegistry::query_by_status(const std::string& status) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<AgentRecord>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kAgentColumns +
                            " FROM agent_registry WHERE status = ? ORDER BY updated_at DESC, id ASC");
    if (!stmt.ok()) {
        return Result<std::vector<AgentRecord>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, status);
    std::vector<AgentRecord> out;
    while (stmt.step_row()) {
        out.push_back(agent_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<AgentRecord>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<AgentRecord>>::ok(std::move(out));
}

Result<int64_t> AgentRegistry::count() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM agent_registry");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
