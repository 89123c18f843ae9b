/*
 * HiveMem C++ - GOAP records Implementation
 */
#include <hivemem/planning/goap_store.hpp>
#include <hivemem/core/logger.hpp>

namespace hivemem {

namespace {

Json parse_or_object(const std::string& text) {
    Json j = Json::parse(text, nullptr, false);
    return j.is_discarded() ? Json::object() : j;
}

const char* kActionColumns =
    "id, name, preconditions, effects, cost, success_rate, agent_type, category, created_at";

GoapAction action_from_stmt(const Statement& stmt) {
    GoapAction a;
    a.id = stmt.column_text(0);
    a.name = stmt.column_text(1);
    a.preconditions = parse_or_object(stmt.column_text(2));
    a.effects = parse_or_object(stmt.column_text(3));
    a.cost = stmt.column_double(4);
    a.success_rate = stmt.column_is_null(5) ? 1.0 : stmt.column_double(5);
    a.agent_type = stmt.column_text(6);
    a.category = stmt.column_text(7);
    a.created_at = stmt.column_int64(8);
    return a;
}

} // anonymous namespace

// ============================================================================
// JSON forms
// ============================================================================

Json GoapGoal::to_json() const {
    Json j;
    j["id"] = id;
    j["conditions"] = conditions;
    j["cost"] = cost;
    j["priority"] = priority;
    j["createdAt"] = created_at;
    return j;
}

GoapGoal GoapGoal::from_json(const Json& j) {
    GoapGoal g;
    g.id = j.value("id", std::string());
    if (j.contains("conditions") && j["conditions"].is_object()) g.conditions = j["conditions"];
    g.cost = j.value("cost", 0.0);
    g.priority = j.value("priority", std::string());
    return g;
}

Json GoapAction::to_json() const {
    Json j;
    j["id"] = id;
    j["name"] = name;
    j["preconditions"] = preconditions;
    j["effects"] = effects;
    j["cost"] = cost;
    j["successRate"] = success_rate;
    j["agentType"] = agent_type;
    j["category"] = category;
    return j;
}

GoapAction GoapAction::from_json(const Json& j) {
    GoapAction a;
    a.id = j.value("id", std::string());
    a.name = j.value("name", a.id);
    if (j.contains("preconditions") && j["preconditions"].is_object()) a.preconditions = j["preconditions"];
    if (j.contains("effects") && j["effects"].is_object()) a.effects = j["effects"];
    a.cost = j.value("cost", 1.0);
    a.success_rate = j.value("successRate", 1.0);
    a.agent_type = j.value("agentType", std::string());
    a.category = j.value("category", std::string());
    return a;
}

Json GoapPlan::to_json() const {
    Json j;
    j["id"] = id;
    j["goalId"] = goal_id;
    j["sequence"] = sequence;
    j["totalCost"] = total_cost;
    j["createdAt"] = created_at;
    return j;
}

// ============================================================================
// GoapStore
// ============================================================================

GoapStore::GoapStore(EngineContext& ctx) : ctx_(ctx) {}

bool GoapStore::ensure_schema() {
    return ctx_.db.ensure_table("goap_goals", {
               "CREATE TABLE IF NOT EXISTS goap_goals ("
               "  id TEXT PRIMARY KEY,"
               "  conditions TEXT NOT NULL,"
               "  cost REAL NOT NULL,"
               "  priority TEXT,"
               "  created_at INTEGER NOT NULL"
               ")"}) &&
           ctx_.db.ensure_table("goap_actions", {
               "CREATE TABLE IF NOT EXISTS goap_actions ("
               "  id TEXT PRIMARY KEY,"
               "  name TEXT NOT NULL,"
               "  preconditions TEXT NOT NULL,"
               "  effects TEXT NOT NULL,"
               "  cost REAL NOT NULL,"
               "  success_rate REAL,"
               "  agent_type TEXT,"
               "  category TEXT,"
               "  created_at INTEGER NOT NULL"
               ")",
               "CREATE INDEX IF NOT EXISTS idx_goap_actions_category ON goap_actions(category)"}) &&
           ctx_.db.ensure_table("goap_plans", {
               "CREATE TABLE IF NOT EXISTS goap_plans ("
               "  id TEXT PRIMARY KEY,"
               "  goal_id TEXT NOT NULL,"
               "  sequence TEXT NOT NULL,"
               "  total_cost REAL NOT NULL,"
               "  created_at INTEGER NOT NULL"
               ")"});
}

Status GoapStore::store_goal(const GoapGoal& goal) {
    if (goal.id.empty() || !goal.conditions.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "goal requires an id and a conditions object");
    }
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db,
        "INSERT OR REPLACE INTO goap_goals (id, conditions, cost, priority, created_at) VALUES (?, ?, ?, ?, ?)");
    stmt.bind_text(1, goal.id);
    stmt.bind_text(2, goal.conditions.dump());
    stmt.bind_double(3, goal.cost);
    stmt.bind_text_or_null(4, goal.priority);
    stmt.bind_int64(5, goal.created_at ? goal.created_at : ctx_.now_ms());
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Status::ok();
}

Result<GoapGoal> GoapStore::get_goal(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<GoapGoal>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT id, conditions, cost, priority, created_at FROM goap_goals WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<GoapGoal>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<GoapGoal>::fail(ErrorCode::NOT_FOUND, "goal not found: " + id);
    }
    GoapGoal g;
    g.id = stmt.column_text(0);
    g.conditions = parse_or_object(stmt.column_text(1));
    g.cost = stmt.column_double(2);
    g.priority = stmt.column_text(3);
    g.created_at = stmt.column_int64(4);
    return Result<GoapGoal>::ok(g);
}

Status GoapStore::store_action(const GoapAction& action) {
    if (action.id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "action requires an id");
    }
    if (!action.preconditions.is_object() || !action.effects.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "preconditions and effects must be objects");
    }
    if (action.cost < 0.0 || action.success_rate <= 0.0 || action.success_rate > 1.0) {
        return Status::fail(ErrorCode::VALIDATION, "action cost must be >= 0 and successRate within (0, 1]");
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db,
        "INSERT OR REPLACE INTO goap_actions (id, name, preconditions, effects, cost, success_rate, "
        "agent_type, category, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, action.id);
    stmt.bind_text(2, action.name.empty() ? action.id : action.name);
    stmt.bind_text(3, action.preconditions.dump());
    stmt.bind_text(4, action.effects.dump());
    stmt.bind_double(5, action.cost);
    stmt.bind_double(6, action.success_rate);
    stmt.bind_text_or_null(7, action.agent_type);
    stmt.bind_text_or_null(8, action.category);
    stmt.bind_int64(9, action.created_at ? action.created_at : ctx_.now_ms());
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Status::ok();
}

Result<GoapAction> GoapStore::get_action(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<GoapAction>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kActionColumns + " FROM goap_actions WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<GoapAction>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<GoapAction>::fail(ErrorCode::NOT_FOUND, "action not found: " + id);
    }
    return Result<GoapAction>::ok(action_from_stmt(stmt));
}

Result<std::vector<GoapAction>> GoapStore::list_actions(const std::string& category) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<GoapAction>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    std::string sql = std::string("SELECT ") + kActionColumns + " FROM goap_actions";
    if (!category.empty()) {
        sql += " WHERE category = ?";
    }
    sql += " ORDER BY id";
    Statement stmt(ctx_.db, sql);
    if (!category.empty()) {
        stmt.bind_text(1, category);
    }
    std::vector<GoapAction> out;
    while (stmt.step_row()) {
        out.push_back(action_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<GoapAction>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<GoapAction>>::ok(std::move(out));
}

Status GoapStore::store_plan(const GoapPlan& plan) {
    if (plan.id.empty() || plan.goal_id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "plan requires an id and a goal id");
    }
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    // Committed plans are never replaced
    Statement exists(ctx_.db, "SELECT 1 FROM goap_plans WHERE id = ?");
    exists.bind_text(1, plan.id);
    if (exists.step_row()) {
        return Status::fail(ErrorCode::VALIDATION, "plan already committed: " + plan.id);
    }

    Statement stmt(ctx_.db,
        "INSERT INTO goap_plans (id, goal_id, sequence, total_cost, created_at) VALUES (?, ?, ?, ?, ?)");
    stmt.bind_text(1, plan.id);
    stmt.bind_text(2, plan.goal_id);
    stmt.bind_text(3, Json(plan.sequence).dump());
    stmt.bind_double(4, plan.total_cost);
    stmt.bind_int64(5, plan.created_at ? plan.created_at : ctx_.now_ms());
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    LOG_DEBUG("[GoapStore] Plan %s committed (%zu actions)", plan.id.c_str(), plan.sequence.size());
    return Status::ok();
}

Result<GoapPlan> GoapStore::get_plan(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<GoapPlan>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT id, goal_id, sequence, total_cost, created_at FROM goap_plans WHERE id = ?");
    stmt.bind_text(1, id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<GoapPlan>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<GoapPlan>::fail(ErrorCode::NOT_FOUND, "plan not found: " + id);
    }
    GoapPlan p;
    p.id = stmt.column_text(0);
    p.goal_id = stmt.column_text(1);
    Json seq = Json::parse(stmt.column_text(2), nullptr, false);
    if (seq.is_array()) {
        for (const auto& s : seq) {
            if (s.is_string()) p.sequence.push_back(s.get<std::string>());
        }
    }
    p.total_cost = stmt.column_double(3);
    p.created_at = stmt.column_int64(4);
    return Result<GoapPlan>::ok(p);
}

} // namespace hivemem
