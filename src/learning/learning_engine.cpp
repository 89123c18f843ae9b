/*
 * HiveMem C++ - Learning engine Implementation
 */
#include <hivemem/learning/learning_engine.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace hivemem {

namespace {

const char* bucket(double v) {
    if (v < 0.33) return "low";
    if (v < 0.66) return "medium";
    return "high";
}

double confidence_from_q(double q) {
    return 1.0 / (1.0 + std::exp(-q));
}

} // anonymous namespace

LearningEngine::LearningEngine(EngineContext& ctx)
    : ctx_(ctx)
    , enabled_(ctx.config.learning.enabled)
{
}

bool LearningEngine::ensure_schema() {
    return ctx_.db.ensure_table("learning_experiences", {
               "CREATE TABLE IF NOT EXISTS learning_experiences ("
               "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
               "  agent_id TEXT NOT NULL,"
               "  state_key TEXT NOT NULL,"
               "  action TEXT NOT NULL,"
               "  reward REAL NOT NULL,"
               "  next_state_key TEXT NOT NULL,"
               "  state TEXT NOT NULL,"
               "  next_state TEXT NOT NULL,"
               "  created_at INTEGER NOT NULL"
               ")",
               "CREATE INDEX IF NOT EXISTS idx_experiences_agent ON learning_experiences(agent_id)"}) &&
           ctx_.db.ensure_table("q_values", {
               "CREATE TABLE IF NOT EXISTS q_values ("
               "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
               "  agent_id TEXT NOT NULL,"
               "  state_key TEXT NOT NULL,"
               "  action_key TEXT NOT NULL,"
               "  value REAL NOT NULL DEFAULT 0,"
               "  update_count INTEGER NOT NULL DEFAULT 0,"
               "  updated_at INTEGER NOT NULL,"
               "  UNIQUE(agent_id, state_key, action_key)"
               ")",
               "CREATE INDEX IF NOT EXISTS idx_q_values_agent ON q_values(agent_id, state_key)"}) &&
           ctx_.db.ensure_table("learning_history", {
               "CREATE TABLE IF NOT EXISTS learning_history ("
               "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
               "  agent_id TEXT NOT NULL,"
               "  metrics TEXT NOT NULL,"
               "  session_experiences INTEGER NOT NULL,"
               "  created_at INTEGER NOT NULL"
               ")",
               "CREATE INDEX IF NOT EXISTS idx_learning_history_agent ON learning_history(agent_id)"});
}

bool LearningEngine::init() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        LOG_ERROR("[LearningEngine] Schema setup failed: %s", ctx_.db.last_error().c_str());
        return false;
    }
    LOG_DEBUG("[LearningEngine] Ready (alpha=%.3f gamma=%.3f schedule=%s)",
              ctx_.config.learning.learning_rate, ctx_.config.learning.discount_factor,
              ctx_.config.learning.rate_schedule == RateSchedule::HARMONIC ? "harmonic" : "constant");
    return true;
}

std::string LearningEngine::state_key(const TaskState& state) {
    std::set<std::string> caps;
    for (const auto& c : state.required_capabilities) {
        caps.insert(to_lower(trim(c)));
    }
    std::vector<std::string> sorted(caps.begin(), caps.end());

    std::ostringstream key;
    key << "c=" << bucket(state.task_complexity)
        << ";caps=" << join(sorted, ",")
        << ";att=" << (state.previous_attempts >= 3 ? std::string("3+") : std::to_string(std::max(0, state.previous_attempts)))
        << ";res=" << bucket(state.available_resources);
    return key.str();
}

double LearningEngine::alpha_for(int64_t prior_updates) const {
    if (ctx_.config.learning.rate_schedule == RateSchedule::HARMONIC) {
        return 1.0 / static_cast<double>(prior_updates + 1);
    }
    return ctx_.config.learning.learning_rate;
}

// ============================================================================
// Experience Recording
// ============================================================================

Status LearningEngine::record_experience(const std::string& agent_id, const TaskState& state,
                                         const std::string& action, double reward,
                                         const TaskState& next_state) {
    if (!enabled_) {
        LOG_DEBUG("[LearningEngine] Disabled, experience for %s not recorded", agent_id.c_str());
        return Status::ok();
    }
    if (agent_id.empty() || action.empty()) {
        LOG_WARN("[LearningEngine] Experience rejected: agent id and action are required");
        return Status::fail(ErrorCode::VALIDATION, "experience requires agent id and action");
    }
    if (!std::isfinite(reward)) {
        LOG_WARN("[LearningEngine] Experience rejected for %s: reward is not finite", agent_id.c_str());
        return Status::fail(ErrorCode::VALIDATION, "reward must be finite");
    }

    std::string skey = state_key(state);
    std::string next_key = state_key(next_state);
    int64_t session_count = 0;

    try {
        std::string state_text = state.to_json().dump();
        std::string next_text = next_state.to_json().dump();

        Transaction txn(ctx_.db);
        if (!ensure_schema() || !txn.active()) {
            LOG_ERROR("[LearningEngine] Cannot record experience for %s: %s", agent_id.c_str(),
                      ctx_.db.last_error().c_str());
            return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
        }

        int64_t now = ctx_.now_ms();
        {
            Statement ins(ctx_.db,
                "INSERT INTO learning_experiences (agent_id, state_key, action, reward, next_state_key, "
                "state, next_state, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            ins.bind_text(1, agent_id);
            ins.bind_text(2, skey);
            ins.bind_text(3, action);
            ins.bind_double(4, reward);
            ins.bind_text(5, next_key);
            ins.bind_text(6, state_text);
            ins.bind_text(7, next_text);
            ins.bind_int64(8, now);
            if (!ins.run()) {
                return Status::fail(ErrorCode::STORAGE, ins.error());
            }
        }

        double max_next = 0.0;
        {
            Statement sel(ctx_.db, "SELECT MAX(value) FROM q_values WHERE agent_id = ? AND state_key = ?");
            sel.bind_text(1, agent_id);
            sel.bind_text(2, next_key);
            if (sel.step_row() && !sel.column_is_null(0)) {
                max_next = sel.column_double(0);
            } else if (!sel.error().empty()) {
                return Status::fail(ErrorCode::STORAGE, sel.error());
            }
        }

        double old_q = 0.0;
        int64_t prior_updates = 0;
        {
            Statement sel(ctx_.db,
                "SELECT value, update_count FROM q_values WHERE agent_id = ? AND state_key = ? AND action_key = ?");
            sel.bind_text(1, agent_id);
            sel.bind_text(2, skey);
            sel.bind_text(3, action);
            if (sel.step_row()) {
                old_q = sel.column_double(0);
                prior_updates = sel.column_int64(1);
            } else if (!sel.error().empty()) {
                return Status::fail(ErrorCode::STORAGE, sel.error());
            }
        }

        double alpha = alpha_for(prior_updates);
        double new_q = old_q + alpha * (reward + ctx_.config.learning.discount_factor * max_next - old_q);

        {
            Statement up(ctx_.db,
                "INSERT INTO q_values (agent_id, state_key, action_key, value, update_count, updated_at) "
                "VALUES (?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(agent_id, state_key, action_key) DO UPDATE SET "
                "value = excluded.value, update_count = excluded.update_count, updated_at = excluded.updated_at");
            up.bind_text(1, agent_id);
            up.bind_text(2, skey);
            up.bind_text(3, action);
            up.bind_double(4, new_q);
            up.bind_int64(5, prior_updates + 1);
            up.bind_int64(6, now);
            if (!up.run()) {
                return Status::fail(ErrorCode::STORAGE, up.error());
            }
        }

        if (!txn.commit()) {
            LOG_ERROR("[LearningEngine] Commit failed for %s: %s", agent_id.c_str(), ctx_.db.last_error().c_str());
            return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
        }

        {
            std::lock_guard<std::mutex> lock(policy_mutex_);
            policy_[agent_id][skey][action] = new_q;
            SessionStats& stats = sessions_[agent_id];
            stats.experiences++;
            stats.reward_sum += reward;
            session_count = stats.experiences;
        }

        LOG_DEBUG("[LearningEngine] %s: Q(%s, %s) %.4f -> %.4f", agent_id.c_str(), skey.c_str(),
                  action.c_str(), old_q, new_q);
    } catch (const std::exception& e) {
        // Non-UTF-8 text in a state fails serialization
        LOG_WARN("[LearningEngine] Experience for %s not recorded: %s", agent_id.c_str(), e.what());
        return Status::fail(ErrorCode::VALIDATION, e.what());
    }

    int frequency = ctx_.config.learning.update_frequency;
    if (frequency > 0 && session_count % frequency == 0) {
        take_snapshot(agent_id, session_count);
    }
    return Status::ok();
}

void LearningEngine::take_snapshot(const std::string& agent_id, int64_t session_count) {
    Json metrics;
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        const SessionStats& stats = sessions_[agent_id];
        size_t pairs = 0;
        double q_sum = 0.0;
        const ActionTable& table = policy_[agent_id];
        for (const auto& st : table) {
            for (const auto& act : st.second) {
                pairs++;
                q_sum += act.second;
            }
        }
        metrics["sessionExperiences"] = stats.experiences;
        metrics["averageReward"] = stats.experiences > 0 ? stats.reward_sum / static_cast<double>(stats.experiences) : 0.0;
        metrics["states"] = table.size();
        metrics["stateActionPairs"] = pairs;
        metrics["averageQValue"] = pairs > 0 ? q_sum / static_cast<double>(pairs) : 0.0;
    }
    metrics["learningRate"] = ctx_.config.learning.learning_rate;
    metrics["discountFactor"] = ctx_.config.learning.discount_factor;
    metrics["explorationRate"] = ctx_.config.learning.exploration_rate;

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    Statement stmt(ctx_.db,
        "INSERT INTO learning_history (agent_id, metrics, session_experiences, created_at) VALUES (?, ?, ?, ?)");
    stmt.bind_text(1, agent_id);
    stmt.bind_text(2, metrics.dump());
    stmt.bind_int64(3, session_count);
    stmt.bind_int64(4, ctx_.now_ms());
    if (!stmt.run()) {
        LOG_WARN("[LearningEngine] Snapshot for %s failed: %s", agent_id.c_str(), stmt.error().c_str());
        return;
    }
    LOG_INFO("[LearningEngine] Snapshot for %s after %lld experiences", agent_id.c_str(),
             static_cast<long long>(session_count));
}

int64_t LearningEngine::get_total_experiences(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    auto it = sessions_.find(agent_id);
    return it == sessions_.end() ? 0 : it->second.experiences;
}

Result<int64_t> LearningEngine::count_experiences(const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM learning_experiences WHERE agent_id = ?");
    stmt.bind_text(1, agent_id);
    if (!stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

// ============================================================================
// Policy
// ============================================================================

Result<int64_t> LearningEngine::restore_on_init(const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT state_key, action_key, value FROM q_values WHERE agent_id = ?");
    if (!stmt.ok()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, agent_id);

    ActionTable table;
    int64_t loaded = 0;
    while (stmt.step_row()) {
        table[stmt.column_text(0)][stmt.column_text(1)] = stmt.column_double(2);
        loaded++;
    }
    if (!stmt.error().empty()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }

    {
        std::lock_guard<std::mutex> plock(policy_mutex_);
        policy_[agent_id] = table;
    }
    LOG_INFO("[LearningEngine] Restored %lld Q-values for %s", static_cast<long long>(loaded), agent_id.c_str());
    return Result<int64_t>::ok(loaded);
}

Result<StrategyRecommendation> LearningEngine::recommend_strategy(const std::string& agent_id,
                                                                  const TaskState& state) {
    StrategyRecommendation rec;
    std::string skey = state_key(state);

    std::vector<std::pair<std::string, double>> ranked;
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        auto agent_it = policy_.find(agent_id);
        if (agent_it != policy_.end()) {
            auto state_it = agent_it->second.find(skey);
            if (state_it != agent_it->second.end()) {
                ranked.assign(state_it->second.begin(), state_it->second.end());
            }
        }
    }

    if (ranked.empty()) {
        rec.strategy = "default";
        rec.confidence = 0.5;
        rec.expected_value = 0.0;
        rec.reasoning = "No learned strategies available";
        return Result<StrategyRecommendation>::ok(rec);
    }

    // stable: equal values keep action-name order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
                         return a.second > b.second;
                     });

    rec.strategy = ranked[0].first;
    rec.expected_value = ranked[0].second;
    rec.confidence = confidence_from_q(ranked[0].second);
    for (size_t i = 1; i < ranked.size() && i <= 3; ++i) {
        rec.alternatives.push_back(ranked[i].first);
    }
    std::ostringstream why;
    why << "Learned from " << ranked.size() << " action(s) in state " << skey
        << "; best Q-value " << ranked[0].second;
    rec.reasoning = why.str();
    return Result<StrategyRecommendation>::ok(rec);
}

Result<std::string> LearningEngine::best_action(const std::string& agent_id, const TaskState& state,
                                                const std::vector<std::string>& actions) {
    if (actions.empty()) {
        return Result<std::string>::fail(ErrorCode::VALIDATION, "no candidate actions");
    }
    std::string skey = state_key(state);

    std::lock_guard<std::mutex> lock(policy_mutex_);
    const std::map<std::string, double>* values = nullptr;
    auto agent_it = policy_.find(agent_id);
    if (agent_it != policy_.end()) {
        auto state_it = agent_it->second.find(skey);
        if (state_it != agent_it->second.end()) {
            values = &state_it->second;
        }
    }

    std::string best = actions[0];
    double best_value = 0.0;
    bool first = true;
    for (const auto& action : actions) {
        double v = 0.0;
        if (values) {
            auto it = values->find(action);
            if (it != values->end()) v = it->second;
        }
        if (first || v > best_value) {
            best = action;
            best_value = v;
            first = false;
        }
    }
    return Result<std::string>::ok(best);
}

Result<double> LearningEngine::get_q_value(const std::string& agent_id, const TaskState& state,
                                           const std::string& action) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<double>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db,
        "SELECT value FROM q_values WHERE agent_id = ? AND state_key = ? AND action_key = ?");
    stmt.bind_text(1, agent_id);
    stmt.bind_text(2, state_key(state));
    stmt.bind_text(3, action);
    if (stmt.step_row()) {
        return Result<double>::ok(stmt.column_double(0));
    }
    if (!stmt.error().empty()) {
        return Result<double>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<double>::ok(0.0);
}

Status LearningEngine::reset_agent(const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "DELETE FROM q_values WHERE agent_id = ?");
    stmt.bind_text(1, agent_id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    int removed = ctx_.db.changes();
    {
        std::lock_guard<std::mutex> plock(policy_mutex_);
        policy_.erase(agent_id);
        sessions_.erase(agent_id);
    }
    LOG_INFO("[LearningEngine] Reset %s (%d Q-values removed)", agent_id.c_str(), removed);
    return Status::ok();
}

Result<int64_t> LearningEngine::count_snapshots(const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM learning_history WHERE agent_id = ?");
    stmt.bind_text(1, agent_id);
    if (!stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<std::vector<LearningSnapshot>> LearningEngine::snapshots(const std::string& agent_id, int limit) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<LearningSnapshot>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db,
        "SELECT id, agent_id, metrics, session_experiences, created_at FROM learning_history "
        "WHERE agent_id = ? ORDER BY id DESC LIMIT ?");
    stmt.bind_text(1, agent_id);
    stmt.bind_int64(2, limit > 0 ? limit : 20);
    std::vector<LearningSnapshot> out;
    while (stmt.step_row()) {
        LearningSnapshot s;
        s.id = stmt.column_int64(0);
        s.agent_id = stmt.column_text(1);
        s.metrics = Json::parse(stmt.column_text(2), nullptr, false);
        if (s.metrics.is_discarded()) s.metrics = Json::object();
        s.session_experiences = stmt.column_int64(3);
        s.created_at = stmt.column_int64(4);
        out.push_back(s);
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<LearningSnapshot>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<LearningSnapshot>>::ok(std::move(out));
}

Result<int64_t> LearningEngine::count_q_values() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM q_values");
    if (!stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
