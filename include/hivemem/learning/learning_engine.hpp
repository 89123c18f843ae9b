/*
 * HiveMem C++ - Learning engine
 *
 * Q-learning state per agent:
 *   learning_experiences  append-only experience log
 *   q_values              one row per (agent, state, action), updated in place
 *   learning_history      aggregate snapshots every update_frequency experiences
 *
 * An experience append and its Q-value upsert commit in one transaction.
 * The in-memory policy mirrors q_values for the agents seen (or restored)
 * in this process.
 */
#ifndef hivemem_LEARNING_LEARNING_ENGINE_HPP
#define hivemem_LEARNING_LEARNING_ENGINE_HPP

#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <hivemem/learning/types.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hivemem {

class LearningEngine {
public:
    explicit LearningEngine(EngineContext& ctx);

    bool init();

    // Never throws; failures are logged and returned
    Status record_experience(const std::string& agent_id, const TaskState& state,
                             const std::string& action, double reward, const TaskState& next_state);

    // Experiences recorded by this process; starts at 0 on every restart
    int64_t get_total_experiences(const std::string& agent_id) const;
    // Persisted experience rows across all sessions
    Result<int64_t> count_experiences(const std::string& agent_id);

    // Loads every persisted Q-value of the agent into the policy table.
    // Returns the number of values loaded.
    Result<int64_t> restore_on_init(const std::string& agent_id);

    Result<StrategyRecommendation> recommend_strategy(const std::string& agent_id, const TaskState& state);

    // Highest-valued action among `actions`; unvisited actions count as 0,
    // ties keep the earlier action
    Result<std::string> best_action(const std::string& agent_id, const TaskState& state,
                                    const std::vector<std::string>& actions);

    // 0 for an unvisited pair
    Result<double> get_q_value(const std::string& agent_id, const TaskState& state, const std::string& action);

    // Drops the agent's Q-values, policy and session counter. Experiences stay.
    Status reset_agent(const std::string& agent_id);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    Result<int64_t> count_snapshots(const std::string& agent_id);
    Result<std::vector<LearningSnapshot>> snapshots(const std::string& agent_id, int limit = 20);

    Result<int64_t> count_q_values();

    // Discretized Q-table key of a task state
    static std::string state_key(const TaskState& state);

private:
    bool ensure_schema();
    double alpha_for(int64_t prior_updates) const;
    void take_snapshot(const std::string& agent_id, int64_t session_count);

    typedef std::map<std::string, std::map<std::string, double>> ActionTable;   // state -> action -> Q

    struct SessionStats {
        int64_t experiences;
        double reward_sum;

        SessionStats() : experiences(0), reward_sum(0.0) {}
    };

    EngineContext& ctx_;
    std::atomic<bool> enabled_;

    std::map<std::string, ActionTable> policy_;         // agent -> table
    std::map<std::string, SessionStats> sessions_;      // agent -> in-process counters
    mutable std::mutex policy_mutex_;
};

} // namespace hivemem

#endif // hivemem_LEARNING_LEARNING_ENGINE_HPP
