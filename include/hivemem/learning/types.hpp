/*
 * HiveMem C++ - Learning types
 */
#ifndef hivemem_LEARNING_TYPES_HPP
#define hivemem_LEARNING_TYPES_HPP

#include <hivemem/core/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace hivemem {

enum class RateSchedule {
    CONSTANT,       // alpha = learning_rate
    HARMONIC        // alpha = 1 / update_count (sample average)
};

struct LearningConfig {
    bool enabled;
    double learning_rate;
    double discount_factor;
    double exploration_rate;
    RateSchedule rate_schedule;
    int update_frequency;       // snapshot every N experiences per agent

    LearningConfig()
        : enabled(true)
        , learning_rate(0.1)
        , discount_factor(0.95)
        , exploration_rate(0.3)
        , rate_schedule(RateSchedule::CONSTANT)
        , update_frequency(10)
    {}
};

// Observed task situation; discretized into a state key for the Q-table
struct TaskState {
    double task_complexity;                     // [0, 1]
    std::vector<std::string> required_capabilities;
    Json context_features;                      // object of scalar features
    int previous_attempts;
    double available_resources;                 // [0, 1]

    TaskState()
        : task_complexity(0.5)
        , context_features(Json::object())
        , previous_attempts(0)
        , available_resources(1.0)
    {}

    Json to_json() const;
    static TaskState from_json(const Json& j);
};

struct LearningExperience {
    int64_t id;
    std::string agent_id;
    std::string state_key;
    std::string action;
    double reward;
    std::string next_state_key;
    Json state;
    Json next_state;
    int64_t timestamp;

    LearningExperience() : id(0), reward(0.0), timestamp(0) {}
};

struct QValue {
    std::string agent_id;
    std::string state_key;
    std::string action_key;
    double value;
    int64_t update_count;
    int64_t updated_at;

    QValue() : value(0.0), update_count(0), updated_at(0) {}
};

struct StrategyRecommendation {
    std::string strategy;
    double confidence;
    double expected_value;
    std::string reasoning;
    std::vector<std::string> alternatives;

    StrategyRecommendation() : confidence(0.0), expected_value(0.0) {}

    Json to_json() const;
};

struct LearningSnapshot {
    int64_t id;
    std::string agent_id;
    Json metrics;
    int64_t session_experiences;
    int64_t created_at;

    LearningSnapshot() : id(0), session_experiences(0), created_at(0) {}
};

} // namespace hivemem

#endif // hivemem_LEARNING_TYPES_HPP
