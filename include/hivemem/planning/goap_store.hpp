/*
 * HiveMem C++ - GOAP records
 *
 * Goals, actions and committed plans for goal-oriented action planning.
 * Conditions and effects are JSON objects keyed by dotted state paths:
 *
 *   preconditions: {"tests.coverage": {"lt": 80}, "build.ok": {"eq": true}}
 *   effects:       {"tests.coverage": {"increase": 10}, "flags": {"add": "measured"}}
 */
#ifndef hivemem_PLANNING_GOAP_STORE_HPP
#define hivemem_PLANNING_GOAP_STORE_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct GoapGoal {
    std::string id;
    Json conditions;
    double cost;
    std::string priority;
    int64_t created_at;

    GoapGoal() : conditions(Json::object()), cost(0.0), created_at(0) {}

    Json to_json() const;
    static GoapGoal from_json(const Json& j);
};

struct GoapAction {
    std::string id;
    std::string name;
    Json preconditions;
    Json effects;
    double cost;
    double success_rate;        // (0, 1]; effective cost is cost / success_rate
    std::string agent_type;
    std::string category;
    int64_t created_at;

    GoapAction()
        : preconditions(Json::object()), effects(Json::object())
        , cost(1.0), success_rate(1.0), created_at(0) {}

    Json to_json() const;
    static GoapAction from_json(const Json& j);
};

struct GoapPlan {
    std::string id;
    std::string goal_id;
    std::vector<std::string> sequence;  // action ids in execution order
    double total_cost;
    int64_t created_at;

    GoapPlan() : total_cost(0.0), created_at(0) {}

    Json to_json() const;
};

class GoapStore {
public:
    explicit GoapStore(EngineContext& ctx);

    bool ensure_schema();

    Status store_goal(const GoapGoal& goal);
    Result<GoapGoal> get_goal(const std::string& id);

    Status store_action(const GoapAction& action);
    Result<GoapAction> get_action(const std::string& id);
    // Every action, or those of one category
    Result<std::vector<GoapAction>> list_actions(const std::string& category = "");

    // Plans are immutable: storing an existing id fails with VALIDATION
    Status store_plan(const GoapPlan& plan);
    Result<GoapPlan> get_plan(const std::string& id);

private:
    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_PLANNING_GOAP_STORE_HPP
