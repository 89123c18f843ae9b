/*
 * HiveMem C++ - GOAP planner
 *
 * A* search over JSON world states. Nodes are world states, edges are
 * actions whose preconditions hold; g is the summed effective action cost
 * (cost / successRate) and h a normalized distance to the goal conditions.
 *
 * Condition operators: gte gt lte lt eq ne contains exists in
 * Effect operators:    set increase decrease increment decrement add remove
 */
#ifndef hivemem_PLANNING_GOAP_PLANNER_HPP
#define hivemem_PLANNING_GOAP_PLANNER_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/planning/goap_store.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct PlanConstraints {
    int max_iterations;
    int max_plan_length;
    int64_t timeout_ms;
    std::vector<std::string> allowed_categories;    // empty = any
    std::vector<std::string> excluded_actions;

    PlanConstraints() : max_iterations(10000), max_plan_length(20), timeout_ms(5000) {}
};

struct PlanSearchResult {
    std::vector<GoapAction> actions;
    double total_cost;
    int iterations;
    Json final_state;

    PlanSearchResult() : total_cost(0.0), iterations(0) {}
};

class GoapPlanner {
public:
    GoapPlanner() {}

    // NOT_FOUND when no plan reaches the goal within the limits
    Result<PlanSearchResult> plan(const Json& current_state, const Json& goal_conditions,
                                  const std::vector<GoapAction>& actions,
                                  const PlanConstraints& constraints = PlanConstraints()) const;

    bool conditions_met(const Json& state, const Json& conditions) const;
    Json apply_action(const Json& state, const GoapAction& action) const;
    double heuristic(const Json& state, const Json& goal) const;
    double action_cost(const GoapAction& action) const;

    // Dotted path lookup ("a.b.c"); nullptr when any segment is missing
    static const Json* get_path(const Json& state, const std::string& path);
    static void set_path(Json& state, const std::string& path, const Json& value);

private:
    bool check_condition(const Json* value, const Json& condition) const;
    void apply_effect(Json& state, const std::string& path, const Json& effect) const;
};

} // namespace hivemem

#endif // hivemem_PLANNING_GOAP_PLANNER_HPP
