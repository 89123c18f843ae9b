/*
 * HiveMem C++ - GOAP planner Implementation
 */
#include <hivemem/planning/goap_planner.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <algorithm>
#include <chrono>
#include <map>
#include <queue>
#include <set>

namespace hivemem {

namespace {

struct SearchNode {
    Json state;
    std::string key;
    double g;
    int parent;
    int action;
    int depth;
};

struct OpenEntry {
    double f;
    double h;
    int seq;
    int node;

    // priority_queue is a max-heap: invert for lowest f, then lowest h, then FIFO
    bool operator<(const OpenEntry& o) const {
        if (f != o.f) return f > o.f;
        if (h != o.h) return h > o.h;
        return seq > o.seq;
    }
};

bool contains_value(const Json& array, const Json& value) {
    return array.is_array() && std::find(array.begin(), array.end(), value) != array.end();
}

double number_or(const Json* value, double fallback) {
    return (value && value->is_number()) ? value->get<double>() : fallback;
}

} // anonymous namespace

// ============================================================================
// State paths
// ============================================================================

const Json* GoapPlanner::get_path(const Json& state, const std::string& path) {
    const Json* current = &state;
    for (const auto& part : split(path, '.')) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(part);
        if (it == current->end()) return nullptr;
        current = &(*it);
    }
    return current;
}

void GoapPlanner::set_path(Json& state, const std::string& path, const Json& value) {
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    Json* current = &state;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current->is_object()) *current = Json::object();
        current = &(*current)[parts[i]];
    }
    if (!current->is_object()) *current = Json::object();
    (*current)[parts.back()] = value;
}

// ============================================================================
// Conditions
// ============================================================================

bool GoapPlanner::check_condition(const Json* value, const Json& condition) const {
    static const Json missing;
    const Json& v = value ? *value : missing;

    // Shorthand {"key": literal} means eq
    if (!condition.is_object()) {
        return v == condition;
    }

    for (auto it = condition.begin(); it != condition.end(); ++it) {
        const std::string& op = it.key();
        const Json& operand = it.value();

        if (op == "gte" || op == "gt" || op == "lte" || op == "lt") {
            if (!v.is_number() || !operand.is_number()) return false;
            double a = v.get<double>();
            double b = operand.get<double>();
            if (op == "gte" && !(a >= b)) return false;
            if (op == "gt" && !(a > b)) return false;
            if (op == "lte" && !(a <= b)) return false;
            if (op == "lt" && !(a < b)) return false;
        } else if (op == "eq") {
            if (v != operand) return false;
        } else if (op == "ne") {
            if (v == operand) return false;
        } else if (op == "contains") {
            if (!contains_value(v, operand)) return false;
        } else if (op == "exists") {
            bool exists = value != nullptr && !value->is_null();
            if (operand.is_boolean() && operand.get<bool>() != exists) return false;
        } else if (op == "in") {
            if (!contains_value(operand, v)) return false;
        } else {
            LOG_DEBUG("[GoapPlanner] Unknown condition operator '%s'", op.c_str());
            return false;
        }
    }
    return true;
}

bool GoapPlanner::conditions_met(const Json& state, const Json& conditions) const {
    if (!conditions.is_object()) return true;
    for (auto it = conditions.begin(); it != conditions.end(); ++it) {
        if (!check_condition(get_path(state, it.key()), it.value())) {
            return false;
        }
    }
    return true;
}

double GoapPlanner::heuristic(const Json& state, const Json& goal) const {
    double distance = 0.0;
    if (!goal.is_object()) return distance;

    for (auto it = goal.begin(); it != goal.end(); ++it) {
        const Json* value = get_path(state, it.key());
        const Json& cond = it.value();
        if (!cond.is_object()) {
            if (!value || *value != cond) distance += 1.0;
            continue;
        }
        bool numeric = value && value->is_number();
        double current = number_or(value, 0.0);

        if (cond.contains("gte") && cond["gte"].is_number() && numeric && current < cond["gte"].get<double>()) {
            distance += (cond["gte"].get<double>() - current) / 100.0;
        }
        if (cond.contains("gt") && cond["gt"].is_number() && numeric && current <= cond["gt"].get<double>()) {
            distance += (cond["gt"].get<double>() - current + 1.0) / 100.0;
        }
        if (cond.contains("lte") && cond["lte"].is_number() && numeric && current > cond["lte"].get<double>()) {
            distance += (current - cond["lte"].get<double>()) / 100.0;
        }
        if (cond.contains("lt") && cond["lt"].is_number() && numeric && current >= cond["lt"].get<double>()) {
            distance += (current - cond["lt"].get<double>() + 1.0) / 100.0;
        }
        if (cond.contains("eq") && (!value || *value != cond["eq"])) {
            distance += 1.0;
        }
        if (cond.contains("ne") && value && *value == cond["ne"]) {
            distance += 1.0;
        }
        if (cond.contains("contains") && value && value->is_array() && !contains_value(*value, cond["contains"])) {
            distance += 1.0;
        }
        if (cond.contains("exists") && cond["exists"].is_boolean()) {
            bool exists = value && !value->is_null();
            if (cond["exists"].get<bool>() != exists) distance += 1.0;
        }
    }
    return distance;
}

// ============================================================================
// Effects
// ============================================================================

void GoapPlanner::apply_effect(Json& state, const std::string& path, const Json& effect) const {
    if (!effect.is_object()) {
        set_path(state, path, effect);
        return;
    }

    if (effect.contains("set")) {
        set_path(state, path, effect["set"]);
    }

    const Json* current = get_path(state, path);
    bool numeric = !current || current->is_number();   // absent counts as 0
    double value = number_or(current, 0.0);

    if (effect.contains("increase") && effect["increase"].is_number() && numeric) {
        set_path(state, path, std::min(100.0, value + effect["increase"].get<double>()));
    }
    if (effect.contains("decrease") && effect["decrease"].is_number() && numeric) {
        set_path(state, path, std::max(0.0, value - effect["decrease"].get<double>()));
    }
    if (effect.contains("increment") && effect["increment"].is_number() && numeric) {
        set_path(state, path, value + effect["increment"].get<double>());
    }
    if (effect.contains("decrement") && effect["decrement"].is_number() && numeric) {
        set_path(state, path, std::max(0.0, value - effect["decrement"].get<double>()));
    }

    if (effect.contains("add")) {
        const Json* list = get_path(state, path);
        Json arr = (list && list->is_array()) ? *list : Json::array();
        if ((!list || list->is_array()) && !contains_value(arr, effect["add"])) {
            arr.push_back(effect["add"]);
            set_path(state, path, arr);
        }
    }
    if (effect.contains("remove")) {
        const Json* list = get_path(state, path);
        if (list && list->is_array()) {
            Json arr = Json::array();
            for (const auto& item : *list) {
                if (item != effect["remove"]) arr.push_back(item);
            }
            set_path(state, path, arr);
        }
    }
}

Json GoapPlanner::apply_action(const Json& state, const GoapAction& action) const {
    Json next = state;
    if (!action.effects.is_object()) return next;
    for (auto it = action.effects.begin(); it != action.effects.end(); ++it) {
        apply_effect(next, it.key(), it.value());
    }
    return next;
}

double GoapPlanner::action_cost(const GoapAction& action) const {
    double cost = action.cost;
    if (action.success_rate > 0.0 && action.success_rate < 1.0) {
        cost /= action.success_rate;
    }
    return cost;
}

// ============================================================================
// A* Search
// ============================================================================

Result<PlanSearchResult> GoapPlanner::plan(const Json& current_state, const Json& goal_conditions,
                                           const std::vector<GoapAction>& actions,
                                           const PlanConstraints& constraints) const {
    if (!current_state.is_object() || !goal_conditions.is_object()) {
        return Result<PlanSearchResult>::fail(ErrorCode::VALIDATION, "state and goal must be JSON objects");
    }

    std::set<std::string> allowed(constraints.allowed_categories.begin(), constraints.allowed_categories.end());
    std::set<std::string> excluded(constraints.excluded_actions.begin(), constraints.excluded_actions.end());
    std::vector<const GoapAction*> usable;
    for (const auto& a : actions) {
        if (excluded.count(a.id)) continue;
        if (!allowed.empty() && !allowed.count(a.category)) continue;
        usable.push_back(&a);
    }

    auto started = std::chrono::steady_clock::now();
    std::vector<SearchNode> nodes;
    std::priority_queue<OpenEntry> open;
    std::map<std::string, double> best_g;
    std::set<std::string> closed;
    int seq = 0;

    SearchNode start;
    start.state = current_state;
    start.key = current_state.dump();
    start.g = 0.0;
    start.parent = -1;
    start.action = -1;
    start.depth = 0;
    nodes.push_back(start);
    best_g[start.key] = 0.0;
    double h0 = heuristic(current_state, goal_conditions);
    open.push(OpenEntry{h0, h0, seq++, 0});

    int iterations = 0;
    while (!open.empty() && iterations < constraints.max_iterations) {
        iterations++;

        int64_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        if (elapsed > constraints.timeout_ms) {
            LOG_WARN("[GoapPlanner] Planning timeout after %lld ms (%d iterations)",
                     static_cast<long long>(elapsed), iterations);
            break;
        }

        OpenEntry top = open.top();
        open.pop();
        int idx = top.node;
        // Copies: nodes may reallocate while expanding
        Json state = nodes[idx].state;
        std::string key = nodes[idx].key;
        double g = nodes[idx].g;
        int depth = nodes[idx].depth;

        if (closed.count(key) || g > best_g[key]) continue;

        if (conditions_met(state, goal_conditions)) {
            PlanSearchResult result;
            result.total_cost = g;
            result.iterations = iterations;
            result.final_state = state;
            for (int n = idx; nodes[n].parent >= 0; n = nodes[n].parent) {
                result.actions.push_back(*usable[nodes[n].action]);
            }
            std::reverse(result.actions.begin(), result.actions.end());
            LOG_DEBUG("[GoapPlanner] Plan found: %zu actions, cost %.2f, %d iterations",
                      result.actions.size(), result.total_cost, iterations);
            return Result<PlanSearchResult>::ok(result);
        }

        closed.insert(key);
        if (depth >= constraints.max_plan_length) continue;

        for (size_t ai = 0; ai < usable.size(); ++ai) {
            const GoapAction& action = *usable[ai];
            if (!conditions_met(state, action.preconditions)) continue;

            Json next = apply_action(state, action);
            std::string next_key = next.dump();
            if (closed.count(next_key)) continue;

            double next_g = g + action_cost(action);
            auto known = best_g.find(next_key);
            if (known != best_g.end() && next_g >= known->second) continue;
            best_g[next_key] = next_g;

            SearchNode child;
            child.state = next;
            child.key = next_key;
            child.g = next_g;
            child.parent = idx;
            child.action = static_cast<int>(ai);
            child.depth = depth + 1;
            nodes.push_back(child);

            double h = heuristic(next, goal_conditions);
            open.push(OpenEntry{next_g + h, h, seq++, static_cast<int>(nodes.size() - 1)});
        }
    }

    LOG_WARN("[GoapPlanner] No plan found (%d iterations, %zu states closed)", iterations, closed.size());
    return Result<PlanSearchResult>::fail(ErrorCode::NOT_FOUND, "no plan reaches the goal");
}

} // namespace hivemem
