/*
 * HiveMem C++ - GOAP planner and store tests
 */
#include "test_support.hpp"
#include <iostream>
#include <cassert>

using namespace hivemem;
using namespace hivemem::testing;

static GoapAction make_action(const std::string& id, const Json& pre, const Json& effects,
                              double cost, double success_rate = 1.0, const std::string& category = "") {
    GoapAction a;
    a.id = id;
    a.name = id;
    a.preconditions = pre;
    a.effects = effects;
    a.cost = cost;
    a.success_rate = success_rate;
    a.category = category;
    return a;
}

static std::vector<GoapAction> ci_actions() {
    std::vector<GoapAction> actions;
    actions.push_back(make_action("build", Json::object(),
                                  Json::parse(R"({"build.ok": {"set": true}})"), 1.0, 1.0, "ci"));
    actions.push_back(make_action("write_tests", Json::parse(R"({"build.ok": {"eq": true}})"),
                                  Json::parse(R"({"tests.coverage": {"increase": 10}})"), 2.0, 1.0, "dev"));
    actions.push_back(make_action("bulk_tests", Json::parse(R"({"build.ok": true})"),
                                  Json::parse(R"({"tests.coverage": {"increase": 20}})"), 3.0, 0.5, "dev"));
    return actions;
}

void test_conditions() {
    std::cout << "Testing GOAP conditions..." << std::endl;

    GoapPlanner planner;
    Json state = Json::parse(R"({
        "tests": {"coverage": 65},
        "build": {"ok": true, "target": "release"},
        "flags": ["linted", "formatted"]
    })");

    assert(planner.conditions_met(state, Json::parse(R"({"tests.coverage": {"gte": 60, "lt": 70}})")));
    assert(!planner.conditions_met(state, Json::parse(R"({"tests.coverage": {"gt": 65}})")));
    assert(planner.conditions_met(state, Json::parse(R"({"build.ok": true, "build.target": {"ne": "debug"}})")));
    assert(planner.conditions_met(state, Json::parse(R"({"flags": {"contains": "linted"}})")));
    assert(planner.conditions_met(state, Json::parse(R"({"build.target": {"in": ["release", "beta"]}})")));
    assert(planner.conditions_met(state, Json::parse(R"({"deploy.id": {"exists": false}})")));
    assert(!planner.conditions_met(state, Json::parse(R"({"build.ok": {"exists": false}})")));
    assert(!planner.conditions_met(state, Json::parse(R"({"build.ok": {"between": [1, 2]}})")));

    const Json* coverage = GoapPlanner::get_path(state, "tests.coverage");
    assert(coverage && *coverage == 65);
    assert(GoapPlanner::get_path(state, "tests.coverage.value") == nullptr);
    assert(GoapPlanner::get_path(state, "nothing.here") == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_effects() {
    std::cout << "Testing GOAP effects..." << std::endl;

    GoapPlanner planner;
    Json state = Json::parse(R"({"tests": {"coverage": 95}, "budget": 3, "flags": ["a", "b"]})");

    GoapAction a = make_action("mixed", Json::object(), Json::parse(R"({
        "tests.coverage": {"increase": 10},
        "budget": {"decrement": 5},
        "flags": {"add": "c"},
        "retries": {"increment": 1},
        "build.ok": true
    })"), 1.0);
    Json next = planner.apply_action(state, a);

    assert(next["tests"]["coverage"] == 100.0);     // capped
    assert(next["budget"] == 0.0);                  // floored
    assert(next["flags"].size() == 3);
    assert(next["retries"] == 1.0);                 // absent counts as 0
    assert(next["build"]["ok"] == true);
    assert(state["tests"]["coverage"] == 95);       // input untouched

    GoapAction b = make_action("cleanup", Json::object(),
                               Json::parse(R"({"flags": {"remove": "a"}, "tests.coverage": {"decrease": 200}})"), 1.0);
    Json after = planner.apply_action(next, b);
    assert(after["flags"].size() == 2);
    assert(after["flags"][0] == "b");
    assert(after["tests"]["coverage"] == 0.0);

    // add on an existing element is a no-op
    GoapAction dup = make_action("dup", Json::object(), Json::parse(R"({"flags": {"add": "b"}})"), 1.0);
    assert(planner.apply_action(after, dup)["flags"].size() == 2);

    assert(near(planner.action_cost(make_action("x", Json::object(), Json::object(), 3.0, 0.5)), 6.0));
    assert(near(planner.action_cost(make_action("y", Json::object(), Json::object(), 3.0, 1.0)), 3.0));

    std::cout << "  PASS" << std::endl;
}

void test_plan_search() {
    std::cout << "Testing A* plan search..." << std::endl;

    GoapPlanner planner;
    Json start = Json::parse(R"({"tests": {"coverage": 50}, "build": {"ok": false}})");
    Json goal = Json::parse(R"({"tests.coverage": {"gte": 70}, "build.ok": true})");
    std::vector<GoapAction> actions = ci_actions();

    // bulk_tests costs 3 / 0.5 = 6, so two cheaper steps win
    Result<PlanSearchResult> best = planner.plan(start, goal, actions);
    assert(best.success);
    assert(best.value.actions.size() == 3);
    assert(best.value.actions[0].id == "build");
    assert(best.value.actions[1].id == "write_tests");
    assert(best.value.actions[2].id == "write_tests");
    assert(near(best.value.total_cost, 5.0));
    assert(best.value.final_state["tests"]["coverage"] == 70.0);
    assert(best.value.iterations > 0);

    PlanConstraints no_small;
    no_small.excluded_actions.push_back("write_tests");
    Result<PlanSearchResult> bulk = planner.plan(start, goal, actions, no_small);
    assert(bulk.success);
    assert(bulk.value.actions.size() == 2);
    assert(bulk.value.actions[1].id == "bulk_tests");
    assert(near(bulk.value.total_cost, 7.0));

    PlanConstraints ci_only;
    ci_only.allowed_categories.push_back("ci");
    assert(planner.plan(start, goal, actions, ci_only).code == ErrorCode::NOT_FOUND);

    PlanConstraints short_plans;
    short_plans.excluded_actions.push_back("bulk_tests");
    short_plans.max_plan_length = 2;
    assert(planner.plan(start, goal, actions, short_plans).code == ErrorCode::NOT_FOUND);

    // Already satisfied: empty plan
    Result<PlanSearchResult> done = planner.plan(best.value.final_state, goal, actions);
    assert(done.success);
    assert(done.value.actions.empty());
    assert(near(done.value.total_cost, 0.0));

    assert(planner.plan(Json::array(), goal, actions).code == ErrorCode::VALIDATION);

    std::cout << "  PASS" << std::endl;
}

void test_goap_store() {
    std::cout << "Testing GOAP store..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    GoapStore& store = engine->goap();

    GoapGoal goal;
    goal.id = "release-ready";
    goal.conditions = Json::parse(R"({"tests.coverage": {"gte": 70}})");
    goal.priority = "high";
    assert(store.store_goal(goal));
    Result<GoapGoal> loaded_goal = store.get_goal("release-ready");
    assert(loaded_goal.success);
    assert(loaded_goal.value.conditions == goal.conditions);
    assert(loaded_goal.value.priority == "high");
    assert(store.get_goal("missing").code == ErrorCode::NOT_FOUND);

    for (const auto& a : ci_actions()) {
        assert(store.store_action(a));
    }
    assert(store.list_actions().value.size() == 3);
    assert(store.list_actions("dev").value.size() == 2);
    Result<GoapAction> bulk = store.get_action("bulk_tests");
    assert(bulk.success);
    assert(near(bulk.value.success_rate, 0.5));
    assert(bulk.value.effects == ci_actions()[2].effects);
    assert(store.get_action("missing").code == ErrorCode::NOT_FOUND);

    assert(store.store_action(make_action("", Json::object(), Json::object(), 1.0)).code == ErrorCode::VALIDATION);
    assert(store.store_action(make_action("z", Json::object(), Json::object(), 1.0, 0.0)).code ==
           ErrorCode::VALIDATION);
    assert(store.store_action(make_action("z", Json::array(), Json::object(), 1.0)).code == ErrorCode::VALIDATION);

    // Stored actions feed the planner directly
    Json start = Json::parse(R"({"tests": {"coverage": 50}, "build": {"ok": false}})");
    Result<PlanSearchResult> found =
        engine->planner().plan(start, goal.conditions, store.list_actions().value);
    assert(found.success);

    GoapPlan plan;
    plan.id = "plan-1";
    plan.goal_id = goal.id;
    for (const auto& a : found.value.actions) {
        plan.sequence.push_back(a.id);
    }
    plan.total_cost = found.value.total_cost;
    assert(store.store_plan(plan));

    Result<GoapPlan> stored = store.get_plan("plan-1");
    assert(stored.success);
    assert(stored.value.sequence == plan.sequence);
    assert(near(stored.value.total_cost, plan.total_cost));

    // Committed plans are immutable
    plan.total_cost = 99.0;
    assert(store.store_plan(plan).code == ErrorCode::VALIDATION);
    assert(near(store.get_plan("plan-1").value.total_cost, found.value.total_cost));
    assert(store.get_plan("plan-2").code == ErrorCode::NOT_FOUND);

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem GOAP Tests ===" << std::endl;

    test_conditions();
    test_effects();
    test_plan_search();
    test_goap_store();

    std::cout << std::endl << "All GOAP tests passed." << std::endl;
    return 0;
}
