/*
 * HiveMem C++ - Learning engine tests
 */
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <limits>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace hivemem;
using namespace hivemem::testing;

static TaskState make_state(double complexity, const std::string& capability) {
    TaskState s;
    s.task_complexity = complexity;
    s.required_capabilities.push_back(capability);
    s.available_resources = 0.8;
    return s;
}

void test_state_key() {
    std::cout << "Testing state discretization..." << std::endl;

    TaskState a = make_state(0.1, "Build");
    a.required_capabilities.push_back(" test ");
    TaskState b = make_state(0.2, "test");
    b.required_capabilities.push_back("build");
    assert(LearningEngine::state_key(a) == LearningEngine::state_key(b));

    TaskState c = b;
    c.previous_attempts = 7;
    TaskState d = b;
    d.previous_attempts = 3;
    assert(LearningEngine::state_key(c) == LearningEngine::state_key(d));
    assert(LearningEngine::state_key(c) != LearningEngine::state_key(b));
    assert(LearningEngine::state_key(make_state(0.9, "build")) != LearningEngine::state_key(make_state(0.1, "build")));

    std::cout << "  PASS" << std::endl;
}

void test_q_update_constant_rate() {
    std::cout << "Testing constant-rate Q update..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    LearningEngine& learning = engine->learning();

    TaskState s = make_state(0.1, "build");
    TaskState next = make_state(0.9, "build");

    assert(learning.record_experience("coder", s, "compile", 1.0, next));
    assert(near(learning.get_q_value("coder", s, "compile").value, 0.1));
    assert(learning.record_experience("coder", s, "compile", 1.0, next));
    assert(near(learning.get_q_value("coder", s, "compile").value, 0.19));

    assert(near(learning.get_q_value("coder", s, "unknown").value, 0.0));
    assert(learning.get_total_experiences("coder") == 2);
    assert(learning.count_experiences("coder").value == 2);

    std::cout << "  PASS" << std::endl;
}

void test_harmonic_rate_is_order_independent() {
    std::cout << "Testing harmonic learning rate..." << std::endl;

    ManualClock clock;
    EngineConfig cfg = memory_config();
    cfg.learning.rate_schedule = RateSchedule::HARMONIC;
    auto engine = start_engine(clock, cfg);
    LearningEngine& learning = engine->learning();

    TaskState s = make_state(0.1, "review");
    TaskState terminal = make_state(0.9, "review");

    const double forward[] = {1.0, 0.0, 0.5, 0.2};
    const double backward[] = {0.2, 0.5, 0.0, 1.0};
    for (int i = 0; i < 4; ++i) {
        assert(learning.record_experience("a", s, "approve", forward[i], terminal));
        assert(learning.record_experience("b", s, "approve", backward[i], terminal));
    }

    double qa = learning.get_q_value("a", s, "approve").value;
    double qb = learning.get_q_value("b", s, "approve").value;
    assert(near(qa, 0.425));
    assert(near(qa, qb));

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_updates_to_one_pair() {
    std::cout << "Testing concurrent updates to one state-action pair..." << std::endl;

    ManualClock clock;
    EngineConfig cfg = memory_config();
    cfg.learning.rate_schedule = RateSchedule::HARMONIC;
    auto engine = start_engine(clock, cfg);
    LearningEngine& learning = engine->learning();

    // Harmonic updates toward a terminal state yield the mean reward in any
    // interleaving, so a lost update shows up in both the value and the count
    TaskState s = make_state(0.1, "merge");
    TaskState terminal = make_state(0.9, "merge");
    const int kThreads = 4;
    const int kPerThread = 25;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.push_back(std::thread([&learning, &s, &terminal, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                assert(learning.record_experience("swarm", s, "rebase", t * 0.25, terminal));
            }
        }));
    }
    for (auto& w : workers) w.join();

    const int total = kThreads * kPerThread;
    assert(learning.get_total_experiences("swarm") == total);
    assert(learning.count_experiences("swarm").value == total);
    assert(near(learning.get_q_value("swarm", s, "rebase").value, 0.375));

    Database& db = engine->context().db;
    std::lock_guard<std::recursive_mutex> lock(db.mutex());
    Statement stmt(db, "SELECT update_count FROM q_values WHERE agent_id = 'swarm'");
    assert(stmt.step_row());
    assert(stmt.column_int64(0) == total);
    assert(!stmt.step_row());

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_cadence() {
    std::cout << "Testing snapshot cadence..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    LearningEngine& learning = engine->learning();

    TaskState s = make_state(0.5, "deploy");
    for (int i = 0; i < 10; ++i) {
        assert(learning.record_experience("ops", s, "rollout", 0.5, s));
        clock.advance_ms(1);
    }
    assert(learning.count_snapshots("ops").value == 1);

    for (int i = 0; i < 15; ++i) {
        assert(learning.record_experience("ops", s, "rollout", 0.5, s));
    }
    assert(learning.count_snapshots("ops").value == 2);

    Result<std::vector<LearningSnapshot>> snaps = learning.snapshots("ops");
    assert(snaps.success);
    assert(snaps.value.size() == 2);
    assert(snaps.value[0].session_experiences == 20);
    assert(snaps.value[1].session_experiences == 10);
    assert(snaps.value[0].metrics["stateActionPairs"] == 1);
    assert(near(snaps.value[0].metrics["averageReward"].get<double>(), 0.5));
    assert(learning.count_snapshots("nobody").value == 0);

    std::cout << "  PASS" << std::endl;
}

void test_recommendations() {
    std::cout << "Testing strategy recommendations..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    LearningEngine& learning = engine->learning();

    TaskState s = make_state(0.5, "research");
    TaskState next = make_state(0.9, "research");

    Result<StrategyRecommendation> none = learning.recommend_strategy("analyst", s);
    assert(none.success);
    assert(none.value.strategy == "default");
    assert(near(none.value.confidence, 0.5));
    assert(none.value.reasoning == "No learned strategies available");

    assert(learning.record_experience("analyst", s, "survey", 0.2, next));
    assert(learning.record_experience("analyst", s, "deep_dive", 0.9, next));
    assert(learning.record_experience("analyst", s, "skim", -0.5, next));

    Result<StrategyRecommendation> rec = learning.recommend_strategy("analyst", s);
    assert(rec.value.strategy == "deep_dive");
    assert(rec.value.confidence > 0.5);
    assert(rec.value.alternatives.size() == 2);
    assert(rec.value.alternatives[0] == "survey");

    std::vector<std::string> candidates;
    candidates.push_back("skim");
    candidates.push_back("survey");
    candidates.push_back("never_tried");
    assert(learning.best_action("analyst", s, candidates).value == "survey");
    assert(learning.best_action("analyst", s, std::vector<std::string>()).code == ErrorCode::VALIDATION);

    assert(learning.reset_agent("analyst"));
    assert(learning.recommend_strategy("analyst", s).value.strategy == "default");
    assert(near(learning.get_q_value("analyst", s, "deep_dive").value, 0.0));
    assert(learning.count_experiences("analyst").value == 3);

    std::cout << "  PASS" << std::endl;
}

void test_restore_on_init() {
    std::cout << "Testing Q-value restore across restarts..." << std::endl;

    std::string path = "/tmp/hivemem_test_learning_" + std::to_string(getpid()) + ".db";
    std::remove(path.c_str());

    EngineConfig cfg = memory_config();
    cfg.database_path = path;
    TaskState s = make_state(0.5, "triage");
    TaskState next = make_state(0.1, "triage");

    ManualClock clock;
    {
        auto engine = start_engine(clock, cfg);
        assert(engine);
        assert(engine->learning().record_experience("support", s, "escalate", 1.0, next));
        assert(engine->learning().record_experience("support", s, "close", 0.1, next));
        engine->stop();
    }

    {
        auto engine = start_engine(clock, cfg);
        assert(engine);
        LearningEngine& learning = engine->learning();
        // Session counters start over; policy waits for an explicit restore
        assert(learning.get_total_experiences("support") == 0);
        assert(learning.recommend_strategy("support", s).value.strategy == "default");

        Result<int64_t> loaded = learning.restore_on_init("support");
        assert(loaded.success);
        assert(loaded.value == 2);
        assert(learning.recommend_strategy("support", s).value.strategy == "escalate");
        assert(learning.count_experiences("support").value == 2);
        engine->stop();
    }

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_rejected_experiences() {
    std::cout << "Testing rejected and disabled recording..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    LearningEngine& learning = engine->learning();
    TaskState s = make_state(0.5, "x");

    assert(learning.record_experience("", s, "a", 1.0, s).code == ErrorCode::VALIDATION);
    assert(learning.record_experience("agent", s, "", 1.0, s).code == ErrorCode::VALIDATION);
    assert(learning.record_experience("agent", s, "a", std::numeric_limits<double>::quiet_NaN(), s).code ==
           ErrorCode::VALIDATION);
    assert(learning.record_experience("agent", s, "a", std::numeric_limits<double>::infinity(), s).code ==
           ErrorCode::VALIDATION);
    assert(learning.count_experiences("agent").value == 0);

    learning.set_enabled(false);
    assert(learning.record_experience("agent", s, "a", 1.0, s));
    assert(learning.count_experiences("agent").value == 0);
    assert(learning.count_q_values().value == 0);
    learning.set_enabled(true);
    assert(learning.record_experience("agent", s, "a", 1.0, s));
    assert(learning.count_q_values().value == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem Learning Tests ===" << std::endl;

    test_state_key();
    test_q_update_constant_rate();
    test_harmonic_rate_is_order_independent();
    test_concurrent_updates_to_one_pair();
    test_snapshot_cadence();
    test_recommendations();
    test_restore_on_init();
    test_rejected_experiences();

    std::cout << std::endl << "All learning tests passed." << std::endl;
    return 0;
}
