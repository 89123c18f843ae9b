/*
 * HiveMem C++ - Test helpers
 *
 * In-memory engines on a manually advanced clock, so TTL and snapshot
 * tests never sleep.
 */
#ifndef hivemem_TESTS_TEST_SUPPORT_HPP
#define hivemem_TESTS_TEST_SUPPORT_HPP

#include <hivemem/core/logger.hpp>
#include <hivemem/engine/engine.hpp>
#include <atomic>
#include <cmath>
#include <memory>

namespace hivemem {
namespace testing {

class ManualClock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000LL)
        : now_(std::make_shared<std::atomic<int64_t>>(start_ms)) {}

    Clock clock() const {
        std::shared_ptr<std::atomic<int64_t>> now = now_;
        return [now]() { return now->load(); };
    }

    int64_t now() const { return now_->load(); }
    void advance_ms(int64_t ms) { now_->fetch_add(ms); }
    void advance_s(int64_t s) { advance_ms(s * 1000); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_;
};

inline EngineConfig memory_config() {
    EngineConfig cfg;
    cfg.database_path = ":memory:";
    cfg.sweep_interval_ms = 3600000;    // sweeps are driven by the tests
    return cfg;
}

// Started engine over ":memory:" using clock
inline std::unique_ptr<Engine> start_engine(const ManualClock& clock,
                                            const EngineConfig& cfg = memory_config()) {
    std::unique_ptr<Engine> engine(new Engine(cfg));
    engine->set_clock(clock.clock());
    Status s = engine->start();
    if (!s) {
        LOG_ERROR("[Test] Engine failed to start: %s", s.error.c_str());
        return std::unique_ptr<Engine>();
    }
    return engine;
}

inline bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) <= eps;
}

inline void quiet_logs() {
    Logger::instance().set_level(LogLevel::WARN);
}

} // namespace testing
} // namespace hivemem

#endif // hivemem_TESTS_TEST_SUPPORT_HPP
