/*
 * HiveMem C++ - Engine
 *
 * Owns the database context and every subsystem, wires them together and
 * runs the background maintenance timers (TTL sweep, consolidation). The
 * sync transport exists only while sync is enabled.
 */
#ifndef hivemem_ENGINE_ENGINE_HPP
#define hivemem_ENGINE_ENGINE_HPP

#include <hivemem/coordination/agent_registry.hpp>
#include <hivemem/coordination/blackboard.hpp>
#include <hivemem/coordination/consensus_store.hpp>
#include <hivemem/coordination/event_log.hpp>
#include <hivemem/coordination/workflow_store.hpp>
#include <hivemem/core/periodic_timer.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <hivemem/learning/learning_engine.hpp>
#include <hivemem/memory/manager.hpp>
#include <hivemem/patterns/pattern_bank.hpp>
#include <hivemem/planning/goap_planner.hpp>
#include <hivemem/planning/goap_store.hpp>
#include <hivemem/sync/sync_transport.hpp>
#include <memory>
#include <string>

namespace hivemem {

// Rows removed by one sweep pass
struct SweepReport {
    int entries;
    int hints;
    int events;
    int proposals;

    SweepReport() : entries(0), hints(0), events(0), proposals(0) {}

    int total() const { return entries + hints + events + proposals; }
};

class Engine {
public:
    explicit Engine(const EngineConfig& config);
    ~Engine();

    // Opens the database, creates every table, starts the timers and,
    // when configured, the sync transport
    Status start();
    void stop();
    bool is_started() const { return started_; }

    // Replaces the wall clock; call before start()
    void set_clock(const Clock& clock) { ctx_.clock = clock; }

    SweepReport sweep_expired();
    // One pattern consolidation pass; also run by the consolidation timer
    void run_consolidation();
    Result<MemoryStats> stats();

    Status enable_sync(const SyncConfig& config);
    void disable_sync();
    // nullptr while sync is disabled
    SyncTransport* sync() { return sync_.get(); }

    MemoryManager& memory() { return memory_; }
    Blackboard& blackboard() { return blackboard_; }
    EventLog& events() { return events_; }
    WorkflowStore& workflows() { return workflows_; }
    ConsensusStore& consensus() { return consensus_; }
    AgentRegistry& agents() { return agents_; }
    PatternBank& patterns() { return patterns_; }
    LearningEngine& learning() { return learning_; }
    GoapStore& goap() { return goap_; }
    const GoapPlanner& planner() const { return planner_; }

    EngineContext& context() { return ctx_; }
    const EngineConfig& config() const { return ctx_.config; }

private:
    Engine(const Engine&);
    Engine& operator=(const Engine&);

    Result<int64_t> count_rows(const std::string& table, const std::string& where = "");

    EngineContext ctx_;
    MemoryManager memory_;
    Blackboard blackboard_;
    EventLog events_;
    WorkflowStore workflows_;
    ConsensusStore consensus_;
    AgentRegistry agents_;
    PatternBank patterns_;
    LearningEngine learning_;
    GoapStore goap_;
    GoapPlanner planner_;
    std::unique_ptr<SyncTransport> sync_;

    PeriodicTimer sweep_timer_;
    PeriodicTimer consolidation_timer_;
    bool started_;
};

} // namespace hivemem

#endif // hivemem_ENGINE_ENGINE_HPP
