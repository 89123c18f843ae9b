/*
 * HiveMem C++ - Engine Implementation
 */
#include <hivemem/engine/engine.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <exception>

namespace hivemem {

Engine::Engine(const EngineConfig& config)
    : ctx_(config)
    , memory_(ctx_)
    , blackboard_(ctx_)
    , events_(ctx_)
    , workflows_(ctx_)
    , consensus_(ctx_)
    , agents_(ctx_)
    , patterns_(ctx_)
    , learning_(ctx_)
    , goap_(ctx_)
    , started_(false)
{
}

Engine::~Engine() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status Engine::start() {
    if (started_) return Status::ok();

    const EngineConfig& cfg = ctx_.config;
    if (!ctx_.db.open(cfg.database_path)) {
        return Status::fail(ErrorCode::STORAGE, "cannot open database " + cfg.database_path + ": " +
                            ctx_.db.last_error());
    }

    if (!memory_.init() || !blackboard_.ensure_schema() || !events_.ensure_schema() ||
        !workflows_.ensure_schema() || !consensus_.ensure_schema() || !agents_.ensure_schema() ||
        !patterns_.init() || !learning_.init() || !goap_.ensure_schema()) {
        std::string error = ctx_.db.last_error();
        ctx_.db.close();
        return Status::fail(ErrorCode::STORAGE, "schema setup failed: " + error);
    }

    if (!sweep_timer_.start("ttl-sweep", cfg.sweep_interval_ms, [this]() { sweep_expired(); })) {
        LOG_WARN("[Engine] TTL sweep timer not started (interval %lld ms)",
                 static_cast<long long>(cfg.sweep_interval_ms));
    }
    if (cfg.consolidation_interval_ms > 0) {
        consolidation_timer_.start("consolidation", cfg.consolidation_interval_ms,
                                   [this]() { run_consolidation(); });
    }

    started_ = true;

    if (cfg.sync.enabled) {
        Status s = enable_sync(cfg.sync);
        if (!s) {
            // Local operation never depends on sync
            LOG_ERROR("[Engine] %s: %s (continuing without sync)", error_code_name(s.code), s.error.c_str());
        }
    }

    LOG_INFO("[Engine] Started (db=%s, sweep every %lld ms, sync %s)", cfg.database_path.c_str(),
             static_cast<long long>(cfg.sweep_interval_ms), sync_ ? "on" : "off");
    return Status::ok();
}

void Engine::stop() {
    if (!started_) return;
    disable_sync();
    consolidation_timer_.stop();
    sweep_timer_.stop();
    ctx_.db.close();
    started_ = false;
    LOG_INFO("[Engine] Stopped");
}

// ============================================================================
// Maintenance
// ============================================================================

SweepReport Engine::sweep_expired() {
    SweepReport report;
    report.entries = memory_.sweep_expired();
    report.hints = blackboard_.sweep_expired();
    report.events = events_.sweep_expired();
    report.proposals = consensus_.sweep_expired();
    if (report.total() > 0) {
        LOG_DEBUG("[Engine] Sweep removed %d entries, %d hints, %d events, %d proposals",
                  report.entries, report.hints, report.events, report.proposals);
    }
    return report;
}

void Engine::run_consolidation() {
    ConsolidationReport report = patterns_.consolidate();
    if (report.clusters_merged > 0 || report.patterns_pruned > 0) {
        LOG_INFO("[Engine] Consolidation merged %d clusters, pruned %d patterns",
                 report.clusters_merged, report.patterns_pruned);
    }
}

// ============================================================================
// Sync
// ============================================================================

Status Engine::enable_sync(const SyncConfig& config) {
    if (!started_) {
        return Status::fail(ErrorCode::VALIDATION, "engine not started");
    }
    if (sync_ && sync_->is_enabled()) {
        return Status::ok();
    }
    std::unique_ptr<SyncTransport> transport(new SyncTransport(ctx_, memory_));
    Status s = transport->enable(config);
    if (!s) {
        return s;
    }
    sync_ = std::move(transport);
    return Status::ok();
}

void Engine::disable_sync() {
    if (sync_) {
        sync_->disable();
        sync_.reset();
    }
}

// ============================================================================
// Statistics
// ============================================================================

Result<int64_t> Engine::count_rows(const std::string& table, const std::string& where) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ctx_.db.table_exists(table)) {
        return Result<int64_t>::ok(0);
    }
    std::string sql = "SELECT COUNT(*) FROM " + table;
    if (!where.empty()) sql += " WHERE " + where;
    Statement stmt(ctx_.db, sql);
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<MemoryStats> Engine::stats() {
    if (!started_) {
        return Result<MemoryStats>::fail(ErrorCode::VALIDATION, "engine not started");
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    MemoryStats stats;
    int64_t now = ctx_.now_ms();

    struct Counter {
        const char* table;
        int64_t* out;
    };
    Counter counters[] = {
        {"memory_entries", &stats.total_entries},
        {"memory_acl", &stats.total_acls},
        {"hints", &stats.total_hints},
        {"events", &stats.total_events},
        {"patterns", &stats.total_patterns},
        {"learning_experiences", &stats.total_experiences},
        {"q_values", &stats.total_q_values},
        {"consensus_state", &stats.total_proposals},
        {"agent_registry", &stats.total_agents}
    };
    for (const auto& c : counters) {
        Result<int64_t> n = count_rows(c.table);
        if (!n) return Result<MemoryStats>::fail(n.status());
        *c.out = n.value;
    }

    Result<int64_t> live = memory_.count("");
    if (!live) return Result<MemoryStats>::fail(live.status());
    stats.live_entries = live.value;

    Result<int64_t> workflows = workflows_.count_workflows();
    if (!workflows) return Result<MemoryStats>::fail(workflows.status());
    stats.total_workflows = workflows.value;

    {
        Statement stmt(ctx_.db, "SELECT COUNT(DISTINCT partition) FROM memory_entries");
        if (!stmt.ok() || !stmt.step_row()) {
            return Result<MemoryStats>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
        }
        stats.partitions = stmt.column_int64(0);
    }

    Statement levels(ctx_.db,
        "SELECT access_level, COUNT(*) FROM memory_entries "
        "WHERE expires_at = 0 OR expires_at > ? GROUP BY access_level");
    if (!levels.ok()) {
        return Result<MemoryStats>::fail(ErrorCode::STORAGE, levels.error());
    }
    levels.bind_int64(1, now);
    while (levels.step_row()) {
        stats.entries_by_access_level[levels.column_text(0)] = levels.column_int64(1);
    }
    if (!levels.error().empty()) {
        return Result<MemoryStats>::fail(ErrorCode::STORAGE, levels.error());
    }

    return Result<MemoryStats>::ok(stats);
}

} // namespace hivemem
