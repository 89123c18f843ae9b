/*
 * HiveMem C++ - Engine context
 *
 * Per-engine state shared by every subsystem: the database handle, the
 * resolved configuration and the clock. Subsystems hold a reference;
 * the Engine owns the context.
 */
#ifndef hivemem_ENGINE_CONTEXT_HPP
#define hivemem_ENGINE_CONTEXT_HPP

#include <hivemem/core/utils.hpp>
#include <hivemem/engine/engine_config.hpp>
#include <hivemem/storage/database.hpp>
#include <functional>

namespace hivemem {

// Returns unix milliseconds
typedef std::function<int64_t()> Clock;

struct EngineContext {
    Database db;
    EngineConfig config;
    Clock clock;

    explicit EngineContext(const EngineConfig& cfg) : config(cfg) {}

    int64_t now_ms() const { return clock ? clock() : current_timestamp_ms(); }
};

} // namespace hivemem

#endif // hivemem_ENGINE_CONTEXT_HPP
