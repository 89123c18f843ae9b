/*
 * HiveMem C++ - Engine configuration
 */
#ifndef hivemem_ENGINE_ENGINE_CONFIG_HPP
#define hivemem_ENGINE_ENGINE_CONFIG_HPP

#include <hivemem/core/config.hpp>
#include <hivemem/learning/types.hpp>
#include <hivemem/patterns/types.hpp>
#include <hivemem/sync/types.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace hivemem {

struct EngineConfig {
    std::string database_path;
    std::string log_level;

    // Default TTL seconds per partition, used when a store omits ttl
    std::map<std::string, int64_t> ttl_defaults;

    int64_t sweep_interval_ms;
    int64_t consolidation_interval_ms;  // 0 = manual only

    PatternBankConfig patterns;
    LearningConfig learning;
    SyncConfig sync;

    EngineConfig();

    static EngineConfig from_config(const Config& config);

    int64_t default_ttl_for(const std::string& partition) const;
};

} // namespace hivemem

#endif // hivemem_ENGINE_ENGINE_CONFIG_HPP
