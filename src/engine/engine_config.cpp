/*
 * HiveMem C++ - Engine configuration Implementation
 */
#include <hivemem/engine/engine_config.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

EngineConfig::EngineConfig()
    : database_path("hivemem.db")
    , log_level("info")
    , sweep_interval_ms(60000)
    , consolidation_interval_ms(0)
{
    ttl_defaults["artifacts"] = 0;
    ttl_defaults["shared"] = 1800;
    ttl_defaults["patterns"] = 604800;
    ttl_defaults["consensus"] = 604800;
}

EngineConfig EngineConfig::from_config(const Config& config) {
    EngineConfig out;

    out.database_path = config.get_string("database.path", out.database_path);
    out.log_level = config.get_string("log_level", out.log_level);

    for (auto& kv : out.ttl_defaults) {
        kv.second = config.get_int("ttl." + kv.first, kv.second);
    }
    // Extra partitions may be listed under "ttl" too
    const Json& data = config.data();
    if (data.contains("ttl") && data["ttl"].is_object()) {
        for (auto it = data["ttl"].begin(); it != data["ttl"].end(); ++it) {
            if (it.value().is_number_integer() && it.value().get<int64_t>() >= 0) {
                out.ttl_defaults[it.key()] = it.value().get<int64_t>();
            }
        }
    }

    out.sweep_interval_ms = config.get_int("maintenance.sweep_interval_ms", out.sweep_interval_ms);
    out.consolidation_interval_ms = config.get_int("maintenance.consolidation_interval_ms",
                                                   out.consolidation_interval_ms);

    out.patterns.similarity_threshold = config.get_double("patterns.similarity_threshold",
                                                          out.patterns.similarity_threshold);
    out.patterns.embedding_dim = static_cast<int>(config.get_int("patterns.embedding_dim",
                                                                 out.patterns.embedding_dim));
    out.patterns.min_confidence = config.get_double("patterns.min_confidence", out.patterns.min_confidence);
    if (out.patterns.embedding_dim < 16) {
        LOG_WARN("[EngineConfig] patterns.embedding_dim=%d too small, using 16", out.patterns.embedding_dim);
        out.patterns.embedding_dim = 16;
    }

    out.learning.enabled = config.get_bool("learning.enabled", out.learning.enabled);
    out.learning.learning_rate = config.get_double("learning.learning_rate", out.learning.learning_rate);
    out.learning.discount_factor = config.get_double("learning.discount_factor", out.learning.discount_factor);
    out.learning.exploration_rate = config.get_double("learning.exploration_rate", out.learning.exploration_rate);
    out.learning.update_frequency = static_cast<int>(config.get_int("learning.update_frequency",
                                                                    out.learning.update_frequency));
    if (out.learning.update_frequency <= 0) {
        LOG_WARN("[EngineConfig] learning.update_frequency must be positive, using 10");
        out.learning.update_frequency = 10;
    }
    std::string schedule = to_lower(config.get_string("learning.rate_schedule", "constant"));
    out.learning.rate_schedule = (schedule == "harmonic") ? RateSchedule::HARMONIC : RateSchedule::CONSTANT;

    out.sync.enabled = config.get_bool("sync.enabled", out.sync.enabled);
    out.sync.host = config.get_string("sync.host", out.sync.host);
    out.sync.port = static_cast<int>(config.get_int("sync.port", out.sync.port));
    out.sync.sync_interval_ms = config.get_int("sync.sync_interval_ms", out.sync.sync_interval_ms);
    out.sync.max_peers = static_cast<int>(config.get_int("sync.max_peers", out.sync.max_peers));
    out.sync.timeout_ms = static_cast<long>(config.get_int("sync.timeout_ms", out.sync.timeout_ms));
    out.sync.node_id = config.get_string("sync.node_id", out.sync.node_id);
    out.sync.peers = config.get_string_list("sync.peers");

    return out;
}

int64_t EngineConfig::default_ttl_for(const std::string& partition) const {
    auto it = ttl_defaults.find(partition);
    return it != ttl_defaults.end() ? it->second : 0;
}

} // namespace hivemem
