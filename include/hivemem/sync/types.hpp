/*
 * HiveMem C++ - Sync types
 */
#ifndef hivemem_SYNC_TYPES_HPP
#define hivemem_SYNC_TYPES_HPP

#include <hivemem/core/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace hivemem {

struct SyncConfig {
    bool enabled;
    std::string host;               // listener bind address
    int port;                       // 0 = ephemeral
    int64_t sync_interval_ms;
    int max_peers;
    long timeout_ms;                // connect + push bound
    std::string node_id;            // empty = generated at enable()
    std::vector<std::string> peers; // "address:port"

    SyncConfig()
        : enabled(false)
        , host("0.0.0.0")
        , port(4433)
        , sync_interval_ms(5000)
        , max_peers(10)
        , timeout_ms(3000)
    {}
};

struct SyncMetrics {
    uint64_t total_syncs;
    uint64_t successful_syncs;
    uint64_t failed_syncs;
    double average_sync_duration_ms;
    uint64_t bytes_transferred;
    uint64_t entries_sent;
    uint64_t entries_applied;
    int64_t last_sync_at;

    SyncMetrics()
        : total_syncs(0), successful_syncs(0), failed_syncs(0)
        , average_sync_duration_ms(0.0), bytes_transferred(0)
        , entries_sent(0), entries_applied(0), last_sync_at(0) {}

    Json to_json() const;
};

struct PeerInfo {
    std::string id;                 // "address:port"
    std::string address;
    int port;
    int64_t pushed_seq;             // watermark: highest local change sequence delivered
    int64_t last_successful_sync;   // unix ms of the last accepted push
    int64_t last_attempt_at;
    std::string last_error;

    PeerInfo() : port(0), pushed_seq(0), last_successful_sync(0), last_attempt_at(0) {}
};

} // namespace hivemem

#endif // hivemem_SYNC_TYPES_HPP
