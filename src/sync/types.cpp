/*
 * HiveMem C++ - Sync types Implementation
 */
#include <hivemem/sync/types.hpp>

namespace hivemem {

Json SyncMetrics::to_json() const {
    Json j;
    j["totalSyncs"] = total_syncs;
    j["successfulSyncs"] = successful_syncs;
    j["failedSyncs"] = failed_syncs;
    j["averageSyncDuration"] = average_sync_duration_ms;
    j["bytesTransferred"] = bytes_transferred;
    j["entriesSent"] = entries_sent;
    j["entriesApplied"] = entries_applied;
    j["lastSyncAt"] = last_sync_at;
    return j;
}

} // namespace hivemem
