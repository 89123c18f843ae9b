/*
 * HiveMem C++ - Sync transport
 *
 * Optional peer-to-peer replication of memory entries. Every tick pushes
 * the entries modified since each peer's watermark as a JSON delta to
 * `POST http://<peer>/sync`; incoming deltas are applied last-writer-wins
 * through MemoryManager::apply_remote.
 *
 * Peer failures are caught at this boundary, logged and counted in the
 * metrics. They never reach the caller and never touch local state.
 */
#ifndef hivemem_SYNC_SYNC_TRANSPORT_HPP
#define hivemem_SYNC_SYNC_TRANSPORT_HPP

#include <hivemem/core/periodic_timer.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <hivemem/memory/manager.hpp>
#include <hivemem/sync/sync_server.hpp>
#include <hivemem/sync/types.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hivemem {

class SyncTransport {
public:
    SyncTransport(EngineContext& ctx, MemoryManager& memory);
    ~SyncTransport();

    // Starts the listener and the push timer, and registers config.peers
    Status enable(const SyncConfig& config);
    // Clears the timer, aborts an in-flight push and closes the listener
    void disable();
    bool is_enabled() const { return enabled_.load(); }

    // Returns the peer id "address:port"; VALIDATION beyond max_peers
    Result<std::string> add_peer(const std::string& address, int port);
    Status remove_peer(const std::string& peer_id);
    std::vector<PeerInfo> peers() const;

    SyncMetrics metrics() const;

    // One push round to every peer, on the calling thread
    void sync_now();

    // Applies a serialized delta; returns the number of entries that won
    Result<int> apply_delta(const std::string& body);

    int listen_port() const;
    const std::string& node_id() const { return config_.node_id; }

private:
    // Pushes everything newer than the peer's watermark; false on failure
    bool push_to_peer(PeerInfo& peer);
    int handle_sync_request(const std::string& body, std::string& response);
    void record_attempt(bool ok, int64_t duration_ms, uint64_t bytes, uint64_t sent);

    EngineContext& ctx_;
    MemoryManager& memory_;
    SyncConfig config_;

    std::unique_ptr<SyncServer> server_;
    PeriodicTimer timer_;
    std::atomic<bool> enabled_;
    std::atomic<bool> cancel_;

    std::vector<PeerInfo> peers_;
    mutable std::mutex peers_mutex_;

    SyncMetrics metrics_;
    mutable std::mutex metrics_mutex_;

    std::mutex tick_mutex_;     // one push round at a time
};

} // namespace hivemem

#endif // hivemem_SYNC_SYNC_TRANSPORT_HPP
