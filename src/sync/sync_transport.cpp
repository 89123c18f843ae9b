/*
 * HiveMem C++ - Sync transport Implementation
 */
#include <hivemem/sync/sync_transport.hpp>
#include <hivemem/core/http_client.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <algorithm>
#include <cstdlib>

namespace hivemem {

SyncTransport::SyncTransport(EngineContext& ctx, MemoryManager& memory)
    : ctx_(ctx)
    , memory_(memory)
    , enabled_(false)
    , cancel_(false)
{
}

SyncTransport::~SyncTransport() {
    disable();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status SyncTransport::enable(const SyncConfig& config) {
    if (enabled_) {
        LOG_WARN("[SyncTransport] Already enabled");
        return Status::ok();
    }
    if (config.sync_interval_ms <= 0) {
        return Status::fail(ErrorCode::VALIDATION, "sync interval must be positive");
    }
    if (config.port < 0 || config.port > 65535) {
        return Status::fail(ErrorCode::VALIDATION, "sync port out of range");
    }

    config_ = config;
    if (config_.node_id.empty()) {
        config_.node_id = generate_uuid();
    }
    cancel_ = false;

    server_.reset(new SyncServer(config_.host, config_.port,
        [this](const std::string& body, std::string& response) {
            return handle_sync_request(body, response);
        }));
    if (!server_->start()) {
        std::string error = server_->last_error();
        server_.reset();
        return Status::fail(ErrorCode::SYNC, "sync listener failed: " + error);
    }

    for (const auto& addr : config_.peers) {
        size_t colon = addr.rfind(':');
        if (colon == std::string::npos) {
            LOG_WARN("[SyncTransport] Ignoring peer '%s': expected address:port", addr.c_str());
            continue;
        }
        Result<std::string> added = add_peer(addr.substr(0, colon), std::atoi(addr.substr(colon + 1).c_str()));
        if (!added) {
            LOG_WARN("[SyncTransport] Ignoring peer '%s': %s", addr.c_str(), added.error.c_str());
        }
    }

    if (!timer_.start("sync", config_.sync_interval_ms, [this]() { sync_now(); })) {
        server_->stop();
        server_.reset();
        return Status::fail(ErrorCode::SYNC, "sync timer failed to start");
    }

    enabled_ = true;
    LOG_INFO("[SyncTransport] Enabled: node %s, port %d, every %lld ms, %zu peer(s)",
             config_.node_id.c_str(), listen_port(), static_cast<long long>(config_.sync_interval_ms),
             peers().size());
    return Status::ok();
}

void SyncTransport::disable() {
    if (!enabled_.exchange(false)) return;

    // Abort the in-flight push, then wait for the tick to unwind
    cancel_ = true;
    timer_.stop();
    if (server_) {
        server_->stop();
        server_.reset();
    }
    cancel_ = false;
    LOG_INFO("[SyncTransport] Disabled");
}

int SyncTransport::listen_port() const {
    return server_ ? server_->bound_port() : 0;
}

// ============================================================================
// Peers
// ============================================================================

Result<std::string> SyncTransport::add_peer(const std::string& address, int port) {
    if (trim(address).empty()) {
        return Result<std::string>::fail(ErrorCode::VALIDATION, "peer address must not be empty");
    }
    if (port <= 0 || port > 65535) {
        return Result<std::string>::fail(ErrorCode::VALIDATION, "peer port out of range");
    }

    std::string id = trim(address) + ":" + std::to_string(port);
    std::lock_guard<std::mutex> lock(peers_mutex_);
    for (const auto& p : peers_) {
        if (p.id == id) return Result<std::string>::ok(id);
    }
    if (static_cast<int>(peers_.size()) >= config_.max_peers) {
        return Result<std::string>::fail(ErrorCode::VALIDATION,
            "peer limit reached (" + std::to_string(config_.max_peers) + ")");
    }

    PeerInfo peer;
    peer.id = id;
    peer.address = trim(address);
    peer.port = port;
    peers_.push_back(peer);
    LOG_INFO("[SyncTransport] Peer added: %s", id.c_str());
    return Result<std::string>::ok(id);
}

Status SyncTransport::remove_peer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&peer_id](const PeerInfo& p) { return p.id == peer_id; });
    if (it == peers_.end()) {
        return Status::fail(ErrorCode::NOT_FOUND, "unknown peer " + peer_id);
    }
    peers_.erase(it);
    LOG_INFO("[SyncTransport] Peer removed: %s", peer_id.c_str());
    return Status::ok();
}

std::vector<PeerInfo> SyncTransport::peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_;
}

SyncMetrics SyncTransport::metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

// ============================================================================
// Outbound
// ============================================================================

void SyncTransport::sync_now() {
    std::lock_guard<std::mutex> tick(tick_mutex_);

    std::vector<PeerInfo> snapshot = peers();
    for (auto& peer : snapshot) {
        if (cancel_) break;
        push_to_peer(peer);

        // The peer may have been removed while the push ran
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (auto& p : peers_) {
            if (p.id == peer.id) {
                p.pushed_seq = peer.pushed_seq;
                p.last_successful_sync = peer.last_successful_sync;
                p.last_attempt_at = peer.last_attempt_at;
                p.last_error = peer.last_error;
            }
        }
    }
}

bool SyncTransport::push_to_peer(PeerInfo& peer) {
    std::vector<MemoryManager::Change> entries = memory_.changed_since(peer.pushed_seq);
    if (entries.empty()) {
        return true;
    }

    int64_t high_water = peer.pushed_seq;
    Json delta;
    delta["nodeId"] = config_.node_id;
    delta["sentAt"] = ctx_.now_ms();
    delta["entries"] = Json::array();
    for (const auto& c : entries) {
        delta["entries"].push_back(c.entry.to_json());
        high_water = std::max(high_water, c.seq);
    }

    std::string body;
    try {
        body = delta.dump();
    } catch (const Json::exception& ex) {
        // Values are parsed JSON, so only invalid UTF-8 can get here
        LOG_ERROR("[SyncTransport] Cannot serialize delta for %s: %s", peer.id.c_str(), ex.what());
        peer.last_error = ex.what();
        record_attempt(false, 0, 0, 0);
        return false;
    }

    HttpClient http;
    http.set_timeout_ms(config_.timeout_ms);
    http.set_connect_timeout_ms(config_.timeout_ms);
    http.set_cancel_flag(&cancel_);

    std::map<std::string, std::string> headers;
    headers["X-HiveMem-Node"] = config_.node_id;

    int64_t started = current_timestamp_ms();
    peer.last_attempt_at = ctx_.now_ms();
    HttpResponse resp = http.post_json("http://" + peer.address + ":" + std::to_string(peer.port) + "/sync",
                                       body, headers);
    int64_t duration = current_timestamp_ms() - started;

    if (resp.aborted) {
        LOG_INFO("[SyncTransport] Push to %s aborted", peer.id.c_str());
        peer.last_error = "aborted";
        return false;
    }
    if (resp.status_code != 200) {
        peer.last_error = resp.error.empty() ? "HTTP " + std::to_string(resp.status_code) : resp.error;
        LOG_WARN("[SyncTransport] %s: push to %s failed: %s (retrying next tick)",
                 error_code_name(ErrorCode::SYNC), peer.id.c_str(), peer.last_error.c_str());
        record_attempt(false, duration, body.size(), 0);
        return false;
    }

    peer.pushed_seq = high_water;
    peer.last_successful_sync = ctx_.now_ms();
    peer.last_error.clear();
    record_attempt(true, duration, body.size() + resp.body.size(), entries.size());

    Json ack = resp.json();
    LOG_DEBUG("[SyncTransport] Pushed %zu entries to %s (%d applied, %lld ms)", entries.size(),
              peer.id.c_str(), ack.is_object() ? ack.value("applied", 0) : 0, static_cast<long long>(duration));
    return true;
}

void SyncTransport::record_attempt(bool ok, int64_t duration_ms, uint64_t bytes, uint64_t sent) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.total_syncs++;
    if (ok) {
        metrics_.successful_syncs++;
        metrics_.last_sync_at = ctx_.now_ms();
    } else {
        metrics_.failed_syncs++;
    }
    metrics_.bytes_transferred += bytes;
    metrics_.entries_sent += sent;
    double n = static_cast<double>(metrics_.total_syncs);
    metrics_.average_sync_duration_ms += (static_cast<double>(duration_ms) - metrics_.average_sync_duration_ms) / n;
}

// ============================================================================
// Inbound
// ============================================================================

Result<int> SyncTransport::apply_delta(const std::string& body) {
    Json delta = Json::parse(body, nullptr, false);
    if (delta.is_discarded() || !delta.is_object() || !delta.contains("entries") || !delta["entries"].is_array()) {
        return Result<int>::fail(ErrorCode::SYNC, "malformed sync delta");
    }

    int applied = 0;
    for (const auto& item : delta["entries"]) {
        Result<MemoryEntry> entry = MemoryEntry::from_json(item);
        if (!entry) {
            LOG_WARN("[SyncTransport] Skipping replicated entry: %s", entry.error.c_str());
            continue;
        }
        Result<bool> won = memory_.apply_remote(entry.value);
        if (!won) {
            LOG_WARN("[SyncTransport] Apply %s:%s failed: %s", entry.value.partition.c_str(),
                     entry.value.key.c_str(), won.error.c_str());
            continue;
        }
        if (won.value) applied++;
    }

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.entries_applied += static_cast<uint64_t>(applied);
        metrics_.bytes_transferred += body.size();
    }
    LOG_DEBUG("[SyncTransport] Delta from %s: %d of %zu entries applied",
              delta.value("nodeId", std::string("?")).c_str(), applied, delta["entries"].size());
    return Result<int>::ok(applied);
}

int SyncTransport::handle_sync_request(const std::string& body, std::string& response) {
    Result<int> applied = apply_delta(body);
    Json out;
    out["nodeId"] = config_.node_id;
    if (!applied) {
        out["error"] = applied.error;
        response = out.dump();
        return 400;
    }
    out["applied"] = applied.value;
    response = out.dump();
    return 200;
}

} // namespace hivemem
