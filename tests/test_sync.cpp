/*
 * HiveMem C++ - Sync transport tests
 *
 * Two engines replicate over loopback on ephemeral ports. Pushes are
 * driven with sync_now(); the timer interval is long enough never to fire.
 */
#include "test_support.hpp"
#include <iostream>
#include <cassert>

using namespace hivemem;
using namespace hivemem::testing;

static SyncConfig loopback_sync(const std::string& node_id) {
    SyncConfig cfg;
    cfg.enabled = true;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.sync_interval_ms = 3600000;
    cfg.timeout_ms = 2000;
    cfg.max_peers = 3;
    cfg.node_id = node_id;
    return cfg;
}

static Json delta_with(const MemoryEntry& entry) {
    Json delta;
    delta["nodeId"] = "test";
    delta["sentAt"] = entry.updated_at;
    delta["entries"] = Json::array();
    delta["entries"].push_back(entry.to_json());
    return delta;
}

void test_two_node_replication() {
    std::cout << "Testing two-node replication..." << std::endl;

    ManualClock clock;
    auto a = start_engine(clock);
    auto b = start_engine(clock);
    assert(a && b);
    assert(a->enable_sync(loopback_sync("node-a")));
    assert(b->enable_sync(loopback_sync("node-b")));
    SyncTransport* sa = a->sync();
    SyncTransport* sb = b->sync();
    assert(sa && sb);
    assert(sa->listen_port() > 0);
    assert(sb->listen_port() > 0);
    assert(sa->node_id() == "node-a");

    Result<std::string> peer = sa->add_peer("127.0.0.1", sb->listen_port());
    assert(peer.success);
    assert(peer.value == "127.0.0.1:" + std::to_string(sb->listen_port()));

    assert(a->memory().store("shared", Json(1)));
    sa->sync_now();

    Result<MemoryEntry> replicated = b->memory().retrieve("shared", "default", AgentIdentity::system_agent());
    assert(replicated.success);
    assert(replicated.value.value == 1);
    assert(replicated.value.owner == "system");

    SyncMetrics ma = sa->metrics();
    assert(ma.total_syncs == 1);
    assert(ma.successful_syncs == 1);
    assert(ma.failed_syncs == 0);
    assert(ma.entries_sent == 1);
    assert(ma.bytes_transferred > 0);
    assert(sb->metrics().entries_applied == 1);

    std::vector<PeerInfo> peers = sa->peers();
    assert(peers.size() == 1);
    assert(peers[0].last_successful_sync == clock.now());
    assert(peers[0].last_error.empty());

    // Nothing new: no request is made
    sa->sync_now();
    assert(sa->metrics().total_syncs == 1);

    clock.advance_ms(50);
    assert(a->memory().store("shared", Json(2)));
    sa->sync_now();
    assert(b->memory().retrieve("shared", "default", AgentIdentity::system_agent()).value.value == 2);
    assert(sa->metrics().successful_syncs == 2);

    a->disable_sync();
    b->disable_sync();
    assert(a->sync() == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_relayed_entry_from_slower_clock() {
    std::cout << "Testing relay of entries older than the peer watermark..." << std::endl;

    ManualClock clock;
    auto relay = start_engine(clock);
    auto sink = start_engine(clock);
    assert(relay->enable_sync(loopback_sync("node-relay")));
    assert(sink->enable_sync(loopback_sync("node-sink")));
    SyncTransport* sr = relay->sync();
    assert(sr->add_peer("127.0.0.1", sink->sync()->listen_port()).success);

    assert(relay->memory().store("local", Json("here")));
    sr->sync_now();
    int64_t watermark = sr->peers()[0].pushed_seq;
    assert(watermark == relay->memory().current_seq());
    assert(sink->memory().retrieve("local", "default", AgentIdentity::system_agent()).success);

    // A third node whose clock runs behind delivers an entry to the relay
    MemoryEntry remote;
    remote.partition = "default";
    remote.key = "from-slow-node";
    remote.value = Json("late");
    remote.owner = "system";
    remote.created_at = clock.now() - 50;
    remote.updated_at = clock.now() - 50;
    Result<int> applied = sr->apply_delta(delta_with(remote).dump());
    assert(applied.success && applied.value == 1);

    sr->sync_now();
    Result<MemoryEntry> relayed =
        sink->memory().retrieve("from-slow-node", "default", AgentIdentity::system_agent());
    assert(relayed.success);
    assert(relayed.value.value == "late");
    assert(relayed.value.updated_at == remote.updated_at);
    assert(sr->peers()[0].pushed_seq > watermark);
    assert(sr->metrics().entries_sent == 2);

    relay->disable_sync();
    sink->disable_sync();

    std::cout << "  PASS" << std::endl;
}

void test_last_writer_wins() {
    std::cout << "Testing last-writer-wins apply..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    assert(engine->enable_sync(loopback_sync("node-lww")));
    SyncTransport* sync = engine->sync();

    assert(engine->memory().store("config", Json("local")));
    Result<MemoryEntry> local = engine->memory().retrieve("config", "default", AgentIdentity::system_agent());
    assert(local.success);

    MemoryEntry older = local.value;
    older.value = "remote-old";
    older.updated_at = local.value.updated_at - 1000;
    Result<int> applied = sync->apply_delta(delta_with(older).dump());
    assert(applied.success);
    assert(applied.value == 0);
    assert(engine->memory().retrieve("config", "default", AgentIdentity::system_agent()).value.value == "local");

    MemoryEntry newer = local.value;
    newer.value = "remote-new";
    newer.updated_at = local.value.updated_at + 1000;
    applied = sync->apply_delta(delta_with(newer).dump());
    assert(applied.value == 1);
    assert(engine->memory().retrieve("config", "default", AgentIdentity::system_agent()).value.value == "remote-new");

    // Equal timestamps: the larger serialized value wins on every node
    MemoryEntry tie = newer;
    tie.value = "remote-a";
    applied = sync->apply_delta(delta_with(tie).dump());
    assert(applied.value == 0);
    tie.value = "remote-z";
    applied = sync->apply_delta(delta_with(tie).dump());
    assert(applied.value == 1);

    assert(sync->metrics().entries_applied == 2);

    std::cout << "  PASS" << std::endl;
}

void test_malformed_deltas() {
    std::cout << "Testing malformed deltas..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    assert(engine->enable_sync(loopback_sync("node-bad")));
    SyncTransport* sync = engine->sync();

    assert(sync->apply_delta("not json").code == ErrorCode::SYNC);
    assert(sync->apply_delta("{}").code == ErrorCode::SYNC);
    assert(sync->apply_delta(R"({"entries": {}})").code == ErrorCode::SYNC);

    // Bad entries are skipped, the rest still apply
    Json delta = Json::parse(R"({"nodeId": "x", "entries": [
        {"partition": "default"},
        {"partition": "default", "key": "ok", "value": 5, "accessLevel": "public",
         "createdAt": 1, "updatedAt": 1, "expiresAt": 0}
    ]})");
    Result<int> applied = sync->apply_delta(delta.dump());
    assert(applied.success);
    assert(applied.value == 1);
    assert(engine->memory().retrieve("ok", "default", AgentIdentity("anyone")).value.value == 5);
    assert(engine->memory().count().value == 1);

    std::cout << "  PASS" << std::endl;
}

void test_peer_management() {
    std::cout << "Testing peer management..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    assert(engine->enable_sync(loopback_sync("node-peers")));
    SyncTransport* sync = engine->sync();

    Result<std::string> p1 = sync->add_peer("10.0.0.1", 4433);
    assert(p1.success);
    assert(sync->add_peer("10.0.0.1", 4433).value == p1.value);
    assert(sync->add_peer("10.0.0.2", 4433).success);
    assert(sync->add_peer("10.0.0.3", 4433).success);
    assert(sync->peers().size() == 3);

    assert(sync->add_peer("10.0.0.4", 4433).code == ErrorCode::VALIDATION);
    assert(sync->add_peer("", 4433).code == ErrorCode::VALIDATION);
    assert(sync->add_peer("10.0.0.5", 0).code == ErrorCode::VALIDATION);
    assert(sync->add_peer("10.0.0.5", 70000).code == ErrorCode::VALIDATION);

    assert(sync->remove_peer(p1.value));
    assert(sync->remove_peer(p1.value).code == ErrorCode::NOT_FOUND);
    assert(sync->peers().size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_unreachable_peer() {
    std::cout << "Testing unreachable peer..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    SyncConfig cfg = loopback_sync("node-lonely");
    cfg.timeout_ms = 500;
    assert(engine->enable_sync(cfg));
    SyncTransport* sync = engine->sync();

    // Bind and release a port so nothing listens on it
    int dead_port = 0;
    {
        auto scratch = start_engine(clock);
        assert(scratch->enable_sync(loopback_sync("scratch")));
        dead_port = scratch->sync()->listen_port();
        scratch->stop();
    }
    assert(sync->add_peer("127.0.0.1", dead_port).success);

    assert(engine->memory().store("k", Json("v")));
    sync->sync_now();

    SyncMetrics m = sync->metrics();
    assert(m.failed_syncs == 1);
    assert(m.successful_syncs == 0);
    std::vector<PeerInfo> peers = sync->peers();
    assert(!peers[0].last_error.empty());
    assert(peers[0].last_successful_sync == 0);
    assert(peers[0].last_attempt_at == clock.now());

    // Local state is untouched by the failure
    assert(engine->memory().retrieve("k", "default", AgentIdentity::system_agent()).value.value == "v");

    std::cout << "  PASS" << std::endl;
}

void test_enable_rules() {
    std::cout << "Testing sync enable rules..." << std::endl;

    ManualClock clock;
    Engine idle(memory_config());
    assert(idle.enable_sync(loopback_sync("x")).code == ErrorCode::VALIDATION);

    auto engine = start_engine(clock);
    SyncConfig bad = loopback_sync("bad");
    bad.sync_interval_ms = 0;
    assert(engine->enable_sync(bad).code == ErrorCode::VALIDATION);
    assert(engine->sync() == nullptr);

    SyncConfig anon = loopback_sync("");
    assert(engine->enable_sync(anon));
    assert(!engine->sync()->node_id().empty());
    assert(engine->sync()->is_enabled());

    engine->disable_sync();
    assert(engine->sync() == nullptr);
    // Local operation carries on without sync
    assert(engine->memory().store("after", Json(true)));

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem Sync Tests ===" << std::endl;

    test_two_node_replication();
    test_relayed_entry_from_slower_clock();
    test_last_writer_wins();
    test_malformed_deltas();
    test_peer_management();
    test_unreachable_peer();
    test_enable_rules();

    std::cout << std::endl << "All sync tests passed." << std::endl;
    return 0;
}
