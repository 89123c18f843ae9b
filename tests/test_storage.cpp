/*
 * HiveMem C++ - Storage, ACL and TTL tests
 */
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace hivemem;
using namespace hivemem::testing;

static StoreOptions owned(const std::string& owner) {
    StoreOptions opts;
    opts.owned_by(owner);
    return opts;
}

void test_store_retrieve() {
    std::cout << "Testing store/retrieve..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    assert(engine);
    MemoryManager& mem = engine->memory();

    Json value;
    value["status"] = "green";
    value["count"] = 3;
    assert(mem.store("build", value, owned("agent-a")));

    Result<MemoryEntry> got = mem.retrieve("build", "default", AgentIdentity("agent-a"));
    assert(got.success);
    assert(got.value.value["status"] == "green");
    assert(got.value.value["count"] == 3);
    assert(got.value.owner == "agent-a");
    assert(got.value.access.level == AccessLevel::PRIVATE);
    assert(got.value.created_at == clock.now());
    assert(got.value.expires_at == 0);

    Result<MemoryEntry> missing = mem.retrieve("nope", "default", AgentIdentity("agent-a"));
    assert(!missing.success);
    assert(missing.code == ErrorCode::NOT_FOUND);

    std::cout << "  PASS" << std::endl;
}

void test_private_entry_denies_other_agents() {
    std::cout << "Testing private access..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    assert(mem.store("secret", Json("a"), owned("agent-a")));
    assert(mem.store("other", Json("b"), owned("agent-a")));

    // B holds a grant, but on a different key
    std::set<Permission> read;
    read.insert(Permission::READ);
    assert(mem.grant_permission("other", "default", AgentIdentity("agent-a"), "agent-b", read));

    assert(mem.retrieve("secret", "default", AgentIdentity("agent-a")).success);
    Result<MemoryEntry> denied = mem.retrieve("secret", "default", AgentIdentity("agent-b"));
    assert(!denied.success);
    assert(denied.code == ErrorCode::ACCESS_DENIED);

    assert(mem.retrieve("other", "default", AgentIdentity("agent-b")).success);
    assert(mem.retrieve("secret", "default", AgentIdentity::system_agent()).success);

    std::cout << "  PASS" << std::endl;
}

void test_ttl_expiry_and_sweep() {
    std::cout << "Testing TTL expiry..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions opts;
    opts.ttl(10);
    assert(mem.store("k1", Json(1), opts));
    assert(mem.store("k2", Json(2), opts));

    clock.advance_s(5);
    assert(mem.retrieve("k1", "default", AgentIdentity::system_agent()).success);

    clock.advance_s(6);
    Result<MemoryEntry> gone = mem.retrieve("k1", "default", AgentIdentity::system_agent());
    assert(!gone.success);
    assert(gone.code == ErrorCode::NOT_FOUND);

    // k1 was dropped lazily, k2 is left for the sweep
    SweepReport first = engine->sweep_expired();
    assert(first.entries == 1);
    SweepReport second = engine->sweep_expired();
    assert(second.entries == 0);

    std::cout << "  PASS" << std::endl;
}

void test_ttl_zero_never_expires() {
    std::cout << "Testing ttl=0..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions opts;
    opts.ttl(0);
    assert(mem.store("forever", Json("x"), opts));

    clock.advance_s(10LL * 365 * 24 * 3600);
    engine->sweep_expired();
    Result<MemoryEntry> got = mem.retrieve("forever", "default", AgentIdentity::system_agent());
    assert(got.success);
    assert(got.value.expires_at == 0);

    std::cout << "  PASS" << std::endl;
}

void test_partition_default_ttl() {
    std::cout << "Testing partition TTL defaults..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions shared;
    shared.in("shared");
    assert(mem.store("signal", Json(true), shared));
    Result<MemoryEntry> got = mem.retrieve("signal", "shared", AgentIdentity::system_agent());
    assert(got.success);
    assert(got.value.expires_at == clock.now() + 1800 * 1000);

    StoreOptions artifacts;
    artifacts.in("artifacts");
    assert(mem.store("report", Json("done"), artifacts));
    assert(mem.retrieve("report", "artifacts", AgentIdentity::system_agent()).value.expires_at == 0);

    std::cout << "  PASS" << std::endl;
}

void test_validation() {
    std::cout << "Testing store validation..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions negative;
    negative.ttl(-1);
    Status s = mem.store("k", Json(1), negative);
    assert(!s.success);
    assert(s.code == ErrorCode::VALIDATION);

    Result<AccessPolicy> team = AccessPolicy::from_tag("team", "", "");
    assert(!team.success);
    assert(team.code == ErrorCode::VALIDATION);

    Result<AccessPolicy> bogus = AccessPolicy::from_tag("everyone", "", "");
    assert(!bogus.success);

    StoreOptions bad_policy;
    AccessPolicy p;
    p.level = AccessLevel::SWARM;
    bad_policy.with_access(p);
    assert(mem.store("k", Json(1), bad_policy).code == ErrorCode::VALIDATION);

    assert(mem.store("", Json(1)).code == ErrorCode::VALIDATION);

    // "a:b" + "k" would share the resource id of "a" + "b:k"
    StoreOptions colon;
    colon.in("a:b");
    assert(mem.store("k", Json(1), colon).code == ErrorCode::VALIDATION);

    std::cout << "  PASS" << std::endl;
}

void test_team_and_public_access() {
    std::cout << "Testing team/public access..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions team;
    team.owned_by("lead").with_access(AccessPolicy::team("red"));
    assert(mem.store("plan", Json("v1"), team));

    AgentIdentity mate("mate");
    mate.team_id = "red";
    AgentIdentity outsider("outsider");
    outsider.team_id = "blue";

    assert(mem.retrieve("plan", "default", mate).success);
    assert(mem.retrieve("plan", "default", outsider).code == ErrorCode::ACCESS_DENIED);

    // Team members may update the value; ownership stays with the lead
    StoreOptions mate_write;
    mate_write.owned_by("mate").with_access(AccessPolicy::team("red"));
    assert(mem.store("plan", Json("v2"), mate_write));
    Result<MemoryEntry> updated = mem.retrieve("plan", "default", mate);
    assert(updated.value.value == "v2");
    assert(updated.value.owner == "lead");

    StoreOptions outsider_write;
    outsider_write.owned_by("outsider");
    assert(mem.store("plan", Json("v3"), outsider_write).code == ErrorCode::ACCESS_DENIED);

    StoreOptions pub;
    pub.owned_by("lead").with_access(AccessPolicy::public_());
    assert(mem.store("notice", Json("hello"), pub));
    assert(mem.retrieve("notice", "default", outsider).success);
    // Public is readable, not writable
    assert(mem.store("notice", Json("spam"), outsider_write).code == ErrorCode::ACCESS_DENIED);

    std::cout << "  PASS" << std::endl;
}

void test_query_glob() {
    std::cout << "Testing query..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions pub;
    pub.owned_by("a").with_access(AccessPolicy::public_());
    assert(mem.store("task:1", Json(1), pub));
    assert(mem.store("task:2", Json(2), pub));
    assert(mem.store("note:1", Json(3), pub));
    assert(mem.store("task:3", Json(4), owned("a")));

    QueryOptions q;
    Result<std::vector<MemoryEntry>> as_b = mem.query("task:*", q, AgentIdentity("b"));
    assert(as_b.success);
    assert(as_b.value.size() == 2);

    Result<std::vector<MemoryEntry>> as_a = mem.query("task:*", q, AgentIdentity("a"));
    assert(as_a.value.size() == 3);

    q.limit = 1;
    assert(mem.query("*", q, AgentIdentity("a")).value.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_delete_and_clear() {
    std::cout << "Testing delete/clear..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions pub;
    pub.owned_by("a").with_access(AccessPolicy::public_());
    assert(mem.store("k", Json(1), pub));

    assert(mem.remove("k", "default", AgentIdentity("b")).code == ErrorCode::ACCESS_DENIED);
    assert(mem.remove("k", "default", AgentIdentity("a")));
    assert(mem.retrieve("k", "default", AgentIdentity("a")).code == ErrorCode::NOT_FOUND);
    assert(mem.remove("k", "default", AgentIdentity("a")).code == ErrorCode::NOT_FOUND);

    StoreOptions scratch;
    scratch.in("scratch");
    assert(mem.store("x", Json(1), scratch));
    assert(mem.store("y", Json(2), scratch));
    Result<int> cleared = mem.clear("scratch");
    assert(cleared.success);
    assert(cleared.value == 2);
    assert(mem.count("scratch").value == 0);

    std::cout << "  PASS" << std::endl;
}

void test_grant_revoke_block() {
    std::cout << "Testing grants and blocks..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions team;
    team.owned_by("a").with_access(AccessPolicy::team("t"));
    assert(mem.store("doc", Json("x"), team));

    std::set<Permission> read;
    read.insert(Permission::READ);

    // Only the owner, system or a SHARE holder may grant
    assert(mem.grant_permission("doc", "default", AgentIdentity("b"), "b", read).code == ErrorCode::ACCESS_DENIED);
    assert(mem.grant_permission("doc", "default", AgentIdentity("a"), "b", read));
    assert(mem.retrieve("doc", "default", AgentIdentity("b")).success);

    Result<AclRecord> acl = mem.get_acl("doc", "default");
    assert(acl.success);
    assert(acl.value.owner == "a");
    assert(acl.value.has_grant("b", Permission::READ));

    assert(mem.revoke_permission("doc", "default", AgentIdentity("a"), "b", read));
    assert(mem.retrieve("doc", "default", AgentIdentity("b")).code == ErrorCode::ACCESS_DENIED);

    AgentIdentity member("c");
    member.team_id = "t";
    assert(mem.retrieve("doc", "default", member).success);
    assert(mem.block_agent("doc", "default", AgentIdentity("a"), "c"));
    assert(mem.retrieve("doc", "default", member).code == ErrorCode::ACCESS_DENIED);
    assert(mem.unblock_agent("doc", "default", AgentIdentity("a"), "c"));
    assert(mem.retrieve("doc", "default", member).success);

    assert(mem.block_agent("doc", "default", AgentIdentity::system_agent(), "a").code == ErrorCode::VALIDATION);

    std::cout << "  PASS" << std::endl;
}

void test_last_writer_wins() {
    std::cout << "Testing apply_remote..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    assert(mem.store("shared", Json(1)));
    int64_t t0 = clock.now();
    int64_t first_seq = mem.change_seq("default", "shared");
    assert(first_seq > 0);
    assert(mem.current_seq() == first_seq);

    MemoryEntry older;
    older.partition = "default";
    older.key = "shared";
    older.value = Json(0);
    older.owner = "system";
    older.created_at = t0 - 10;
    older.updated_at = t0 - 10;
    Result<bool> applied = mem.apply_remote(older);
    assert(applied.success && !applied.value);
    assert(mem.change_seq("default", "shared") == first_seq);

    MemoryEntry newer = older;
    newer.value = Json(2);
    newer.updated_at = t0 + 10;
    applied = mem.apply_remote(newer);
    assert(applied.success && applied.value);
    assert(mem.retrieve("shared", "default", AgentIdentity::system_agent()).value.value == 2);
    assert(mem.change_seq("default", "shared") > first_seq);

    // Same timestamp: the larger serialized payload wins on every node
    MemoryEntry tie = newer;
    tie.value = Json(3);
    assert(mem.apply_remote(tie).value);
    MemoryEntry smaller = newer;
    smaller.value = Json(1);
    assert(!mem.apply_remote(smaller).value);
    assert(mem.retrieve("shared", "default", AgentIdentity::system_agent()).value.value == 3);

    std::vector<MemoryManager::Change> changed = mem.changed_since(first_seq);
    assert(changed.size() == 1);
    assert(changed[0].entry.value == 3);
    assert(changed[0].seq == mem.current_seq());
    assert(mem.changed_since(mem.current_seq()).empty());

    // A replicated write from a node with a slower clock still gets a fresh
    // local sequence, so it is not hidden below an existing watermark
    int64_t watermark = mem.current_seq();
    MemoryEntry behind = older;
    behind.key = "from-peer";
    behind.value = Json("late");
    behind.updated_at = t0 - 50;
    assert(mem.apply_remote(behind).value);
    std::vector<MemoryManager::Change> relayed = mem.changed_since(watermark);
    assert(relayed.size() == 1);
    assert(relayed[0].entry.key == "from-peer");

    // Partition names containing ':' are rejected on the replication path too
    MemoryEntry colon = older;
    colon.partition = "a:b";
    assert(mem.apply_remote(colon).code == ErrorCode::VALIDATION);

    std::cout << "  PASS" << std::endl;
}

void test_recreated_key_starts_with_fresh_acl() {
    std::cout << "Testing ACLs do not outlive expired entries..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    std::set<Permission> read;
    read.insert(Permission::READ);

    // One key per removal path: sweep, lazy expiry on read, and a write over
    // the expired row with neither in between
    const char* keys[] = {"swept", "lazy", "overwritten"};
    for (const char* key : keys) {
        StoreOptions opts = owned("a");
        opts.ttl(10);
        assert(mem.store(key, Json("a-secret"), opts));
        assert(mem.grant_permission(key, "default", AgentIdentity("a"), "c", read));
        assert(mem.block_agent(key, "default", AgentIdentity("a"), "d"));
        assert(mem.retrieve(key, "default", AgentIdentity("c")).success);
    }

    clock.advance_s(11);
    assert(mem.store("overwritten", Json("b-secret"), owned("b")));
    assert(mem.retrieve("lazy", "default", AgentIdentity::system_agent()).code == ErrorCode::NOT_FOUND);
    SweepReport swept = engine->sweep_expired();
    assert(swept.entries == 1);

    for (const char* key : keys) {
        if (std::string(key) != "overwritten") {
            assert(mem.store(key, Json("b-secret"), owned("b")));
        }
        Result<MemoryEntry> leaked = mem.retrieve(key, "default", AgentIdentity("c"));
        assert(!leaked.success);
        assert(leaked.code == ErrorCode::ACCESS_DENIED);

        Result<AclRecord> acl = mem.get_acl(key, "default");
        assert(acl.success);
        assert(acl.value.owner == "b");
        assert(!acl.value.has_grant("c", Permission::READ));
        assert(acl.value.blocked.empty());
    }

    // The block from the old entry no longer applies to a public entry
    StoreOptions pub = owned("b");
    pub.with_access(AccessPolicy::public_());
    assert(mem.store("swept", Json("open"), pub));
    assert(mem.retrieve("swept", "default", AgentIdentity("d")).success);

    std::cout << "  PASS" << std::endl;
}

void test_sweep_races_store_and_retrieve() {
    std::cout << "Testing concurrent sweep, store and retrieve..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    const int writers = 3;
    const int per_writer = 60;
    std::atomic<bool> failed(false);
    std::atomic<bool> done(false);

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&mem, &failed, w]() {
            for (int i = 0; i < per_writer; ++i) {
                std::string key = "w" + std::to_string(w) + "-" + std::to_string(i);
                StoreOptions shortlived;
                shortlived.ttl(1);
                if (!mem.store(key + "-tmp", Json(i), shortlived)) failed = true;
                if (!mem.store(key, Json(i))) failed = true;

                Result<MemoryEntry> tmp = mem.retrieve(key + "-tmp", "default", AgentIdentity::system_agent());
                if (!tmp.success && tmp.code != ErrorCode::NOT_FOUND) failed = true;
                if (!mem.retrieve(key, "default", AgentIdentity::system_agent()).success) failed = true;
            }
        });
    }
    std::thread sweeper([&engine, &clock, &done]() {
        while (!done) {
            clock.advance_ms(300);
            engine->sweep_expired();
            std::this_thread::yield();
        }
    });
    for (auto& t : threads) t.join();
    done = true;
    sweeper.join();

    assert(!failed);
    clock.advance_s(2);
    engine->sweep_expired();
    Result<int64_t> live = mem.count();
    assert(live.success);
    assert(live.value == writers * per_writer);

    std::cout << "  PASS" << std::endl;
}

void test_stats() {
    std::cout << "Testing stats..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryManager& mem = engine->memory();

    StoreOptions pub;
    pub.with_access(AccessPolicy::public_());
    assert(mem.store("a", Json(1), pub));
    StoreOptions short_lived;
    short_lived.in("shared");
    assert(mem.store("b", Json(2), short_lived));
    clock.advance_s(1801);

    Result<MemoryStats> stats = engine->stats();
    assert(stats.success);
    assert(stats.value.total_entries == 2);
    assert(stats.value.live_entries == 1);
    assert(stats.value.partitions == 2);
    assert(stats.value.entries_by_access_level["public"] == 1);

    Json j = stats.value.to_json();
    assert(j["totalEntries"] == 2);

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem Storage Tests ===" << std::endl;

    test_store_retrieve();
    test_private_entry_denies_other_agents();
    test_ttl_expiry_and_sweep();
    test_ttl_zero_never_expires();
    test_partition_default_ttl();
    test_validation();
    test_team_and_public_access();
    test_query_glob();
    test_delete_and_clear();
    test_grant_revoke_block();
    test_last_writer_wins();
    test_recreated_key_starts_with_fresh_acl();
    test_sweep_races_store_and_retrieve();
    test_stats();

    std::cout << std::endl << "All storage tests passed." << std::endl;
    return 0;
}
