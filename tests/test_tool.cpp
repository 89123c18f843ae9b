/*
 * HiveMem C++ - Memory tool tests
 */
#include "test_support.hpp"
#include <hivemem/tool/memory_tool.hpp>
#include <iostream>
#include <cassert>

using namespace hivemem;
using namespace hivemem::testing;

static bool has_prefix(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

void test_memory_actions() {
    std::cout << "Testing memory actions..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult stored = tool.execute("memory_store", Json::parse(R"({
        "key": "plan", "value": {"steps": 3}, "agentId": "coder", "accessLevel": "team", "teamId": "core"
    })"));
    assert(stored.success);
    assert(stored.data["stored"] == true);
    assert(stored.data["partition"] == "default");

    ToolResult mine = tool.execute("memory_retrieve", Json::parse(R"({"key": "plan", "agentId": "coder"})"));
    assert(mine.success);
    assert(mine.data["value"]["steps"] == 3);
    assert(mine.data["accessLevel"] == "team");

    ToolResult teammate = tool.execute("memory_retrieve",
                                       Json::parse(R"({"key": "plan", "agentId": "tester", "teamId": "core"})"));
    assert(teammate.success);

    ToolResult outsider = tool.execute("memory_retrieve", Json::parse(R"({"key": "plan", "agentId": "intruder"})"));
    assert(!outsider.success);
    assert(has_prefix(outsider.error, "access_denied: "));

    assert(tool.execute("memory_store", Json::parse(R"({"key": "notes/a", "value": 1})")).success);
    assert(tool.execute("memory_store", Json::parse(R"({"key": "notes/b", "value": 2})")).success);
    ToolResult listed = tool.execute("memory_query", Json::parse(R"({"pattern": "notes/*"})"));
    assert(listed.success);
    assert(listed.data["count"] == 2);

    ToolResult deleted = tool.execute("memory_delete", Json::parse(R"({"key": "notes/a"})"));
    assert(deleted.success);
    ToolResult gone = tool.execute("memory_retrieve", Json::parse(R"({"key": "notes/a"})"));
    assert(!gone.success);
    assert(has_prefix(gone.error, "not_found: "));

    ToolResult temp = tool.execute("memory_store", Json::parse(R"({"key": "temp", "value": 1, "ttlSeconds": 5})"));
    assert(temp.success);
    clock.advance_s(6);
    assert(!tool.execute("memory_retrieve", Json::parse(R"({"key": "temp"})")).success);

    std::cout << "  PASS" << std::endl;
}

void test_coordination_actions() {
    std::cout << "Testing hint, event and workflow actions..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult hint = tool.execute("hint_post", Json::parse(R"({"key": "coder/status", "value": "busy"})"));
    assert(hint.success);
    assert(hint.data["id"].is_number_integer());
    ToolResult hints = tool.execute("hint_read", Json::parse(R"({"pattern": "coder/*"})"));
    assert(hints.data["count"] == 1);
    assert(hints.data["hints"][0]["value"] == "busy");
    assert(hints.data["hints"][0]["expiresAt"] ==
           clock.now() + Blackboard::DEFAULT_HINT_TTL_SECONDS * 1000);

    ToolResult event = tool.execute("event_log", Json::parse(R"({"type": "task_done", "payload": {"ok": true}})"));
    assert(event.success);
    assert(engine->events().by_source("agent").value.size() == 1);

    ToolResult cp = tool.execute("workflow_checkpoint", Json::parse(R"({
        "workflowId": "release", "step": "tag", "checkpoint": {"version": "1.2.0"}, "sha": "deadbeef"
    })"));
    assert(cp.success);
    assert(cp.data["workflowId"] == "release");
    ToolResult resumed = tool.execute("workflow_resume", Json::parse(R"({"workflowId": "release"})"));
    assert(resumed.success);
    assert(resumed.data["step"] == "tag");
    assert(resumed.data["status"] == "running");
    assert(resumed.data["checkpoint"]["version"] == "1.2.0");
    assert(resumed.data["sha"] == "deadbeef");
    assert(!tool.execute("workflow_resume", Json::parse(R"({"workflowId": "other"})")).success);

    std::cout << "  PASS" << std::endl;
}

void test_consensus_and_agent_actions() {
    std::cout << "Testing consensus and agent actions..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult proposed = tool.execute("consensus_propose", Json::parse(R"({
        "id": "freeze", "decision": "freeze main", "agentId": "lead", "quorum": 2
    })"));
    assert(proposed.success);
    assert(proposed.data["status"] == "pending");
    assert(proposed.data["expiresAt"] == clock.now() + 604800LL * 1000);

    ToolResult first = tool.execute("consensus_vote", Json::parse(R"({"id": "freeze", "agentId": "a"})"));
    assert(first.success);
    assert(first.data["approved"] == false);
    ToolResult second = tool.execute("consensus_vote", Json::parse(R"({"id": "freeze", "agentId": "b"})"));
    assert(second.data["approved"] == true);
    assert(has_prefix(tool.execute("consensus_vote", Json::parse(R"({"id": "nope", "agentId": "a"})")).error,
                      "not_found: "));

    ToolResult registered = tool.execute("agent_register", Json::parse(R"({
        "agentId": "coder-1", "type": "coder", "capabilities": ["cpp", "review"]
    })"));
    assert(registered.success);
    assert(registered.data["status"] == "active");
    assert(registered.data["capabilities"].size() == 2);

    ToolResult updated = tool.execute("agent_update", Json::parse(R"({
        "agentId": "coder-1", "status": "idle", "performance": {"tasks": 4}
    })"));
    assert(updated.success);
    assert(updated.data["status"] == "idle");
    assert(updated.data["performance"]["tasks"] == 4);
    assert(has_prefix(tool.execute("agent_update", Json::parse(R"({"agentId": "coder-1", "status": "asleep"})")).error,
                      "validation_error: "));
    assert(!tool.execute("agent_update", Json::parse(R"({"agentId": "coder-1"})")).success);

    ToolResult stats = tool.execute("stats", Json::object());
    assert(stats.data["totalProposals"] == 1);
    assert(stats.data["totalAgents"] == 1);

    std::cout << "  PASS" << std::endl;
}

void test_pattern_and_learning_actions() {
    std::cout << "Testing pattern and learning actions..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult first = tool.execute("pattern_store", Json::parse(R"({
        "content": "Split large diffs into reviewable commits", "confidence": 0.8, "domain": "review"
    })"));
    assert(first.success);
    assert(first.data["merged"] == false);
    ToolResult again = tool.execute("pattern_store", Json::parse(R"({
        "content": "split large diffs into reviewable commits.", "confidence": 0.4, "domain": "review"
    })"));
    assert(again.success);
    assert(again.data["merged"] == true);
    assert(again.data["id"] == first.data["id"]);

    ToolResult by_domain = tool.execute("pattern_query", Json::parse(R"({"domain": "review"})"));
    assert(by_domain.data["count"] == 1);
    assert(by_domain.data["patterns"][0]["usageCount"] == 2);
    ToolResult similar = tool.execute("pattern_query", Json::parse(R"({"content": "reviewable commits", "limit": 3})"));
    assert(similar.success);
    assert(similar.data["count"] == 1);
    assert(similar.data["patterns"][0].contains("similarity"));
    assert(!tool.execute("pattern_query", Json::object()).success);

    ToolResult none = tool.execute("learning_recommend", Json::parse(R"({"agentId": "coder"})"));
    assert(none.success);
    assert(none.data["strategy"] == "default");

    Json state = Json::parse(R"({"taskComplexity": 0.2, "requiredCapabilities": ["refactor"]})");
    Json next = Json::parse(R"({"taskComplexity": 0.9, "requiredCapabilities": ["refactor"]})");
    Json record;
    record["agentId"] = "coder";
    record["action"] = "small_steps";
    record["reward"] = 1.0;
    record["state"] = state;
    record["nextState"] = next;
    ToolResult recorded = tool.execute("learning_record", record);
    assert(recorded.success);
    assert(recorded.data["recorded"] == true);
    assert(recorded.data["sessionExperiences"] == 1);

    Json ask;
    ask["agentId"] = "coder";
    ask["state"] = state;
    ToolResult rec = tool.execute("learning_recommend", ask);
    assert(rec.data["strategy"] == "small_steps");

    record.erase("reward");
    assert(has_prefix(tool.execute("learning_record", record).error, "validation_error: "));

    std::cout << "  PASS" << std::endl;
}

void test_sync_and_stats_actions() {
    std::cout << "Testing sync and stats actions..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult off = tool.execute("sync_status", Json());
    assert(off.success);
    assert(off.data["enabled"] == false);
    ToolResult refused = tool.execute("sync_add_peer", Json::parse(R"({"address": "127.0.0.1", "port": 4433})"));
    assert(!refused.success);
    assert(has_prefix(refused.error, "validation_error: "));

    SyncConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.sync_interval_ms = 3600000;
    cfg.node_id = "tool-node";
    assert(engine->enable_sync(cfg));

    ToolResult added = tool.execute("sync_add_peer", Json::parse(R"({"address": "10.1.1.1", "port": 4433})"));
    assert(added.success);
    assert(added.data["peerId"] == "10.1.1.1:4433");
    ToolResult on = tool.execute("sync_status", Json::object());
    assert(on.data["enabled"] == true);
    assert(on.data["nodeId"] == "tool-node");
    assert(on.data["peers"].size() == 1);
    assert(on.data["metrics"].is_object());
    engine->disable_sync();

    assert(tool.execute("memory_store", Json::parse(R"({"key": "a", "value": 1, "accessLevel": "public"})")).success);
    assert(tool.execute("memory_store", Json::parse(R"({"key": "b", "value": 2, "partition": "artifacts"})")).success);
    assert(tool.execute("hint_post", Json::parse(R"({"key": "h", "value": 0})")).success);

    ToolResult stats = tool.execute("stats", Json::object());
    assert(stats.success);
    assert(stats.data["totalEntries"] == 2);
    assert(stats.data["liveEntries"] == 2);
    assert(stats.data["partitions"] == 2);
    assert(stats.data["totalHints"] == 1);
    assert(stats.data["accessLevels"]["public"] == 1);

    std::cout << "  PASS" << std::endl;
}

void test_rejected_requests() {
    std::cout << "Testing rejected requests..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    MemoryTool tool(*engine);

    ToolResult unknown = tool.execute("memory_explode", Json::object());
    assert(!unknown.success);
    assert(unknown.error == "validation_error: Unknown action: memory_explode");

    ToolResult no_key = tool.execute("memory_store", Json::parse(R"({"value": 1})"));
    assert(no_key.error == "validation_error: missing required parameter: key");
    assert(!tool.execute("memory_store", Json::parse(R"({"key": "k"})")).success);
    assert(!tool.execute("memory_store", Json::parse(R"({"key": "k", "value": 1, "ttlSeconds": "soon"})")).success);
    assert(!tool.execute("memory_store", Json::parse(R"({"key": "k", "value": 1, "accessLevel": "secret"})")).success);
    assert(!tool.execute("memory_store", Json::array()).success);

    // Wrong JSON types are rejected, not thrown
    ToolResult typed = tool.execute("pattern_store", Json::parse(R"({"content": "x", "confidence": "high"})"));
    assert(!typed.success);
    assert(has_prefix(typed.error, "validation_error: "));

    Json wire = unknown.to_json();
    assert(wire["success"] == false);
    assert(wire.contains("error"));
    assert(!wire.contains("output"));
    Json ok_wire = tool.execute("stats", Json::object()).to_json();
    assert(ok_wire["success"] == true);
    assert(ok_wire["output"].is_object());

    engine->stop();
    ToolResult stopped = tool.execute("stats", Json::object());
    assert(!stopped.success);
    assert(stopped.error == "Memory tool not initialized");

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem Tool Tests ===" << std::endl;

    test_memory_actions();
    test_coordination_actions();
    test_consensus_and_agent_actions();
    test_pattern_and_learning_actions();
    test_sync_and_stats_actions();
    test_rejected_requests();

    std::cout << std::endl << "All tool tests passed." << std::endl;
    return 0;
}
