/*
 * HiveMem C++ - Memory Tool
 *
 * JSON action dispatcher exposing the engine to agent runtimes.
 *
 * Actions:
 *   memory_store        - Store a value with owner, access level and ttl
 *   memory_retrieve     - Read one entry as agentId
 *   memory_delete       - Delete an entry (owner or system)
 *   memory_query        - Glob query over keys, filtered by read access
 *   hint_post           - Post a blackboard hint
 *   hint_read           - Read hints matching a glob
 *   event_log           - Append an audit event
 *   workflow_checkpoint - Save a workflow checkpoint
 *   workflow_resume     - Latest checkpoint of a workflow
 *   pattern_store       - Store or merge a pattern
 *   pattern_query       - Similarity search, or list by domain / agent
 *   learning_record     - Record an experience and update Q-values
 *   learning_recommend  - Recommend a strategy for a task state
 *   sync_add_peer       - Register a sync peer
 *   sync_status         - Node id, peers and sync metrics
 *   stats               - Storage totals
 *
 * Parameters use camelCase names (agentId, accessLevel, ttlSeconds, ...).
 */
#ifndef hivemem_TOOL_MEMORY_TOOL_HPP
#define hivemem_TOOL_MEMORY_TOOL_HPP

#include <hivemem/engine/engine.hpp>
#include <hivemem/tool/tool.hpp>
#include <string>
#include <vector>

namespace hivemem {

class MemoryTool {
public:
    explicit MemoryTool(Engine& engine);

    const char* tool_id() const { return "memory"; }
    std::vector<std::string> actions() const;

    // Never throws; malformed params come back as VALIDATION failures
    ToolResult execute(const std::string& action, const Json& params);

private:
    ToolResult do_memory_store(const Json& params);
    ToolResult do_memory_retrieve(const Json& params);
    ToolResult do_memory_delete(const Json& params);
    ToolResult do_memory_query(const Json& params);
    ToolResult do_hint_post(const Json& params);
    ToolResult do_hint_read(const Json& params);
    ToolResult do_event_log(const Json& params);
    ToolResult do_workflow_checkpoint(const Json& params);
    ToolResult do_workflow_resume(const Json& params);
    ToolResult do_consensus_propose(const Json& params);
    ToolResult do_consensus_vote(const Json& params);
    ToolResult do_agent_register(const Json& params);
    ToolResult do_agent_update(const Json& params);
    ToolResult do_pattern_store(const Json& params);
    ToolResult do_pattern_query(const Json& params);
    ToolResult do_learning_record(const Json& params);
    ToolResult do_learning_recommend(const Json& params);
    ToolResult do_sync_add_peer(const Json& params);
    ToolResult do_sync_status(const Json& params);
    ToolResult do_stats(const Json& params);

    Engine& engine_;
};

} // namespace hivemem

#endif // hivemem_TOOL_MEMORY_TOOL_HPP
