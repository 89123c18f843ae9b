/*
 * HiveMem C++ - Memory Tool Implementation
 */
#include <hivemem/tool/memory_tool.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

namespace {

std::string get_string(const Json& params, const char* name, const std::string& fallback = "") {
    if (params.contains(name) && params[name].is_string()) {
        return params[name].get<std::string>();
    }
    return fallback;
}

bool require_string(const Json& params, const char* name, std::string& out) {
    out = get_string(params, name);
    return !out.empty();
}

ToolResult missing(const char* name) {
    return ToolResult::fail(std::string(error_code_name(ErrorCode::VALIDATION)) +
                            ": missing required parameter: " + name);
}

ToolResult invalid(const std::string& message) {
    return ToolResult::fail(Status::fail(ErrorCode::VALIDATION, message));
}

int get_limit(const Json& params, int fallback) {
    if (params.contains("limit") && params["limit"].is_number_integer()) {
        return params["limit"].get<int>();
    }
    return fallback;
}

// Absent agentId acts as the system agent
AgentIdentity identity_from(const Json& params) {
    std::string agent = get_string(params, "agentId");
    if (agent.empty() || agent == "system") {
        return AgentIdentity::system_agent();
    }
    AgentIdentity who(agent);
    who.team_id = get_string(params, "teamId");
    who.swarm_id = get_string(params, "swarmId");
    return who;
}

Json pattern_json(const Pattern& p) {
    Json j;
    j["id"] = p.id;
    j["content"] = p.content;
    j["confidence"] = p.confidence;
    j["usageCount"] = p.usage_count;
    if (is_rated(p.success_rate)) {
        j["successRate"] = p.success_rate;
    } else {
        j["successRate"] = nullptr;
    }
    if (!p.agent_id.empty()) j["agentId"] = p.agent_id;
    if (!p.domain.empty()) j["domain"] = p.domain;
    j["createdAt"] = p.created_at;
    j["updatedAt"] = p.updated_at;
    return j;
}

Json checkpoint_json(const WorkflowCheckpoint& c) {
    Json j;
    j["seq"] = c.seq;
    j["workflowId"] = c.workflow_id;
    j["step"] = c.step;
    j["status"] = c.status;
    j["checkpoint"] = c.checkpoint;
    if (!c.sha.empty()) j["sha"] = c.sha;
    j["createdAt"] = c.created_at;
    j["updatedAt"] = c.updated_at;
    return j;
}

} // anonymous namespace

MemoryTool::MemoryTool(Engine& engine) : engine_(engine) {}

std::vector<std::string> MemoryTool::actions() const {
    std::vector<std::string> acts;
    acts.push_back("memory_store");
    acts.push_back("memory_retrieve");
    acts.push_back("memory_delete");
    acts.push_back("memory_query");
    acts.push_back("hint_post");
    acts.push_back("hint_read");
    acts.push_back("event_log");
    acts.push_back("workflow_checkpoint");
    acts.push_back("workflow_resume");
    acts.push_back("consensus_propose");
    acts.push_back("consensus_vote");
    acts.push_back("agent_register");
    acts.push_back("agent_update");
    acts.push_back("pattern_store");
    acts.push_back("pattern_query");
    acts.push_back("learning_record");
    acts.push_back("learning_recommend");
    acts.push_back("sync_add_peer");
    acts.push_back("sync_status");
    acts.push_back("stats");
    return acts;
}

ToolResult MemoryTool::execute(const std::string& action, const Json& params_in) {
    if (!engine_.is_started()) {
        return ToolResult::fail("Memory tool not initialized");
    }
    if (!params_in.is_null() && !params_in.is_object()) {
        return invalid("params must be an object");
    }
    const Json params = params_in.is_null() ? Json::object() : params_in;

    try {
        if (action == "memory_store")        return do_memory_store(params);
        if (action == "memory_retrieve")     return do_memory_retrieve(params);
        if (action == "memory_delete")       return do_memory_delete(params);
        if (action == "memory_query")        return do_memory_query(params);
        if (action == "hint_post")           return do_hint_post(params);
        if (action == "hint_read")           return do_hint_read(params);
        if (action == "event_log")           return do_event_log(params);
        if (action == "workflow_checkpoint") return do_workflow_checkpoint(params);
        if (action == "workflow_resume")     return do_workflow_resume(params);
        if (action == "consensus_propose")   return do_consensus_propose(params);
        if (action == "consensus_vote")      return do_consensus_vote(params);
        if (action == "agent_register")      return do_agent_register(params);
        if (action == "agent_update")        return do_agent_update(params);
        if (action == "pattern_store")       return do_pattern_store(params);
        if (action == "pattern_query")       return do_pattern_query(params);
        if (action == "learning_record")     return do_learning_record(params);
        if (action == "learning_recommend")  return do_learning_recommend(params);
        if (action == "sync_add_peer")       return do_sync_add_peer(params);
        if (action == "sync_status")         return do_sync_status(params);
        if (action == "stats")               return do_stats(params);
    } catch (const Json::exception& ex) {
        LOG_DEBUG("[MemoryTool] %s rejected: %s", action.c_str(), ex.what());
        return invalid(std::string("malformed params: ") + ex.what());
    }

    return invalid("Unknown action: " + action);
}

// ============================================================================
// Memory
// ============================================================================

ToolResult MemoryTool::do_memory_store(const Json& params) {
    std::string key;
    if (!require_string(params, "key", key)) return missing("key");
    if (!params.contains("value")) return missing("value");

    Result<AccessPolicy> policy = AccessPolicy::from_tag(get_string(params, "accessLevel", "private"),
                                                         get_string(params, "teamId"),
                                                         get_string(params, "swarmId"));
    if (!policy) return ToolResult::fail(policy.status());

    StoreOptions opts;
    opts.in(get_string(params, "partition", "default"))
        .owned_by(get_string(params, "agentId", "system"))
        .with_access(policy.value);
    if (params.contains("ttlSeconds") && !params["ttlSeconds"].is_null()) {
        if (!params["ttlSeconds"].is_number_integer()) {
            return invalid("ttlSeconds must be an integer");
        }
        opts.ttl(params["ttlSeconds"].get<int64_t>());
    }

    Status s = engine_.memory().store(key, params["value"], opts);
    if (!s) return ToolResult::fail(s);

    Json data;
    data["key"] = key;
    data["partition"] = opts.partition;
    data["stored"] = true;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_memory_retrieve(const Json& params) {
    std::string key;
    if (!require_string(params, "key", key)) return missing("key");

    Result<MemoryEntry> entry = engine_.memory().retrieve(key, get_string(params, "partition", "default"),
                                                          identity_from(params));
    if (!entry) return ToolResult::fail(entry.status());
    return ToolResult::ok(entry.value.to_json());
}

ToolResult MemoryTool::do_memory_delete(const Json& params) {
    std::string key;
    if (!require_string(params, "key", key)) return missing("key");

    Status s = engine_.memory().remove(key, get_string(params, "partition", "default"), identity_from(params));
    if (!s) return ToolResult::fail(s);

    Json data;
    data["deleted"] = true;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_memory_query(const Json& params) {
    QueryOptions opts;
    opts.partition = get_string(params, "partition");
    opts.limit = get_limit(params, 100);

    Result<std::vector<MemoryEntry>> entries =
        engine_.memory().query(get_string(params, "pattern", "*"), opts, identity_from(params));
    if (!entries) return ToolResult::fail(entries.status());

    Json data;
    data["count"] = entries.value.size();
    data["entries"] = Json::array();
    for (const auto& e : entries.value) {
        data["entries"].push_back(e.to_json());
    }
    return ToolResult::ok(data);
}

// ============================================================================
// Coordination
// ============================================================================

ToolResult MemoryTool::do_hint_post(const Json& params) {
    std::string key;
    if (!require_string(params, "key", key)) return missing("key");
    if (!params.contains("value")) return missing("value");

    int64_t ttl = Blackboard::DEFAULT_HINT_TTL_SECONDS;
    if (params.contains("ttlSeconds")) {
        if (!params["ttlSeconds"].is_number_integer()) return invalid("ttlSeconds must be an integer");
        ttl = params["ttlSeconds"].get<int64_t>();
    }

    Result<int64_t> id = engine_.blackboard().post_hint(key, params["value"],
                                                        get_string(params, "partition", "default"), ttl);
    if (!id) return ToolResult::fail(id.status());

    Json data;
    data["id"] = id.value;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_hint_read(const Json& params) {
    Result<std::vector<Hint>> hints = engine_.blackboard().read_hints(
        get_string(params, "pattern", "*"), get_string(params, "partition", "default"), get_limit(params, 100));
    if (!hints) return ToolResult::fail(hints.status());

    Json data;
    data["hints"] = Json::array();
    for (const auto& h : hints.value) {
        Json j;
        j["id"] = h.id;
        j["key"] = h.key;
        j["value"] = h.value;
        j["createdAt"] = h.created_at;
        j["expiresAt"] = h.expires_at;
        data["hints"].push_back(j);
    }
    data["count"] = hints.value.size();
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_event_log(const Json& params) {
    std::string type;
    if (!require_string(params, "type", type)) return missing("type");
    Json payload = params.contains("payload") ? params["payload"] : Json::object();

    Result<std::string> id = engine_.events().append(type, payload, get_string(params, "source", "agent"));
    if (!id) return ToolResult::fail(id.status());

    Json data;
    data["id"] = id.value;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_workflow_checkpoint(const Json& params) {
    std::string workflow_id;
    std::string step;
    if (!require_string(params, "workflowId", workflow_id)) return missing("workflowId");
    if (!require_string(params, "step", step)) return missing("step");

    Json checkpoint = params.contains("checkpoint") ? params["checkpoint"] : Json::object();
    Result<int64_t> seq = engine_.workflows().save_checkpoint(workflow_id, step,
                                                              get_string(params, "status", "running"),
                                                              checkpoint, get_string(params, "sha"));
    if (!seq) return ToolResult::fail(seq.status());

    Json data;
    data["workflowId"] = workflow_id;
    data["seq"] = seq.value;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_workflow_resume(const Json& params) {
    std::string workflow_id;
    if (!require_string(params, "workflowId", workflow_id)) return missing("workflowId");

    Result<WorkflowCheckpoint> latest = engine_.workflows().latest(workflow_id);
    if (!latest) return ToolResult::fail(latest.status());
    return ToolResult::ok(checkpoint_json(latest.value));
}

// ============================================================================
// Consensus and agents
// ============================================================================

ToolResult MemoryTool::do_consensus_propose(const Json& params) {
    ConsensusProposal proposal;
    if (!require_string(params, "id", proposal.id)) return missing("id");
    if (!require_string(params, "decision", proposal.decision)) return missing("decision");
    if (!require_string(params, "agentId", proposal.proposer)) return missing("agentId");
    if (params.contains("quorum")) {
        if (!params["quorum"].is_number_integer()) return invalid("quorum must be an integer");
        proposal.quorum = params["quorum"].get<int>();
    }
    if (params.contains("ttlSeconds") && !params["ttlSeconds"].is_null()) {
        if (!params["ttlSeconds"].is_number_integer()) return invalid("ttlSeconds must be an integer");
        proposal.ttl_seconds = params["ttlSeconds"].get<int64_t>();
    }

    Status s = engine_.consensus().create_proposal(proposal);
    if (!s) return ToolResult::fail(s);
    Result<ConsensusProposal> stored = engine_.consensus().get(proposal.id);
    if (!stored) return ToolResult::fail(stored.status());
    return ToolResult::ok(stored.value.to_json());
}

ToolResult MemoryTool::do_consensus_vote(const Json& params) {
    std::string id;
    std::string agent_id;
    if (!require_string(params, "id", id)) return missing("id");
    if (!require_string(params, "agentId", agent_id)) return missing("agentId");

    Result<bool> approved = engine_.consensus().vote(id, agent_id);
    if (!approved) return ToolResult::fail(approved.status());

    Json data;
    data["id"] = id;
    data["approved"] = approved.value;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_agent_register(const Json& params) {
    AgentRecord agent;
    if (!require_string(params, "agentId", agent.id)) return missing("agentId");
    if (!require_string(params, "type", agent.type)) return missing("type");
    agent.status = get_string(params, "status", "active");
    if (params.contains("capabilities")) {
        agent.capabilities = params["capabilities"].get<std::vector<std::string>>();
    }
    if (params.contains("performance")) {
        agent.performance = params["performance"];
    }

    Status s = engine_.agents().register_agent(agent);
    if (!s) return ToolResult::fail(s);
    Result<AgentRecord> stored = engine_.agents().get(agent.id);
    if (!stored) return ToolResult::fail(stored.status());
    return ToolResult::ok(stored.value.to_json());
}

ToolResult MemoryTool::do_agent_update(const Json& params) {
    std::string agent_id;
    if (!require_string(params, "agentId", agent_id)) return missing("agentId");
    if (!params.contains("status") && !params.contains("performance")) {
        return invalid("nothing to update: pass status or performance");
    }

    if (params.contains("status")) {
        Status s = engine_.agents().update_status(agent_id, get_string(params, "status"));
        if (!s) return ToolResult::fail(s);
    }
    if (params.contains("performance")) {
        Status s = engine_.agents().update_performance(agent_id, params["performance"]);
        if (!s) return ToolResult::fail(s);
    }
    Result<AgentRecord> stored = engine_.agents().get(agent_id);
    if (!stored) return ToolResult::fail(stored.status());
    return ToolResult::ok(stored.value.to_json());
}

// ============================================================================
// Patterns
// ============================================================================

ToolResult MemoryTool::do_pattern_store(const Json& params) {
    std::string content;
    if (!require_string(params, "content", content)) return missing("content");

    double confidence = params.value("confidence", 0.5);
    double success_rate = unrated();
    if (params.contains("successRate") && !params["successRate"].is_null()) {
        success_rate = params["successRate"].get<double>();
    }

    Result<PatternStoreResult> stored = engine_.patterns().store_pattern(
        content, confidence, get_string(params, "agentId"), get_string(params, "domain"), success_rate);
    if (!stored) return ToolResult::fail(stored.status());

    Json data;
    data["id"] = stored.value.id;
    data["merged"] = stored.value.merged;
    if (stored.value.merged) data["similarity"] = stored.value.similarity;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_pattern_query(const Json& params) {
    std::string content = get_string(params, "content");
    std::string agent_id = get_string(params, "agentId");
    std::string domain = get_string(params, "domain");
    int limit = get_limit(params, 10);

    Json data;
    data["patterns"] = Json::array();

    if (!content.empty()) {
        Result<std::vector<PatternMatch>> matches =
            engine_.patterns().search_similar(content, limit, agent_id, domain);
        if (!matches) return ToolResult::fail(matches.status());
        for (const auto& m : matches.value) {
            Json j = pattern_json(m.pattern);
            j["similarity"] = m.similarity;
            data["patterns"].push_back(j);
        }
    } else if (!domain.empty() || !agent_id.empty()) {
        Result<std::vector<Pattern>> rows = domain.empty()
            ? engine_.patterns().query_by_agent(agent_id, limit)
            : engine_.patterns().query_by_domain(domain, limit);
        if (!rows) return ToolResult::fail(rows.status());
        for (const auto& p : rows.value) {
            data["patterns"].push_back(pattern_json(p));
        }
    } else {
        return invalid("pattern_query needs content, domain or agentId");
    }

    data["count"] = data["patterns"].size();
    return ToolResult::ok(data);
}

// ============================================================================
// Learning
// ============================================================================

ToolResult MemoryTool::do_learning_record(const Json& params) {
    std::string agent_id;
    std::string action;
    if (!require_string(params, "agentId", agent_id)) return missing("agentId");
    if (!require_string(params, "action", action)) return missing("action");
    if (!params.contains("reward") || !params["reward"].is_number()) return missing("reward");

    TaskState state = TaskState::from_json(params.contains("state") ? params["state"] : Json::object());
    TaskState next = params.contains("nextState") ? TaskState::from_json(params["nextState"]) : state;

    Status s = engine_.learning().record_experience(agent_id, state, action,
                                                    params["reward"].get<double>(), next);
    if (!s) return ToolResult::fail(s);

    Json data;
    data["recorded"] = engine_.learning().is_enabled();
    data["sessionExperiences"] = engine_.learning().get_total_experiences(agent_id);
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_learning_recommend(const Json& params) {
    std::string agent_id;
    if (!require_string(params, "agentId", agent_id)) return missing("agentId");

    TaskState state = TaskState::from_json(params.contains("state") ? params["state"] : Json::object());
    Result<StrategyRecommendation> rec = engine_.learning().recommend_strategy(agent_id, state);
    if (!rec) return ToolResult::fail(rec.status());
    return ToolResult::ok(rec.value.to_json());
}

// ============================================================================
// Sync
// ============================================================================

ToolResult MemoryTool::do_sync_add_peer(const Json& params) {
    SyncTransport* sync = engine_.sync();
    if (!sync) return invalid("sync is not enabled");

    std::string address;
    if (!require_string(params, "address", address)) return missing("address");
    if (!params.contains("port") || !params["port"].is_number_integer()) return missing("port");

    Result<std::string> id = sync->add_peer(address, params["port"].get<int>());
    if (!id) return ToolResult::fail(id.status());

    Json data;
    data["peerId"] = id.value;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_sync_status(const Json& params) {
    (void)params;
    Json data;
    SyncTransport* sync = engine_.sync();
    data["enabled"] = sync != nullptr && sync->is_enabled();
    if (!sync) return ToolResult::ok(data);

    data["nodeId"] = sync->node_id();
    data["port"] = sync->listen_port();
    data["metrics"] = sync->metrics().to_json();
    data["peers"] = Json::array();
    for (const auto& p : sync->peers()) {
        Json j;
        j["id"] = p.id;
        j["lastSuccessfulSync"] = p.last_successful_sync;
        j["pushedSeq"] = p.pushed_seq;
        j["lastAttemptAt"] = p.last_attempt_at;
        if (!p.last_error.empty()) j["lastError"] = p.last_error;
        data["peers"].push_back(j);
    }
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_stats(const Json& params) {
    (void)params;
    Result<MemoryStats> stats = engine_.stats();
    if (!stats) return ToolResult::fail(stats.status());
    return ToolResult::ok(stats.value.to_json());
}

} // namespace hivemem
