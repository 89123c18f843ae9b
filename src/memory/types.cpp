/*
 * HiveMem C++ - Memory types Implementation
 */
#include <hivemem/memory/types.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

const char* access_level_name(AccessLevel level) {
    switch (level) {
        case AccessLevel::PRIVATE: return "private";
        case AccessLevel::TEAM: return "team";
        case AccessLevel::SWARM: return "swarm";
        case AccessLevel::PUBLIC: return "public";
        case AccessLevel::SYSTEM: return "system";
        default: return "private";
    }
}

bool parse_access_level(const std::string& name, AccessLevel& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "private") { out = AccessLevel::PRIVATE; return true; }
    if (lower == "team") { out = AccessLevel::TEAM; return true; }
    if (lower == "swarm") { out = AccessLevel::SWARM; return true; }
    if (lower == "public") { out = AccessLevel::PUBLIC; return true; }
    if (lower == "system") { out = AccessLevel::SYSTEM; return true; }
    return false;
}

const char* permission_name(Permission permission) {
    switch (permission) {
        case Permission::READ: return "read";
        case Permission::WRITE: return "write";
        case Permission::DELETE: return "delete";
        case Permission::SHARE: return "share";
        default: return "read";
    }
}

bool parse_permission(const std::string& name, Permission& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "read") { out = Permission::READ; return true; }
    if (lower == "write") { out = Permission::WRITE; return true; }
    if (lower == "delete") { out = Permission::DELETE; return true; }
    if (lower == "share") { out = Permission::SHARE; return true; }
    return false;
}

// ============================================================================
// AccessPolicy
// ============================================================================

AccessPolicy AccessPolicy::team(const std::string& id) {
    AccessPolicy p;
    p.level = AccessLevel::TEAM;
    p.team_id = id;
    return p;
}

AccessPolicy AccessPolicy::swarm(const std::string& id) {
    AccessPolicy p;
    p.level = AccessLevel::SWARM;
    p.swarm_id = id;
    return p;
}

AccessPolicy AccessPolicy::public_() {
    AccessPolicy p;
    p.level = AccessLevel::PUBLIC;
    return p;
}

AccessPolicy AccessPolicy::system() {
    AccessPolicy p;
    p.level = AccessLevel::SYSTEM;
    return p;
}

Result<AccessPolicy> AccessPolicy::from_tag(const std::string& tag,
                                            const std::string& team_id,
                                            const std::string& swarm_id) {
    AccessPolicy p;
    if (!tag.empty() && !parse_access_level(tag, p.level)) {
        return Result<AccessPolicy>::fail(ErrorCode::VALIDATION, "unknown accessLevel '" + tag + "'");
    }
    if (p.level == AccessLevel::TEAM) p.team_id = team_id;
    if (p.level == AccessLevel::SWARM) p.swarm_id = swarm_id;

    Status valid = p.validate();
    if (!valid) {
        return Result<AccessPolicy>::fail(valid);
    }
    return Result<AccessPolicy>::ok(p);
}

Status AccessPolicy::validate() const {
    switch (level) {
        case AccessLevel::TEAM:
            if (team_id.empty()) {
                return Status::fail(ErrorCode::VALIDATION, "accessLevel 'team' requires teamId");
            }
            break;
        case AccessLevel::SWARM:
            if (swarm_id.empty()) {
                return Status::fail(ErrorCode::VALIDATION, "accessLevel 'swarm' requires swarmId");
            }
            break;
        case AccessLevel::PRIVATE:
        case AccessLevel::PUBLIC:
        case AccessLevel::SYSTEM:
            break;
        default:
            return Status::fail(ErrorCode::VALIDATION, "unknown accessLevel");
    }
    return Status::ok();
}

AgentIdentity AgentIdentity::system_agent() {
    AgentIdentity id("system");
    id.is_system = true;
    return id;
}

bool AclRecord::has_grant(const std::string& agent_id, Permission permission) const {
    auto it = granted.find(agent_id);
    return it != granted.end() && it->second.count(permission) > 0;
}

// ============================================================================
// MemoryEntry
// ============================================================================

Json MemoryEntry::to_json() const {
    Json j;
    j["partition"] = partition;
    j["key"] = key;
    j["value"] = value;
    j["owner"] = owner;
    j["accessLevel"] = access_level_name(access.level);
    if (!access.team_id.empty()) j["teamId"] = access.team_id;
    if (!access.swarm_id.empty()) j["swarmId"] = access.swarm_id;
    j["createdAt"] = created_at;
    j["updatedAt"] = updated_at;
    j["expiresAt"] = expires_at;
    return j;
}

Result<MemoryEntry> MemoryEntry::from_json(const Json& j) {
    if (!j.is_object()) {
        return Result<MemoryEntry>::fail(ErrorCode::VALIDATION, "entry must be an object");
    }
    try {
        MemoryEntry e;
        e.partition = j.value("partition", std::string("default"));
        e.key = j.at("key").get<std::string>();
        e.value = j.contains("value") ? j["value"] : Json();
        e.owner = j.value("owner", std::string("system"));
        Result<AccessPolicy> policy = AccessPolicy::from_tag(j.value("accessLevel", std::string("private")),
                                                             j.value("teamId", std::string()),
                                                             j.value("swarmId", std::string()));
        if (!policy) {
            return Result<MemoryEntry>::fail(policy.status());
        }
        e.access = policy.value;
        e.created_at = j.value("createdAt", static_cast<int64_t>(0));
        e.updated_at = j.value("updatedAt", static_cast<int64_t>(0));
        e.expires_at = j.value("expiresAt", static_cast<int64_t>(0));
        return Result<MemoryEntry>::ok(e);
    } catch (const Json::exception& ex) {
        return Result<MemoryEntry>::fail(ErrorCode::VALIDATION, std::string("malformed entry: ") + ex.what());
    }
}

Json MemoryStats::to_json() const {
    Json j;
    j["totalEntries"] = total_entries;
    j["liveEntries"] = live_entries;
    j["partitions"] = partitions;
    j["totalACLs"] = total_acls;
    j["totalHints"] = total_hints;
    j["totalEvents"] = total_events;
    j["totalWorkflows"] = total_workflows;
    j["totalPatterns"] = total_patterns;
    j["totalExperiences"] = total_experiences;
    j["totalQValues"] = total_q_values;
    j["totalProposals"] = total_proposals;
    j["totalAgents"] = total_agents;
    Json levels = Json::object();
    for (const auto& kv : entries_by_access_level) {
        levels[kv.first] = kv.second;
    }
    j["accessLevels"] = levels;
    return j;
}

} // namespace hivemem
