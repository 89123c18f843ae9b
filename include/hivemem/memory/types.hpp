/*
 * HiveMem C++ - Shared memory types
 */
#ifndef hivemem_MEMORY_TYPES_HPP
#define hivemem_MEMORY_TYPES_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace hivemem {

// Ordered by ascending visibility
enum class AccessLevel {
    PRIVATE = 0,
    TEAM = 1,
    SWARM = 2,
    PUBLIC = 3,
    SYSTEM = 4
};

enum class Permission {
    READ,
    WRITE,
    DELETE,
    SHARE
};

const char* access_level_name(AccessLevel level);
// false for an unknown tag
bool parse_access_level(const std::string& name, AccessLevel& out);

const char* permission_name(Permission permission);
bool parse_permission(const std::string& name, Permission& out);

// Visibility of a resource, validated per tag:
// TEAM requires team_id, SWARM requires swarm_id, the others carry neither.
struct AccessPolicy {
    AccessLevel level;
    std::string team_id;
    std::string swarm_id;

    AccessPolicy() : level(AccessLevel::PRIVATE) {}

    static AccessPolicy private_() { return AccessPolicy(); }
    static AccessPolicy team(const std::string& id);
    static AccessPolicy swarm(const std::string& id);
    static AccessPolicy public_();
    static AccessPolicy system();

    // Builds from a tag name and optional ids; VALIDATION on unknown tag or missing id
    static Result<AccessPolicy> from_tag(const std::string& tag,
                                         const std::string& team_id,
                                         const std::string& swarm_id);

    Status validate() const;
};

// Principal making a request
struct AgentIdentity {
    std::string agent_id;
    std::string team_id;
    std::string swarm_id;
    bool is_system;

    AgentIdentity() : is_system(false) {}
    explicit AgentIdentity(const std::string& id) : agent_id(id), is_system(false) {}

    static AgentIdentity system_agent();
};

struct MemoryEntry {
    std::string partition;
    std::string key;
    Json value;
    std::string owner;
    AccessPolicy access;
    int64_t created_at;         // unix ms
    int64_t updated_at;         // unix ms, drives last-writer-wins
    int64_t expires_at;         // unix ms, 0 = never

    MemoryEntry() : created_at(0), updated_at(0), expires_at(0) {}

    Json to_json() const;
    // VALIDATION on a missing field, wrong type or bad access policy
    static Result<MemoryEntry> from_json(const Json& j);
};

struct StoreOptions {
    std::string partition;
    std::string owner;
    AccessPolicy access;
    int64_t ttl_seconds;
    bool has_ttl;               // false = per-partition default

    StoreOptions() : partition("default"), owner("system"), ttl_seconds(0), has_ttl(false) {}

    StoreOptions& in(const std::string& p) { partition = p; return *this; }
    StoreOptions& owned_by(const std::string& o) { owner = o; return *this; }
    StoreOptions& with_access(const AccessPolicy& a) { access = a; return *this; }
    StoreOptions& ttl(int64_t seconds) { ttl_seconds = seconds; has_ttl = true; return *this; }
};

struct QueryOptions {
    std::string partition;      // empty = every partition
    int limit;

    QueryOptions() : limit(0) {}
};

struct AclRecord {
    std::string resource_id;    // "partition:key"
    std::string owner;
    AccessPolicy access;
    std::map<std::string, std::set<Permission>> granted;
    std::set<std::string> blocked;
    int64_t created_at;
    int64_t updated_at;

    AclRecord() : created_at(0), updated_at(0) {}

    bool has_grant(const std::string& agent_id, Permission permission) const;
};

struct MemoryStats {
    int64_t total_entries;
    int64_t live_entries;
    int64_t partitions;
    int64_t total_acls;
    int64_t total_hints;
    int64_t total_events;
    int64_t total_workflows;
    int64_t total_patterns;
    int64_t total_experiences;
    int64_t total_q_values;
    int64_t total_proposals;
    int64_t total_agents;
    std::map<std::string, int64_t> entries_by_access_level;

    MemoryStats()
        : total_entries(0), live_entries(0), partitions(0), total_acls(0)
        , total_hints(0), total_events(0), total_workflows(0), total_patterns(0)
        , total_experiences(0), total_q_values(0), total_proposals(0), total_agents(0) {}

    Json to_json() const;
};

inline std::string resource_id(const std::string& partition, const std::string& key) {
    return partition + ":" + key;
}

} // namespace hivemem

#endif // hivemem_MEMORY_TYPES_HPP
