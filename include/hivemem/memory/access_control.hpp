/*
 * HiveMem C++ - Access control
 *
 *   AccessControl - permission evaluation over an AclRecord
 *   AclStore      - memory_acl table (grants, blocked agents) with cache
 */
#ifndef hivemem_MEMORY_ACCESS_CONTROL_HPP
#define hivemem_MEMORY_ACCESS_CONTROL_HPP

#include <hivemem/memory/types.hpp>
#include <hivemem/storage/database.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace hivemem {

// ============================================================================
// AccessControl - stateless permission check
//
// A blocked agent is always denied. Otherwise the owner and system agents
// hold every permission. For anyone else:
//   READ   - public/system visibility, matching team/swarm, or a read grant
//   WRITE  - matching team/swarm, or a write grant
//   SHARE  - a share grant
//   DELETE - never (owner or system agent only)
// ============================================================================
class AccessControl {
public:
    static Status check(const AclRecord& acl, const AgentIdentity& who, Permission permission);
    static bool allowed(const AclRecord& acl, const AgentIdentity& who, Permission permission) {
        return check(acl, who, permission).success;
    }
};

// ============================================================================
// AclStore - persisted grants and blocks per resource ("partition:key")
// ============================================================================
class AclStore {
public:
    explicit AclStore(Database& db);

    bool ensure_schema();

    Status store(const AclRecord& acl);
    // NOT_FOUND when the resource has no ACL row
    Result<AclRecord> get(const std::string& resource_id);
    Status remove(const std::string& resource_id);
    // Drop every ACL row under a partition
    Status remove_partition(const std::string& partition);
    // Drop the ACL rows of memory entries expired at `now`; run before the
    // entries themselves are deleted
    Status remove_for_expired(int64_t now);

    Status grant(const std::string& resource_id, const std::string& agent_id,
                 const std::set<Permission>& permissions);
    Status revoke(const std::string& resource_id, const std::string& agent_id,
                  const std::set<Permission>& permissions);
    Status block(const std::string& resource_id, const std::string& agent_id);
    Status unblock(const std::string& resource_id, const std::string& agent_id);

    Result<int64_t> count();
    void clear_cache();

private:
    Result<AclRecord> load(const std::string& resource_id);
    // Read-modify-write of one record under the database lock
    Status modify(const std::string& resource_id, const std::function<void(AclRecord&)>& change);

    Database& db_;
    std::map<std::string, AclRecord> cache_;
    std::mutex cache_mutex_;
};

} // namespace hivemem

#endif // hivemem_MEMORY_ACCESS_CONTROL_HPP
