/*
 * HiveMem C++ - Memory Manager
 *
 * Access-controlled key/value storage over the row store: partitions,
 * TTL resolution, ACL enforcement and modification tracking for sync.
 *
 * Every local write (store or replicated apply) takes the next change
 * sequence number while the database lock is held, so sequence order is
 * commit order. Sync watermarks are sequence numbers; updated_at only
 * decides last-writer-wins.
 */
#ifndef hivemem_MEMORY_MANAGER_HPP
#define hivemem_MEMORY_MANAGER_HPP

#include <hivemem/engine/context.hpp>
#include <hivemem/memory/access_control.hpp>
#include <hivemem/memory/types.hpp>
#include <hivemem/storage/row_store.hpp>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hivemem {

// ============================================================================
// MemoryManager - High-level Memory Operations
// ============================================================================

class MemoryManager {
public:
    explicit MemoryManager(EngineContext& ctx);

    // Create the core tables
    bool init();

    // ========================================================================
    // Entry Operations
    // ========================================================================

    // Insert or update. Updating an existing live entry requires WRITE
    // permission for the writer (opts.owner, system when "system").
    // Partitions may not contain ':'. Creating a key that has no live entry
    // starts from a fresh ACL.
    Status store(const std::string& key, const Json& value, const StoreOptions& opts = StoreOptions());

    // NOT_FOUND for absent/expired, ACCESS_DENIED when the check fails
    Result<MemoryEntry> retrieve(const std::string& key, const std::string& partition,
                                 const AgentIdentity& who);

    // Live entries whose key matches a '*' glob and that `who` may read
    Result<std::vector<MemoryEntry>> query(const std::string& pattern, const QueryOptions& opts,
                                           const AgentIdentity& who);

    // Owner or system agent only
    Status remove(const std::string& key, const std::string& partition, const AgentIdentity& who);

    // Remove every entry (and ACL row) in a partition, returns removed count
    Result<int> clear(const std::string& partition);

    // TTL sweep over memory_entries, never throws, returns removed rows
    int sweep_expired();

    Result<int64_t> count(const std::string& partition = "");

    // ========================================================================
    // ACL Operations
    // ========================================================================

    // Effective ACL: row visibility merged with persisted grants/blocks
    Result<AclRecord> get_acl(const std::string& key, const std::string& partition);

    Status grant_permission(const std::string& key, const std::string& partition, const AgentIdentity& who,
                            const std::string& agent_id, const std::set<Permission>& permissions);
    Status revoke_permission(const std::string& key, const std::string& partition, const AgentIdentity& who,
                             const std::string& agent_id, const std::set<Permission>& permissions);
    Status block_agent(const std::string& key, const std::string& partition, const AgentIdentity& who,
                       const std::string& agent_id);
    Status unblock_agent(const std::string& key, const std::string& partition, const AgentIdentity& who,
                         const std::string& agent_id);

    // ========================================================================
    // Modification Tracking
    // ========================================================================

    struct Change {
        MemoryEntry entry;
        int64_t seq;
    };

    // Change sequence of the entry's last local write, 0 when never
    // modified in this process
    int64_t change_seq(const std::string& partition, const std::string& key) const;
    // Highest sequence handed out so far
    int64_t current_seq() const;

    // Live entries changed after sequence `since`, ascending by sequence;
    // empty partition = all
    std::vector<Change> changed_since(int64_t since, const std::string& partition = "");

    // Last-writer-wins apply of a replicated entry. Returns true when the
    // entry replaced (or created) the local row.
    Result<bool> apply_remote(const MemoryEntry& entry);

    AclStore& acl_store() { return acls_; }
    RowStore& rows() { return rows_; }

private:
    Status check_access(const Row& row, const AgentIdentity& who, Permission permission);
    AclRecord acl_for(const Row& row);
    // Ensures a memory_acl row exists, then authorizes `who` for permission
    Status prepare_acl_change(const std::string& key, const std::string& partition,
                              const AgentIdentity& who, Permission needed);
    // Caller holds the database lock
    void touch(const std::string& partition, const std::string& key);
    Status drop_stale_acl(const std::string& partition, const std::string& key);

    static MemoryEntry entry_from_row(const Row& row);
    static Row row_from_entry(const MemoryEntry& entry);

    EngineContext& ctx_;
    SqliteRowStore sqlite_rows_;
    RowStore& rows_;
    AclStore acls_;

    typedef std::pair<std::string, std::string> EntryKey;   // (partition, key)
    std::map<EntryKey, int64_t> change_seq_;
    int64_t next_seq_;
    mutable std::mutex modified_mutex_;
};

} // namespace hivemem

#endif // hivemem_MEMORY_MANAGER_HPP
