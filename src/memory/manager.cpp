/*
 * HiveMem C++ - Memory Manager Implementation
 */
#include <hivemem/memory/manager.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <algorithm>
#include <limits>

namespace hivemem {

MemoryManager::MemoryManager(EngineContext& ctx)
    : ctx_(ctx)
    , sqlite_rows_(ctx.db)
    , rows_(sqlite_rows_)
    , acls_(ctx.db)
    , next_seq_(0)
{}

bool MemoryManager::init() {
    if (!sqlite_rows_.ensure_schema() || !acls_.ensure_schema()) {
        LOG_ERROR("[MemoryManager] Failed to initialize tables: %s", ctx_.db.last_error().c_str());
        return false;
    }
    return true;
}

// ============================================================================
// Helpers
// ============================================================================

MemoryEntry MemoryManager::entry_from_row(const Row& row) {
    MemoryEntry entry;
    entry.partition = row.ns;
    entry.key = row.key;
    entry.value = Json::parse(row.value, nullptr, false);
    if (entry.value.is_discarded()) {
        // Rows written by other tools may hold plain text
        entry.value = row.value;
    }
    entry.owner = row.owner;
    if (!parse_access_level(row.access_level, entry.access.level)) {
        entry.access.level = AccessLevel::PRIVATE;
    }
    entry.access.team_id = row.team_id;
    entry.access.swarm_id = row.swarm_id;
    entry.created_at = row.created_at;
    entry.updated_at = row.updated_at;
    entry.expires_at = row.expires_at;
    return entry;
}

Row MemoryManager::row_from_entry(const MemoryEntry& entry) {
    Row row;
    row.ns = entry.partition;
    row.key = entry.key;
    row.value = entry.value.dump();
    row.owner = entry.owner;
    row.access_level = access_level_name(entry.access.level);
    row.team_id = entry.access.team_id;
    row.swarm_id = entry.access.swarm_id;
    row.created_at = entry.created_at;
    row.updated_at = entry.updated_at;
    row.expires_at = entry.expires_at;
    return row;
}

AclRecord MemoryManager::acl_for(const Row& row) {
    AclRecord acl;
    std::string rid = resource_id(row.ns, row.key);

    Result<AclRecord> stored = acls_.get(rid);
    if (stored.success) {
        acl = stored.value;
    } else if (stored.code != ErrorCode::NOT_FOUND) {
        LOG_WARN("[MemoryManager] ACL lookup failed for %s: %s", rid.c_str(), stored.error.c_str());
    }

    // The entry row is authoritative for ownership and visibility
    acl.resource_id = rid;
    acl.owner = row.owner;
    if (!parse_access_level(row.access_level, acl.access.level)) {
        acl.access.level = AccessLevel::PRIVATE;
    }
    acl.access.team_id = row.team_id;
    acl.access.swarm_id = row.swarm_id;
    return acl;
}

Status MemoryManager::check_access(const Row& row, const AgentIdentity& who, Permission permission) {
    Status allowed = AccessControl::check(acl_for(row), who, permission);
    if (!allowed) {
        LOG_DEBUG("[MemoryManager] %s", allowed.error.c_str());
    }
    return allowed;
}

void MemoryManager::touch(const std::string& partition, const std::string& key) {
    std::lock_guard<std::mutex> lock(modified_mutex_);
    change_seq_[EntryKey(partition, key)] = ++next_seq_;
}

// Grants and blocks belong to the entry they were made on, not to the key
Status MemoryManager::drop_stale_acl(const std::string& partition, const std::string& key) {
    Status removed = acls_.remove(resource_id(partition, key));
    if (!removed) {
        LOG_ERROR("[MemoryManager] Cannot drop stale ACL of %s:%s: %s",
                  partition.c_str(), key.c_str(), removed.error.c_str());
    }
    return removed;
}

// ============================================================================
// Entry Operations
// ============================================================================

Status MemoryManager::store(const std::string& key, const Json& value, const StoreOptions& opts) {
    if (key.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "key must not be empty");
    }
    if (opts.partition.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "partition must not be empty");
    }
    if (opts.partition.find(':') != std::string::npos) {
        return Status::fail(ErrorCode::VALIDATION, "partition must not contain ':'");
    }
    if (opts.owner.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "owner must not be empty");
    }
    Status policy = opts.access.validate();
    if (!policy) {
        return policy;
    }

    int64_t ttl_seconds = opts.has_ttl ? opts.ttl_seconds : ctx_.config.default_ttl_for(opts.partition);
    if (ttl_seconds < 0) {
        return Status::fail(ErrorCode::VALIDATION, "ttlSeconds must be >= 0");
    }

    int64_t now = ctx_.now_ms();
    if (ttl_seconds > (std::numeric_limits<int64_t>::max() - now) / 1000) {
        return Status::fail(ErrorCode::VALIDATION, "ttlSeconds out of range");
    }

    MemoryEntry entry;
    entry.partition = opts.partition;
    entry.key = key;
    entry.value = value;
    entry.owner = opts.owner;
    entry.access = opts.access;
    entry.created_at = now;
    entry.updated_at = now;
    entry.expires_at = ttl_seconds == 0 ? 0 : now + ttl_seconds * 1000;

    AgentIdentity writer(opts.owner);
    writer.team_id = opts.access.team_id;
    writer.swarm_id = opts.access.swarm_id;
    writer.is_system = (opts.owner == "system");

    {
        // Check and write under one lock so a concurrent owner change cannot slip in
        std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());

        Result<Row> existing = rows_.get(opts.partition, key);
        if (existing.success && !existing.value.expired_at(now)) {
            Status allowed = check_access(existing.value, writer, Permission::WRITE);
            if (!allowed) {
                return allowed;
            }
            entry.created_at = existing.value.created_at;
            if (existing.value.owner != opts.owner && !writer.is_system) {
                // Shared writers update the value; ownership and visibility stay
                entry.owner = existing.value.owner;
                const Row& prev = existing.value;
                if (!parse_access_level(prev.access_level, entry.access.level)) {
                    entry.access.level = AccessLevel::PRIVATE;
                }
                entry.access.team_id = prev.team_id;
                entry.access.swarm_id = prev.swarm_id;
            }
        } else if (!existing.success && existing.code != ErrorCode::NOT_FOUND) {
            return existing.status();
        } else {
            Status dropped = drop_stale_acl(opts.partition, key);
            if (!dropped) {
                return dropped;
            }
        }

        Status written = rows_.put(row_from_entry(entry));
        if (!written) {
            LOG_ERROR("[MemoryManager] Failed to store %s:%s: %s",
                      opts.partition.c_str(), key.c_str(), written.error.c_str());
            return written;
        }
        touch(opts.partition, key);
    }

    LOG_DEBUG("[MemoryManager] Stored %s:%s (owner=%s, access=%s, ttl=%lld)",
              opts.partition.c_str(), key.c_str(), entry.owner.c_str(),
              access_level_name(entry.access.level), static_cast<long long>(ttl_seconds));
    return Status::ok();
}

Result<MemoryEntry> MemoryManager::retrieve(const std::string& key, const std::string& partition,
                                            const AgentIdentity& who) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    Result<Row> row = rows_.get(partition, key);
    if (!row) {
        return Result<MemoryEntry>::fail(row.code, row.error);
    }

    int64_t now = ctx_.now_ms();
    if (row.value.expired_at(now)) {
        // Lazy removal; the sweep would get it anyway
        Result<int> removed = rows_.remove(partition, key);
        if (!removed) {
            LOG_WARN("[MemoryManager] Lazy expiry of %s:%s failed: %s",
                     partition.c_str(), key.c_str(), removed.error.c_str());
        } else if (drop_stale_acl(partition, key)) {
            std::lock_guard<std::mutex> mod_lock(modified_mutex_);
            change_seq_.erase(EntryKey(partition, key));
        }
        return Result<MemoryEntry>::fail(ErrorCode::NOT_FOUND, "entry " + partition + ":" + key + " expired");
    }

    Status allowed = check_access(row.value, who, Permission::READ);
    if (!allowed) {
        return Result<MemoryEntry>::fail(allowed);
    }
    return Result<MemoryEntry>::ok(entry_from_row(row.value));
}

Result<std::vector<MemoryEntry>> MemoryManager::query(const std::string& pattern, const QueryOptions& opts,
                                                      const AgentIdentity& who) {
    RowScan scan;
    scan.ns = opts.partition;
    scan.key_like = pattern.empty() ? "" : glob_to_like(pattern);
    scan.live_at = ctx_.now_ms();

    Result<std::vector<Row>> rows = rows_.scan(scan);
    if (!rows) {
        return Result<std::vector<MemoryEntry>>::fail(rows.code, rows.error);
    }

    std::vector<MemoryEntry> out;
    for (const auto& row : rows.value) {
        if (!AccessControl::allowed(acl_for(row), who, Permission::READ)) {
            continue;
        }
        out.push_back(entry_from_row(row));
        if (opts.limit > 0 && static_cast<int>(out.size()) >= opts.limit) {
            break;
        }
    }
    return Result<std::vector<MemoryEntry>>::ok(std::move(out));
}

Status MemoryManager::remove(const std::string& key, const std::string& partition, const AgentIdentity& who) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());

    Result<Row> row = rows_.get(partition, key);
    if (!row) {
        return row.status();
    }
    Status allowed = check_access(row.value, who, Permission::DELETE);
    if (!allowed) {
        return allowed;
    }

    Result<int> removed = rows_.remove(partition, key);
    if (!removed) {
        return removed.status();
    }
    Status acl_removed = acls_.remove(resource_id(partition, key));
    if (!acl_removed) {
        LOG_WARN("[MemoryManager] Entry %s:%s removed but ACL cleanup failed: %s",
                 partition.c_str(), key.c_str(), acl_removed.error.c_str());
    }

    std::lock_guard<std::mutex> mod_lock(modified_mutex_);
    change_seq_.erase(EntryKey(partition, key));
    return Status::ok();
}

Result<int> MemoryManager::clear(const std::string& partition) {
    if (partition.empty()) {
        return Result<int>::fail(ErrorCode::VALIDATION, "partition must not be empty");
    }
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());

    Result<int> removed = rows_.remove_namespace(partition);
    if (!removed) {
        return removed;
    }
    Status acl_removed = acls_.remove_partition(partition);
    if (!acl_removed) {
        LOG_WARN("[MemoryManager] ACL cleanup for partition %s failed: %s",
                 partition.c_str(), acl_removed.error.c_str());
    }

    std::lock_guard<std::mutex> mod_lock(modified_mutex_);
    for (auto it = change_seq_.begin(); it != change_seq_.end();) {
        if (it->first.first == partition) {
            it = change_seq_.erase(it);
        } else {
            ++it;
        }
    }
    LOG_INFO("[MemoryManager] Cleared partition %s (%d entries)", partition.c_str(), removed.value);
    return removed;
}

int MemoryManager::sweep_expired() {
    int64_t now = ctx_.now_ms();
    Transaction txn(ctx_.db);
    if (!txn.active()) {
        LOG_ERROR("[MemoryManager] TTL sweep could not begin: %s", ctx_.db.last_error().c_str());
        return 0;
    }
    // ACL rows first, while the expired entries still name them
    Status acl_removed = acls_.remove_for_expired(now);
    if (!acl_removed) {
        LOG_ERROR("[MemoryManager] TTL sweep failed on ACLs: %s", acl_removed.error.c_str());
        return 0;
    }
    Result<int> removed = rows_.remove_expired(now);
    if (!removed) {
        LOG_ERROR("[MemoryManager] TTL sweep failed: %s", removed.error.c_str());
        return 0;
    }
    if (!txn.commit()) {
        LOG_ERROR("[MemoryManager] TTL sweep commit failed: %s", ctx_.db.last_error().c_str());
        return 0;
    }
    if (removed.value > 0) {
        LOG_DEBUG("[MemoryManager] TTL sweep removed %d entries", removed.value);
    }
    return removed.value;
}

Result<int64_t> MemoryManager::count(const std::string& partition) {
    return rows_.count(partition, ctx_.now_ms());
}

// ============================================================================
// ACL Operations
// ============================================================================

Result<AclRecord> MemoryManager::get_acl(const std::string& key, const std::string& partition) {
    Result<Row> row = rows_.get(partition, key);
    if (!row) {
        return Result<AclRecord>::fail(row.code, row.error);
    }
    return Result<AclRecord>::ok(acl_for(row.value));
}

Status MemoryManager::prepare_acl_change(const std::string& key, const std::string& partition,
                                         const AgentIdentity& who, Permission needed) {
    Result<Row> row = rows_.get(partition, key);
    if (!row) {
        return row.status();
    }
    if (row.value.expired_at(ctx_.now_ms())) {
        return Status::fail(ErrorCode::NOT_FOUND, "entry " + partition + ":" + key + " expired");
    }

    AclRecord acl = acl_for(row.value);
    Status allowed = AccessControl::check(acl, who, needed);
    if (!allowed) {
        return allowed;
    }

    std::string rid = resource_id(partition, key);
    Result<AclRecord> stored = acls_.get(rid);
    if (stored.success) {
        return Status::ok();
    }
    if (stored.code != ErrorCode::NOT_FOUND) {
        return stored.status();
    }
    acl.created_at = ctx_.now_ms();
    acl.updated_at = acl.created_at;
    return acls_.store(acl);
}

Status MemoryManager::grant_permission(const std::string& key, const std::string& partition,
                                       const AgentIdentity& who, const std::string& agent_id,
                                       const std::set<Permission>& permissions) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    Status ready = prepare_acl_change(key, partition, who, Permission::SHARE);
    if (!ready) return ready;
    return acls_.grant(resource_id(partition, key), agent_id, permissions);
}

Status MemoryManager::revoke_permission(const std::string& key, const std::string& partition,
                                        const AgentIdentity& who, const std::string& agent_id,
                                        const std::set<Permission>& permissions) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    Status ready = prepare_acl_change(key, partition, who, Permission::SHARE);
    if (!ready) return ready;
    return acls_.revoke(resource_id(partition, key), agent_id, permissions);
}

Status MemoryManager::block_agent(const std::string& key, const std::string& partition,
                                  const AgentIdentity& who, const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    // Blocking changes visibility, so only the owner or a system agent may do it
    Status ready = prepare_acl_change(key, partition, who, Permission::DELETE);
    if (!ready) return ready;

    Result<Row> row = rows_.get(partition, key);
    if (row.success && row.value.owner == agent_id) {
        return Status::fail(ErrorCode::VALIDATION, "cannot block the owner of " + resource_id(partition, key));
    }
    return acls_.block(resource_id(partition, key), agent_id);
}

Status MemoryManager::unblock_agent(const std::string& key, const std::string& partition,
                                    const AgentIdentity& who, const std::string& agent_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    Status ready = prepare_acl_change(key, partition, who, Permission::DELETE);
    if (!ready) return ready;
    return acls_.unblock(resource_id(partition, key), agent_id);
}

// ============================================================================
// Modification Tracking
// ============================================================================

int64_t MemoryManager::change_seq(const std::string& partition, const std::string& key) const {
    std::lock_guard<std::mutex> lock(modified_mutex_);
    auto it = change_seq_.find(EntryKey(partition, key));
    return it != change_seq_.end() ? it->second : 0;
}

int64_t MemoryManager::current_seq() const {
    std::lock_guard<std::mutex> lock(modified_mutex_);
    return next_seq_;
}

std::vector<MemoryManager::Change> MemoryManager::changed_since(int64_t since, const std::string& partition) {
    // Writers assign sequences under this lock, so the snapshot and the rows agree
    std::lock_guard<std::recursive_mutex> db_lock(ctx_.db.mutex());

    std::vector<std::pair<int64_t, EntryKey>> keys;
    {
        std::lock_guard<std::mutex> lock(modified_mutex_);
        for (const auto& kv : change_seq_) {
            if (kv.second <= since) continue;
            if (!partition.empty() && kv.first.first != partition) continue;
            keys.push_back(std::make_pair(kv.second, kv.first));
        }
    }
    std::sort(keys.begin(), keys.end());

    std::vector<Change> out;
    int64_t now = ctx_.now_ms();
    for (const auto& k : keys) {
        Result<Row> row = rows_.get(k.second.first, k.second.second);
        if (!row || row.value.expired_at(now)) {
            continue;
        }
        Change c;
        c.entry = entry_from_row(row.value);
        c.seq = k.first;
        out.push_back(c);
    }
    return out;
}

Result<bool> MemoryManager::apply_remote(const MemoryEntry& entry) {
    if (entry.key.empty() || entry.partition.empty()) {
        return Result<bool>::fail(ErrorCode::VALIDATION, "replicated entry missing key or partition");
    }
    if (entry.partition.find(':') != std::string::npos) {
        return Result<bool>::fail(ErrorCode::VALIDATION, "partition must not contain ':'");
    }
    Status policy = entry.access.validate();
    if (!policy) {
        return Result<bool>::fail(policy);
    }

    {
        std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
        Result<Row> local = rows_.get(entry.partition, entry.key);
        Row incoming = row_from_entry(entry);
        bool live = local.success && !local.value.expired_at(ctx_.now_ms());
        if (live) {
            // Equal timestamps fall back to comparing payloads so every node picks the same winner
            bool local_wins = local.value.updated_at > incoming.updated_at ||
                              (local.value.updated_at == incoming.updated_at &&
                               local.value.value >= incoming.value);
            if (local_wins) {
                return Result<bool>::ok(false);
            }
        }
        if (!local.success && local.code != ErrorCode::NOT_FOUND) {
            return Result<bool>::fail(local.code, local.error);
        }

        if (live) {
            incoming.created_at = local.value.created_at;
        } else {
            Status dropped = drop_stale_acl(entry.partition, entry.key);
            if (!dropped) {
                return Result<bool>::fail(dropped);
            }
        }
        Status written = rows_.put(incoming);
        if (!written) {
            return Result<bool>::fail(written);
        }
        touch(entry.partition, entry.key);
    }

    return Result<bool>::ok(true);
}

} // namespace hivemem
