/*
 * HiveMem C++ - Access control Implementation
 */
#include <hivemem/memory/access_control.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

// ============================================================================
// AccessControl
// ============================================================================

Status AccessControl::check(const AclRecord& acl, const AgentIdentity& who, Permission permission) {
    auto deny = [&](const std::string& reason) {
        return Status::fail(ErrorCode::ACCESS_DENIED,
                            std::string(permission_name(permission)) + " denied on " +
                            acl.resource_id + " for agent '" + who.agent_id + "': " + reason);
    };

    if (acl.blocked.count(who.agent_id)) {
        return deny("agent is blocked");
    }
    if (who.is_system || (!acl.owner.empty() && who.agent_id == acl.owner)) {
        return Status::ok();
    }
    if (permission == Permission::DELETE) {
        return deny("only the owner or a system agent may delete");
    }
    if (acl.has_grant(who.agent_id, permission)) {
        return Status::ok();
    }

    bool team_member = acl.access.level == AccessLevel::TEAM &&
                       !who.team_id.empty() && who.team_id == acl.access.team_id;
    bool swarm_member = acl.access.level == AccessLevel::SWARM &&
                        !who.swarm_id.empty() && who.swarm_id == acl.access.swarm_id;

    switch (permission) {
        case Permission::READ:
            if (acl.access.level == AccessLevel::PUBLIC || acl.access.level == AccessLevel::SYSTEM ||
                team_member || swarm_member) {
                return Status::ok();
            }
            break;
        case Permission::WRITE:
            if (team_member || swarm_member) {
                return Status::ok();
            }
            break;
        default:
            break;
    }
    return deny(std::string("not permitted at access level '") + access_level_name(acl.access.level) + "'");
}

// ============================================================================
// AclStore
// ============================================================================

namespace {

Json permissions_to_json(const std::map<std::string, std::set<Permission>>& granted) {
    Json j = Json::object();
    for (const auto& kv : granted) {
        Json perms = Json::array();
        for (Permission p : kv.second) {
            perms.push_back(permission_name(p));
        }
        j[kv.first] = perms;
    }
    return j;
}

std::map<std::string, std::set<Permission>> permissions_from_json(const std::string& text) {
    std::map<std::string, std::set<Permission>> out;
    Json j = Json::parse(text, nullptr, false);
    if (!j.is_object()) return out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array()) continue;
        for (const auto& name : it.value()) {
            Permission p;
            if (name.is_string() && parse_permission(name.get<std::string>(), p)) {
                out[it.key()].insert(p);
            }
        }
    }
    return out;
}

std::set<std::string> strings_from_json(const std::string& text) {
    std::set<std::string> out;
    Json j = Json::parse(text, nullptr, false);
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) out.insert(item.get<std::string>());
    }
    return out;
}

} // anonymous namespace

AclStore::AclStore(Database& db) : db_(db) {}

bool AclStore::ensure_schema() {
    return db_.ensure_table("memory_acl", {
        "CREATE TABLE IF NOT EXISTS memory_acl ("
        "  resource_id TEXT PRIMARY KEY,"
        "  owner TEXT NOT NULL,"
        "  access_level TEXT NOT NULL,"
        "  team_id TEXT,"
        "  swarm_id TEXT,"
        "  granted_permissions TEXT NOT NULL DEFAULT '{}',"
        "  blocked_agents TEXT NOT NULL DEFAULT '[]',"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_acl_owner ON memory_acl(owner)"
    });
}

Status AclStore::store(const AclRecord& acl) {
    if (acl.resource_id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "ACL requires a resource id");
    }
    Status valid = acl.access.validate();
    if (!valid) return valid;

    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, db_.last_error());
    }

    Statement stmt(db_,
        "INSERT OR REPLACE INTO memory_acl "
        "(resource_id, owner, access_level, team_id, swarm_id, granted_permissions, blocked_agents, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    Json blocked = Json::array();
    for (const auto& agent : acl.blocked) {
        blocked.push_back(agent);
    }
    stmt.bind_text(1, acl.resource_id);
    stmt.bind_text(2, acl.owner);
    stmt.bind_text(3, access_level_name(acl.access.level));
    stmt.bind_text_or_null(4, acl.access.team_id);
    stmt.bind_text_or_null(5, acl.access.swarm_id);
    stmt.bind_text(6, permissions_to_json(acl.granted).dump());
    stmt.bind_text(7, blocked.dump());
    stmt.bind_int64(8, acl.created_at);
    stmt.bind_int64(9, acl.updated_at);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }

    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    cache_[acl.resource_id] = acl;
    return Status::ok();
}

Result<AclRecord> AclStore::get(const std::string& resource_id) {
    {
        std::lock_guard<std::mutex> cache_lock(cache_mutex_);
        auto it = cache_.find(resource_id);
        if (it != cache_.end()) {
            return Result<AclRecord>::ok(it->second);
        }
    }
    Result<AclRecord> loaded = load(resource_id);
    if (loaded.success) {
        std::lock_guard<std::mutex> cache_lock(cache_mutex_);
        cache_[resource_id] = loaded.value;
    }
    return loaded;
}

Result<AclRecord> AclStore::load(const std::string& resource_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<AclRecord>::fail(ErrorCode::STORAGE, db_.last_error());
    }

    Statement stmt(db_,
        "SELECT resource_id, owner, access_level, team_id, swarm_id, granted_permissions, "
        "blocked_agents, created_at, updated_at FROM memory_acl WHERE resource_id = ?");
    if (!stmt.ok()) {
        return Result<AclRecord>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, resource_id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<AclRecord>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<AclRecord>::fail(ErrorCode::NOT_FOUND, "no ACL for " + resource_id);
    }

    AclRecord acl;
    acl.resource_id = stmt.column_text(0);
    acl.owner = stmt.column_text(1);
    if (!parse_access_level(stmt.column_text(2), acl.access.level)) {
        LOG_WARN("[AclStore] Unknown access level '%s' on %s, treating as private",
                 stmt.column_text(2).c_str(), resource_id.c_str());
        acl.access.level = AccessLevel::PRIVATE;
    }
    acl.access.team_id = stmt.column_text(3);
    acl.access.swarm_id = stmt.column_text(4);
    acl.granted = permissions_from_json(stmt.column_text(5));
    acl.blocked = strings_from_json(stmt.column_text(6));
    acl.created_at = stmt.column_int64(7);
    acl.updated_at = stmt.column_int64(8);
    return Result<AclRecord>::ok(acl);
}

Status AclStore::remove(const std::string& resource_id) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "DELETE FROM memory_acl WHERE resource_id = ?");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, resource_id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }

    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    cache_.erase(resource_id);
    return Status::ok();
}

Status AclStore::remove_partition(const std::string& partition) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "DELETE FROM memory_acl WHERE substr(resource_id, 1, ?) = ?");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    std::string prefix = partition + ":";
    stmt.bind_int64(1, static_cast<int64_t>(prefix.size()));
    stmt.bind_text(2, prefix);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }

    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (starts_with(it->first, prefix)) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
    return Status::ok();
}

Status AclStore::remove_for_expired(int64_t now) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_,
        "DELETE FROM memory_acl WHERE resource_id IN "
        "(SELECT partition || ':' || key FROM memory_entries WHERE expires_at != 0 AND expires_at <= ?)");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_int64(1, now);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    if (db_.changes() > 0) {
        clear_cache();
    }
    return Status::ok();
}

Status AclStore::modify(const std::string& resource_id, const std::function<void(AclRecord&)>& change) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Result<AclRecord> current = get(resource_id);
    if (!current) {
        return current.status();
    }
    AclRecord updated = current.value;
    change(updated);
    updated.updated_at = current_timestamp_ms();
    return store(updated);
}

Status AclStore::grant(const std::string& resource_id, const std::string& agent_id,
                       const std::set<Permission>& permissions) {
    if (agent_id.empty() || permissions.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "grant requires an agent and at least one permission");
    }
    return modify(resource_id, [&](AclRecord& acl) {
        acl.granted[agent_id].insert(permissions.begin(), permissions.end());
    });
}

Status AclStore::revoke(const std::string& resource_id, const std::string& agent_id,
                        const std::set<Permission>& permissions) {
    return modify(resource_id, [&](AclRecord& acl) {
        auto it = acl.granted.find(agent_id);
        if (it == acl.granted.end()) return;
        if (permissions.empty()) {
            acl.granted.erase(it);
            return;
        }
        for (Permission p : permissions) {
            it->second.erase(p);
        }
        if (it->second.empty()) {
            acl.granted.erase(it);
        }
    });
}

Status AclStore::block(const std::string& resource_id, const std::string& agent_id) {
    if (agent_id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "block requires an agent id");
    }
    return modify(resource_id, [&](AclRecord& acl) {
        acl.blocked.insert(agent_id);
    });
}

Status AclStore::unblock(const std::string& resource_id, const std::string& agent_id) {
    return modify(resource_id, [&](AclRecord& acl) {
        acl.blocked.erase(agent_id);
    });
}

Result<int64_t> AclStore::count() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    Statement stmt(db_, "SELECT COUNT(*) FROM memory_acl");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, db_.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

void AclStore::clear_cache() {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    cache_.clear();
}

} // namespace hivemem
