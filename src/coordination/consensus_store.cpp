/*
 * HiveMem C++ - Consensus proposals Implementation
 */
#include <hivemem/coordination/consensus_store.hpp>
#include <hivemem/core/logger.hpp>
#include <algorithm>

namespace hivemem {

namespace {

const char* kProposalColumns =
    "id, decision, proposer, votes, quorum, status, version, ttl, created_at, expires_at";

bool known_status(const std::string& status) {
    return status == "pending" || status == "approved" || status == "rejected";
}

ConsensusProposal proposal_from_stmt(const Statement& stmt) {
    ConsensusProposal p;
    p.id = stmt.column_text(0);
    p.decision = stmt.column_text(1);
    p.proposer = stmt.column_text(2);
    Json votes = Json::parse(stmt.column_text(3), nullptr, false);
    if (votes.is_array()) {
        for (const auto& v : votes) {
            if (v.is_string()) p.votes.push_back(v.get<std::string>());
        }
    }
    p.quorum = static_cast<int>(stmt.column_int64(4));
    p.status = stmt.column_text(5);
    p.version = static_cast<int>(stmt.column_int64(6));
    p.ttl_seconds = stmt.column_int64(7);
    p.created_at = stmt.column_int64(8);
    p.expires_at = stmt.column_is_null(9) ? 0 : stmt.column_int64(9);
    return p;
}

} // anonymous namespace

Json ConsensusProposal::to_json() const {
    Json j;
    j["id"] = id;
    j["decision"] = decision;
    j["proposer"] = proposer;
    j["votes"] = votes;
    j["quorum"] = quorum;
    j["status"] = status;
    j["version"] = version;
    j["ttl"] = ttl_seconds;
    j["createdAt"] = created_at;
    j["expiresAt"] = expires_at;
    return j;
}

ConsensusStore::ConsensusStore(EngineContext& ctx) : ctx_(ctx) {}

bool ConsensusStore::ensure_schema() {
    return ctx_.db.ensure_table("consensus_state", {
        "CREATE TABLE IF NOT EXISTS consensus_state ("
        "  id TEXT PRIMARY KEY,"
        "  decision TEXT NOT NULL,"
        "  proposer TEXT NOT NULL,"
        "  votes TEXT NOT NULL,"
        "  quorum INTEGER NOT NULL,"
        "  status TEXT NOT NULL,"
        "  version INTEGER NOT NULL DEFAULT 1,"
        "  ttl INTEGER NOT NULL,"
        "  expires_at INTEGER,"
        "  created_at INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_consensus_status ON consensus_state(status)",
        "CREATE INDEX IF NOT EXISTS idx_consensus_expires ON consensus_state(expires_at)"
    });
}

Status ConsensusStore::create_proposal(const ConsensusProposal& proposal) {
    if (proposal.id.empty() || proposal.decision.empty() || proposal.proposer.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "proposal requires id, decision and proposer");
    }
    if (proposal.quorum < 1) {
        return Status::fail(ErrorCode::VALIDATION, "quorum must be at least 1");
    }
    if (!known_status(proposal.status)) {
        return Status::fail(ErrorCode::VALIDATION, "unknown proposal status: " + proposal.status);
    }

    int64_t ttl = proposal.ttl_seconds >= 0 ? proposal.ttl_seconds
                                            : ctx_.config.default_ttl_for("consensus");

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    int64_t now = ctx_.now_ms();
    Result<ConsensusProposal> existing = load(proposal.id, now);
    if (existing) {
        return Status::fail(ErrorCode::VALIDATION, "proposal already exists: " + proposal.id);
    }
    if (existing.code != ErrorCode::NOT_FOUND) {
        return existing.status();
    }

    // An expired row with the same id is replaced
    Statement stmt(ctx_.db,
        "INSERT OR REPLACE INTO consensus_state "
        "(id, decision, proposer, votes, quorum, status, version, ttl, expires_at, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    Json votes = proposal.votes;
    stmt.bind_text(1, proposal.id);
    stmt.bind_text(2, proposal.decision);
    stmt.bind_text(3, proposal.proposer);
    stmt.bind_text(4, votes.dump());
    stmt.bind_int64(5, proposal.quorum);
    stmt.bind_text(6, proposal.status);
    stmt.bind_int64(7, proposal.version > 0 ? proposal.version : 1);
    stmt.bind_int64(8, ttl);
    if (ttl > 0) {
        stmt.bind_int64(9, now + ttl * 1000);
    } else {
        stmt.bind_null(9);
    }
    stmt.bind_int64(10, now);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }

    LOG_DEBUG("[Consensus] %s proposed %s (quorum %d)", proposal.proposer.c_str(), proposal.id.c_str(),
              proposal.quorum);
    return Status::ok();
}

Result<ConsensusProposal> ConsensusStore::load(const std::string& id, int64_t now) {
    Statement stmt(ctx_.db, std::string("SELECT ") + kProposalColumns +
                            " FROM consensus_state WHERE id = ? AND (expires_at IS NULL OR expires_at > ?)");
    if (!stmt.ok()) {
        return Result<ConsensusProposal>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, id);
    stmt.bind_int64(2, now);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<ConsensusProposal>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<ConsensusProposal>::fail(ErrorCode::NOT_FOUND, "consensus proposal not found: " + id);
    }
    return Result<ConsensusProposal>::ok(proposal_from_stmt(stmt));
}

Status ConsensusStore::write_state(const ConsensusProposal& proposal) {
    Statement stmt(ctx_.db, "UPDATE consensus_state SET votes = ?, status = ?, version = ? WHERE id = ?");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    Json votes = proposal.votes;
    stmt.bind_text(1, votes.dump());
    stmt.bind_text(2, proposal.status);
    stmt.bind_int64(3, proposal.version);
    stmt.bind_text(4, proposal.id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Status::ok();
}

Result<ConsensusProposal> ConsensusStore::get(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<ConsensusProposal>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return load(id, ctx_.now_ms());
}

Result<bool> ConsensusStore::vote(const std::string& id, const std::string& agent_id) {
    if (agent_id.empty()) {
        return Result<bool>::fail(ErrorCode::VALIDATION, "voter id must not be empty");
    }

    Transaction txn(ctx_.db);
    if (!ensure_schema() || !txn.active()) {
        return Result<bool>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    Result<ConsensusProposal> loaded = load(id, ctx_.now_ms());
    if (!loaded) {
        return Result<bool>::fail(loaded.status());
    }
    ConsensusProposal& proposal = loaded.value;
    if (proposal.status == "rejected") {
        return Result<bool>::fail(ErrorCode::VALIDATION, "proposal " + id + " was rejected");
    }

    if (std::find(proposal.votes.begin(), proposal.votes.end(), agent_id) == proposal.votes.end()) {
        proposal.votes.push_back(agent_id);
        proposal.version++;
    }
    bool approved = static_cast<int>(proposal.votes.size()) >= proposal.quorum;
    if (approved && proposal.status != "approved") {
        proposal.status = "approved";
        LOG_INFO("[Consensus] Proposal %s approved with %d votes", id.c_str(),
                 static_cast<int>(proposal.votes.size()));
    }

    Status s = write_state(proposal);
    if (!s) {
        return Result<bool>::fail(s);
    }
    if (!txn.commit()) {
        return Result<bool>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<bool>::ok(approved);
}

Status ConsensusStore::reject(const std::string& id, const std::string& agent_id) {
    Transaction txn(ctx_.db);
    if (!ensure_schema() || !txn.active()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    Result<ConsensusProposal> loaded = load(id, ctx_.now_ms());
    if (!loaded) {
        return loaded.status();
    }
    ConsensusProposal& proposal = loaded.value;
    if (proposal.proposer != agent_id) {
        return Status::fail(ErrorCode::ACCESS_DENIED, "only the proposer may reject " + id);
    }
    if (proposal.status != "pending") {
        return Status::fail(ErrorCode::VALIDATION, "proposal " + id + " is already " + proposal.status);
    }

    proposal.status = "rejected";
    proposal.version++;
    Status s = write_state(proposal);
    if (!s) {
        return s;
    }
    if (!txn.commit()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Status::ok();
}

Result<std::vector<ConsensusProposal>> ConsensusStore::query_by_status(const std::string& status) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<ConsensusProposal>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kProposalColumns +
        " FROM consensus_state WHERE status = ? AND (expires_at IS NULL OR expires_at > ?) "
        "ORDER BY created_at ASC, id ASC");
    if (!stmt.ok()) {
        return Result<std::vector<ConsensusProposal>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, status);
    stmt.bind_int64(2, ctx_.now_ms());
    std::vector<ConsensusProposal> out;
    while (stmt.step_row()) {
        out.push_back(proposal_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<ConsensusProposal>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<ConsensusProposal>>::ok(std::move(out));
}

int ConsensusStore::sweep_expired() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        LOG_ERROR("[Consensus] Sweep skipped: %s", ctx_.db.last_error().c_str());
        return 0;
    }
    Statement stmt(ctx_.db, "DELETE FROM consensus_state WHERE expires_at IS NOT NULL AND expires_at <= ?");
    if (!stmt.ok()) return 0;
    stmt.bind_int64(1, ctx_.now_ms());
    if (!stmt.run()) {
        LOG_ERROR("[Consensus] Sweep failed: %s", stmt.error().c_str());
        return 0;
    }
    return ctx_.db.changes();
}

Result<int64_t> ConsensusStore::count() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM consensus_state");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
