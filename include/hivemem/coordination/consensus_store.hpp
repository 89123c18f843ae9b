/*
 * HiveMem C++ - Consensus proposals
 *
 * Agents propose decisions and vote on them. A proposal is approved once
 * the number of distinct voters reaches its quorum. Proposals expire after
 * their ttl (the "consensus" ttl default when none is given).
 */
#ifndef hivemem_COORDINATION_CONSENSUS_STORE_HPP
#define hivemem_COORDINATION_CONSENSUS_STORE_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct ConsensusProposal {
    std::string id;
    std::string decision;
    std::string proposer;
    std::vector<std::string> votes;     // distinct voter ids, in vote order
    int quorum;
    std::string status;                 // pending, approved or rejected
    int version;
    int64_t ttl_seconds;                // < 0: configured default, 0: never expires
    int64_t created_at;
    int64_t expires_at;                 // 0 = never

    ConsensusProposal()
        : quorum(1), status("pending"), version(1), ttl_seconds(-1), created_at(0), expires_at(0) {}

    Json to_json() const;
};

class ConsensusStore {
public:
    explicit ConsensusStore(EngineContext& ctx);

    bool ensure_schema();

    // VALIDATION for a missing id/decision/proposer, quorum < 1, an unknown
    // status or an id that is still live
    Status create_proposal(const ConsensusProposal& proposal);

    // NOT_FOUND when absent or expired
    Result<ConsensusProposal> get(const std::string& id);

    // Records agent_id's vote (at most once per agent). Returns whether the
    // proposal is approved after the vote. Rejected proposals take no votes.
    Result<bool> vote(const std::string& id, const std::string& agent_id);

    // Only the proposer may reject a pending proposal
    Status reject(const std::string& id, const std::string& agent_id);

    // Live proposals in `status`, oldest first
    Result<std::vector<ConsensusProposal>> query_by_status(const std::string& status);

    // Deletes expired proposals, never throws, returns removed rows
    int sweep_expired();

    Result<int64_t> count();

private:
    Result<ConsensusProposal> load(const std::string& id, int64_t now);
    Status write_state(const ConsensusProposal& proposal);

    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_COORDINATION_CONSENSUS_STORE_HPP
