/*
 * HiveMem C++ - Agent registry
 *
 * Agents announce their type and capabilities; coordinators look them up
 * by id or by lifecycle status (active, idle, terminated).
 */
#ifndef hivemem_COORDINATION_AGENT_REGISTRY_HPP
#define hivemem_COORDINATION_AGENT_REGISTRY_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct AgentRecord {
    std::string id;
    std::string type;
    std::vector<std::string> capabilities;
    std::string status;
    Json performance;
    int64_t created_at;
    int64_t updated_at;

    AgentRecord() : status("active"), performance(Json::object()), created_at(0), updated_at(0) {}

    Json to_json() const;
};

class AgentRegistry {
public:
    explicit AgentRegistry(EngineContext& ctx);

    bool ensure_schema();

    // VALIDATION for an empty id/type, an unknown status or an id that is
    // already registered
    Status register_agent(const AgentRecord& agent);

    Result<AgentRecord> get(const std::string& id);

    Status update_status(const std::string& id, const std::string& status);
    Status update_performance(const std::string& id, const Json& performance);

    // Most recently updated first
    Result<std::vector<AgentRecord>> query_by_status(const std::string& status);

    Result<int64_t> count();

    static bool is_known_status(const std::string& status);

private:
    Status update_column(const std::string& id, const char* sql, const std::string& value);

    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_COORDINATION_AGENT_REGISTRY_HPP
