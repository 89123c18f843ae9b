/*
 * HiveMem C++ - Blackboard
 *
 * Partition-scoped hints: low-stakes coordination signals any agent can
 * post and read. No owner and no ACL, only their own TTL.
 */
#ifndef hivemem_COORDINATION_BLACKBOARD_HPP
#define hivemem_COORDINATION_BLACKBOARD_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct Hint {
    int64_t id;
    std::string partition;
    std::string key;
    Json value;
    int64_t created_at;
    int64_t expires_at;     // 0 = never

    Hint() : id(0), created_at(0), expires_at(0) {}
};

class Blackboard {
public:
    static constexpr int64_t DEFAULT_HINT_TTL_SECONDS = 1800;

    explicit Blackboard(EngineContext& ctx);

    bool ensure_schema();

    // Returns the hint id
    Result<int64_t> post_hint(const std::string& key, const Json& value,
                              const std::string& partition = "default",
                              int64_t ttl_seconds = DEFAULT_HINT_TTL_SECONDS);

    // Live hints whose key matches a '*' glob, newest first
    Result<std::vector<Hint>> read_hints(const std::string& pattern,
                                         const std::string& partition = "default",
                                         int limit = 100);

    int sweep_expired();
    Result<int64_t> count();

private:
    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_COORDINATION_BLACKBOARD_HPP
