/*
 * HiveMem C++ - Event log
 *
 * Append-only audit events with a fixed 30 day TTL. Observability data:
 * nothing in the engine reads events back to make decisions.
 */
#ifndef hivemem_COORDINATION_EVENT_LOG_HPP
#define hivemem_COORDINATION_EVENT_LOG_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct Event {
    std::string id;
    std::string type;
    Json payload;
    std::string source;
    int64_t timestamp;      // unix ms
    int64_t expires_at;

    Event() : timestamp(0), expires_at(0) {}
};

struct EventQuery {
    std::string type;       // empty = any type
    std::string source;     // empty = any source
    int64_t since;          // inclusive, 0 = unbounded
    int64_t until;          // inclusive, 0 = unbounded
    int limit;

    EventQuery() : since(0), until(0), limit(100) {}
};

class EventLog {
public:
    static constexpr int64_t EVENT_TTL_SECONDS = 2592000;   // 30 days

    explicit EventLog(EngineContext& ctx);

    bool ensure_schema();

    // Returns the event id
    Result<std::string> append(const std::string& type, const Json& payload, const std::string& source);

    // Newest first
    Result<std::vector<Event>> query(const EventQuery& q);
    Result<std::vector<Event>> by_source(const std::string& source, int limit = 100);

    int sweep_expired();
    Result<int64_t> count();

private:
    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_COORDINATION_EVENT_LOG_HPP
