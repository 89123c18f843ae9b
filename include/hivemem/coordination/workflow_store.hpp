/*
 * HiveMem C++ - Workflow checkpoint store
 *
 * Every checkpoint is kept (ttl fixed at 0). Resuming a workflow reads
 * its latest checkpoint.
 */
#ifndef hivemem_COORDINATION_WORKFLOW_STORE_HPP
#define hivemem_COORDINATION_WORKFLOW_STORE_HPP

#include <hivemem/core/json.hpp>
#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <string>
#include <vector>

namespace hivemem {

struct WorkflowCheckpoint {
    int64_t seq;                // monotonically increasing per database
    std::string workflow_id;
    std::string step;
    std::string status;         // e.g. pending, running, completed, failed
    Json checkpoint;
    std::string sha;
    int64_t created_at;
    int64_t updated_at;

    WorkflowCheckpoint() : seq(0), checkpoint(Json::object()), created_at(0), updated_at(0) {}
};

class WorkflowStore {
public:
    explicit WorkflowStore(EngineContext& ctx);

    bool ensure_schema();

    // Appends a checkpoint, returns its sequence number
    Result<int64_t> save_checkpoint(const std::string& workflow_id, const std::string& step,
                                    const std::string& status, const Json& checkpoint,
                                    const std::string& sha = "");

    // NOT_FOUND when the workflow has no checkpoints
    Result<WorkflowCheckpoint> latest(const std::string& workflow_id);
    // Oldest first
    Result<std::vector<WorkflowCheckpoint>> history(const std::string& workflow_id);

    // Sets the status of the latest checkpoint
    Status update_status(const std::string& workflow_id, const std::string& status);

    // Latest checkpoint of each workflow currently in `status`
    Result<std::vector<WorkflowCheckpoint>> query_by_status(const std::string& status);

    Result<int64_t> count_workflows();

private:
    EngineContext& ctx_;
};

} // namespace hivemem

#endif // hivemem_COORDINATION_WORKFLOW_STORE_HPP
