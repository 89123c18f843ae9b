/*
 * HiveMem C++ - Workflow checkpoint store Implementation
 */
#include <hivemem/coordination/workflow_store.hpp>
#include <hivemem/core/logger.hpp>

namespace hivemem {

namespace {

const char* kCheckpointColumns =
    "seq, workflow_id, step, status, checkpoint, sha, created_at, updated_at";

WorkflowCheckpoint checkpoint_from_stmt(const Statement& stmt) {
    WorkflowCheckpoint cp;
    cp.seq = stmt.column_int64(0);
    cp.workflow_id = stmt.column_text(1);
    cp.step = stmt.column_text(2);
    cp.status = stmt.column_text(3);
    cp.checkpoint = Json::parse(stmt.column_text(4), nullptr, false);
    if (cp.checkpoint.is_discarded()) {
        cp.checkpoint = Json::object();
    }
    cp.sha = stmt.column_text(5);
    cp.created_at = stmt.column_int64(6);
    cp.updated_at = stmt.column_int64(7);
    return cp;
}

} // anonymous namespace

WorkflowStore::WorkflowStore(EngineContext& ctx) : ctx_(ctx) {}

bool WorkflowStore::ensure_schema() {
    return ctx_.db.ensure_table("workflow_state", {
        "CREATE TABLE IF NOT EXISTS workflow_state ("
        "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  workflow_id TEXT NOT NULL,"
        "  step TEXT NOT NULL,"
        "  status TEXT NOT NULL,"
        "  checkpoint TEXT NOT NULL,"
        "  sha TEXT,"
        "  ttl INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_workflow_id ON workflow_state(workflow_id, seq)",
        "CREATE INDEX IF NOT EXISTS idx_workflow_status ON workflow_state(status)"
    });
}

Result<int64_t> WorkflowStore::save_checkpoint(const std::string& workflow_id, const std::string& step,
                                               const std::string& status, const Json& checkpoint,
                                               const std::string& sha) {
    if (workflow_id.empty() || step.empty() || status.empty()) {
        return Result<int64_t>::fail(ErrorCode::VALIDATION, "checkpoint requires workflow id, step and status");
    }

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    int64_t now = ctx_.now_ms();
    Statement stmt(ctx_.db,
        "INSERT INTO workflow_state (workflow_id, step, status, checkpoint, sha, ttl, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, 0, ?, ?)");
    if (!stmt.ok()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, workflow_id);
    stmt.bind_text(2, step);
    stmt.bind_text(3, status);
    stmt.bind_text(4, checkpoint.dump());
    stmt.bind_text_or_null(5, sha);
    stmt.bind_int64(6, now);
    stmt.bind_int64(7, now);
    if (!stmt.run()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, stmt.error());
    }

    int64_t seq = ctx_.db.last_insert_rowid();
    LOG_DEBUG("[WorkflowStore] Checkpoint %lld for %s at step %s (%s)", static_cast<long long>(seq),
              workflow_id.c_str(), step.c_str(), status.c_str());
    return Result<int64_t>::ok(seq);
}

Result<WorkflowCheckpoint> WorkflowStore::latest(const std::string& workflow_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<WorkflowCheckpoint>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kCheckpointColumns +
                            " FROM workflow_state WHERE workflow_id = ? ORDER BY seq DESC LIMIT 1");
    if (!stmt.ok()) {
        return Result<WorkflowCheckpoint>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, workflow_id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<WorkflowCheckpoint>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<WorkflowCheckpoint>::fail(ErrorCode::NOT_FOUND, "no checkpoint for workflow " + workflow_id);
    }
    return Result<WorkflowCheckpoint>::ok(checkpoint_from_stmt(stmt));
}

Result<std::vector<WorkflowCheckpoint>> WorkflowStore::history(const std::string& workflow_id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kCheckpointColumns +
                            " FROM workflow_state WHERE workflow_id = ? ORDER BY seq ASC");
    if (!stmt.ok()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, workflow_id);
    std::vector<WorkflowCheckpoint> out;
    while (stmt.step_row()) {
        out.push_back(checkpoint_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<WorkflowCheckpoint>>::ok(std::move(out));
}

Status WorkflowStore::update_status(const std::string& workflow_id, const std::string& status) {
    if (status.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "status must not be empty");
    }
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db,
        "UPDATE workflow_state SET status = ?, updated_at = ? WHERE seq = "
        "(SELECT MAX(seq) FROM workflow_state WHERE workflow_id = ?)");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, status);
    stmt.bind_int64(2, ctx_.now_ms());
    stmt.bind_text(3, workflow_id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    if (ctx_.db.changes() == 0) {
        return Status::fail(ErrorCode::NOT_FOUND, "no checkpoint for workflow " + workflow_id);
    }
    return Status::ok();
}

Result<std::vector<WorkflowCheckpoint>> WorkflowStore::query_by_status(const std::string& status) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kCheckpointColumns +
        " FROM workflow_state w WHERE status = ? AND seq = "
        "(SELECT MAX(seq) FROM workflow_state WHERE workflow_id = w.workflow_id) "
        "ORDER BY updated_at DESC");
    if (!stmt.ok()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, status);
    std::vector<WorkflowCheckpoint> out;
    while (stmt.step_row()) {
        out.push_back(checkpoint_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<WorkflowCheckpoint>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<WorkflowCheckpoint>>::ok(std::move(out));
}

Result<int64_t> WorkflowStore::count_workflows() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(DISTINCT workflow_id) FROM workflow_state");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

} // namespace hivemem
