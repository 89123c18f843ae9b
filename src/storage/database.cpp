/*
 * HiveMem C++ - SQLite database context Implementation
 */
#include <hivemem/storage/database.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>

namespace hivemem {

// ============================================================================
// Database
// ============================================================================

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::open(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        close();
    }

    if (path != ":memory:" && !create_parent_directory(path)) {
        LOG_ERROR("[Database] Failed to create parent directory for '%s'", path.c_str());
        return false;
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        set_error(db_ ? sqlite3_errmsg(db_) : "out of memory");
        LOG_ERROR("[Database] Failed to open database '%s': %s", path.c_str(), last_error_.c_str());
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        return false;
    }
    path_ = path;
    ready_tables_.clear();

    // WAL for concurrent readers alongside the single writer
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA busy_timeout=5000");

    LOG_INFO("[Database] Database opened: %s", path.c_str());
    return true;
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        ready_tables_.clear();
    }
}

bool Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        set_error("database not open");
        return false;
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        set_error(err_msg ? err_msg : "unknown");
        LOG_ERROR("[Database] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool Database::ensure_table(const std::string& name, const std::vector<std::string>& ddl) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (ready_tables_.count(name)) {
        return true;
    }
    for (const auto& sql : ddl) {
        if (!exec(sql)) {
            LOG_ERROR("[Database] Failed to create table '%s'", name.c_str());
            return false;
        }
    }
    ready_tables_.insert(name);
    LOG_DEBUG("[Database] Table ready: %s", name.c_str());
    return true;
}

bool Database::table_exists(const std::string& name) {
    Statement stmt(*this, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
    if (!stmt.ok()) return false;
    stmt.bind_text(1, name);
    return stmt.step_row();
}

bool Database::has_column(const std::string& table, const std::string& column) {
    Statement stmt(*this, "PRAGMA table_info(" + table + ")");
    if (!stmt.ok()) return false;
    while (stmt.step_row()) {
        if (stmt.column_text(1) == column) {
            return true;
        }
    }
    return false;
}

bool Database::add_column_if_missing(const std::string& table, const std::string& column,
                                     const std::string& declaration) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (has_column(table, column)) {
        return true;
    }
    LOG_INFO("[Database] Migrating %s: adding column %s", table.c_str(), column.c_str());
    return exec("ALTER TABLE " + table + " ADD COLUMN " + column + " " + declaration);
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

int64_t Database::last_insert_rowid() const {
    return db_ ? static_cast<int64_t>(sqlite3_last_insert_rowid(db_)) : 0;
}

std::string Database::last_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return last_error_;
}

void Database::set_error(const std::string& error) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    last_error_ = error;
}

void Database::set_error_from_db() {
    set_error(db_ ? sqlite3_errmsg(db_) : "database not open");
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(Database& db, const std::string& sql)
    : db_(db)
    , stmt_(nullptr)
    , sql_(sql)
{
    if (!db_.handle()) {
        error_ = "database not open";
        db_.set_error(error_);
        return;
    }
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        error_ = sqlite3_errmsg(db_.handle());
        db_.set_error(error_);
        LOG_ERROR("[Database] Prepare failed: %s\n  Query: %s", error_.c_str(), sql.c_str());
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind_text(int index, const std::string& value) {
    if (stmt_) sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_int64(int index, int64_t value) {
    if (stmt_) sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind_double(int index, double value) {
    if (stmt_) sqlite3_bind_double(stmt_, index, value);
}

void Statement::bind_null(int index) {
    if (stmt_) sqlite3_bind_null(stmt_, index);
}

void Statement::bind_text_or_null(int index, const std::string& value) {
    if (value.empty()) {
        bind_null(index);
    } else {
        bind_text(index, value);
    }
}

void Statement::bind_blob(int index, const void* data, size_t size) {
    if (stmt_) sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
}

bool Statement::step_row() {
    if (!stmt_) return false;
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) {
        error_ = sqlite3_errmsg(db_.handle());
        db_.set_error(error_);
        LOG_ERROR("[Database] Step failed: %s\n  Query: %s", error_.c_str(), sql_.c_str());
    }
    return false;
}

bool Statement::run() {
    if (!stmt_) return false;
    int rc;
    while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        error_ = sqlite3_errmsg(db_.handle());
        db_.set_error(error_);
        LOG_ERROR("[Database] Statement failed: %s\n  Query: %s", error_.c_str(), sql_.c_str());
        return false;
    }
    return true;
}

void Statement::reset() {
    if (stmt_) {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
}

std::string Statement::column_text(int col) const {
    if (!stmt_) return "";
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return stmt_ ? static_cast<int64_t>(sqlite3_column_int64(stmt_, col)) : 0;
}

double Statement::column_double(int col) const {
    return stmt_ ? sqlite3_column_double(stmt_, col) : 0.0;
}

std::string Statement::column_blob(int col) const {
    if (!stmt_) return "";
    const void* data = sqlite3_column_blob(stmt_, col);
    if (!data) return "";
    return std::string(static_cast<const char*>(data),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::column_is_null(int col) const {
    return !stmt_ || sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Database& db)
    : db_(db)
    , lock_(db.mutex())
    , active_(false)
{
    active_ = db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (active_) {
        rollback();
    }
}

bool Transaction::commit() {
    if (!active_) return false;
    if (!db_.exec("COMMIT")) {
        rollback();
        return false;
    }
    active_ = false;
    return true;
}

void Transaction::rollback() {
    if (!active_) return;
    active_ = false;
    if (!db_.exec("ROLLBACK")) {
        LOG_WARN("[Database] Rollback failed: %s", db_.last_error().c_str());
    }
}

} // namespace hivemem
