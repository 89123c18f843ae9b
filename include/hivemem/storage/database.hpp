/*
 * HiveMem C++ - SQLite database context
 *
 *   Database    - owns the sqlite3 handle, pragmas, lazy table creation
 *   Statement   - RAII prepared statement with typed bind/column helpers
 *   Transaction - RAII BEGIN IMMEDIATE / COMMIT, rolls back unless committed
 *
 * One connection is shared by every store in the engine. Callers hold
 * Database::mutex() for the duration of a statement sequence; a
 * Transaction holds it for its whole lifetime, which makes
 * read-modify-write sequences atomic across threads.
 */
#ifndef hivemem_STORAGE_DATABASE_HPP
#define hivemem_STORAGE_DATABASE_HPP

#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace hivemem {

class Database {
public:
    Database();
    ~Database();

    // Opens (creating if needed) the file at path; ":memory:" is allowed
    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // Run one or more statements without results. Logs and returns false on error.
    bool exec(const std::string& sql);

    // Create a table (and its indexes) the first time it is needed.
    // ddl is run with CREATE ... IF NOT EXISTS semantics, once per process.
    bool ensure_table(const std::string& name, const std::vector<std::string>& ddl);

    bool table_exists(const std::string& name);
    bool has_column(const std::string& table, const std::string& column);
    // ALTER TABLE ADD COLUMN when the column is missing (older databases)
    bool add_column_if_missing(const std::string& table, const std::string& column,
                               const std::string& declaration);

    int changes() const;
    int64_t last_insert_rowid() const;

    std::recursive_mutex& mutex() { return mutex_; }
    sqlite3* handle() { return db_; }

    std::string last_error() const;
    void set_error(const std::string& error);
    void set_error_from_db();

private:
    Database(const Database&);
    Database& operator=(const Database&);

    sqlite3* db_;
    std::string path_;
    std::string last_error_;
    std::set<std::string> ready_tables_;
    mutable std::recursive_mutex mutex_;
};

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    // False when preparation failed (error already logged)
    bool ok() const { return stmt_ != nullptr; }

    void bind_text(int index, const std::string& value);
    void bind_int64(int index, int64_t value);
    void bind_double(int index, double value);
    void bind_null(int index);
    // Binds NULL for an empty string
    void bind_text_or_null(int index, const std::string& value);
    void bind_blob(int index, const void* data, size_t size);

    // true while a row is available
    bool step_row();
    // Run to completion; false on error
    bool run();
    void reset();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;
    std::string column_blob(int col) const;

    const std::string& error() const { return error_; }

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);

    Database& db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
    std::string error_;
};

class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    bool active() const { return active_; }
    bool commit();
    void rollback();

private:
    Transaction(const Transaction&);
    Transaction& operator=(const Transaction&);

    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_;
};

} // namespace hivemem

#endif // hivemem_STORAGE_DATABASE_HPP
