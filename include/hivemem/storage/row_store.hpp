/*
 * HiveMem C++ - Row store
 *
 *   RowStore       - namespace+key row interface the memory layer talks to
 *   SqliteRowStore - RowStore over the memory_entries table
 *
 * Rows are opaque to this layer: access fields are carried but never
 * interpreted here. Expiry uses expires_at with 0 meaning "never".
 */
#ifndef hivemem_STORAGE_ROW_STORE_HPP
#define hivemem_STORAGE_ROW_STORE_HPP

#include <hivemem/core/result.hpp>
#include <hivemem/storage/database.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace hivemem {

struct Row {
    std::string ns;             // partition
    std::string key;
    std::string value;          // serialized payload
    std::string owner;
    std::string access_level;
    std::string team_id;
    std::string swarm_id;
    int64_t created_at;         // unix ms
    int64_t updated_at;         // unix ms, last writer timestamp
    int64_t expires_at;         // unix ms, 0 = never

    Row() : created_at(0), updated_at(0), expires_at(0) {}

    bool expired_at(int64_t now) const { return expires_at != 0 && expires_at <= now; }
};

struct RowScan {
    std::string ns;             // empty = every namespace
    std::string key_like;       // SQL LIKE pattern, empty = every key
    int64_t live_at;            // skip rows expired at this time, 0 = include expired
    int limit;                  // 0 = unlimited

    RowScan() : live_at(0), limit(0) {}
};

class RowStore {
public:
    virtual ~RowStore() {}

    // Insert or replace the row at (ns, key)
    virtual Status put(const Row& row) = 0;
    // NOT_FOUND when absent (expired rows are still returned)
    virtual Result<Row> get(const std::string& ns, const std::string& key) = 0;
    virtual Result<std::vector<Row>> scan(const RowScan& scan) = 0;
    // Number of rows removed (0 when absent)
    virtual Result<int> remove(const std::string& ns, const std::string& key) = 0;
    virtual Result<int> remove_namespace(const std::string& ns) = 0;
    // Removes rows with expires_at != 0 AND expires_at <= now
    virtual Result<int> remove_expired(int64_t now) = 0;

    virtual Result<int64_t> count(const std::string& ns, int64_t live_at) = 0;
    virtual Result<std::vector<std::string>> namespaces() = 0;
};

class SqliteRowStore : public RowStore {
public:
    explicit SqliteRowStore(Database& db);

    bool ensure_schema();

    Status put(const Row& row) override;
    Result<Row> get(const std::string& ns, const std::string& key) override;
    Result<std::vector<Row>> scan(const RowScan& scan) override;
    Result<int> remove(const std::string& ns, const std::string& key) override;
    Result<int> remove_namespace(const std::string& ns) override;
    Result<int> remove_expired(int64_t now) override;
    Result<int64_t> count(const std::string& ns, int64_t live_at) override;
    Result<std::vector<std::string>> namespaces() override;

private:
    Database& db_;
};

} // namespace hivemem

#endif // hivemem_STORAGE_ROW_STORE_HPP
