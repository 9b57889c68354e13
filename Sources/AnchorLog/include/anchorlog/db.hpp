#pragma once

#ifdef __cplusplus

#include <sqlite3.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace anchorlog {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// SQLite column value
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>
>;

/// One sqlite3 connection. Every statement is prepared, bound and finalized
/// per call; failures throw db_error.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    using row_t = std::unordered_map<std::string, column_value_t>;

    /// Statement with no result rows.
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {});
    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {});

    /// INSERT, or INSERT ... ON CONFLICT(conflict_columns) DO UPDATE of the
    /// remaining columns.
    void upsert(const std::string& table,
                const std::vector<std::pair<std::string, column_value_t>>& values,
                const std::vector<std::string>& conflict_columns = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const { return sqlite3_get_autocommit(db_) == 0; }

    /// Rows touched by the last INSERT/UPDATE/DELETE.
    int changes() const { return sqlite3_changes(db_); }

    const std::string& path() const { return path_; }
    bool is_memory() const { return path_ == ":memory:" || path_.empty(); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    class statement;
    [[noreturn]] void fail(const std::string& what) const;
};

/// Rolls back on scope exit unless commit() was called.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();

private:
    database& db_;
    bool committed_ = false;
};

// Row accessors. Missing or NULL columns yield the fallback / empty value.
int64_t row_int(const database::row_t& row, const std::string& column, int64_t fallback = 0);
std::string row_text(const database::row_t& row, const std::string& column);
std::vector<uint8_t> row_blob(const database::row_t& row, const std::string& column);
bool row_is_null(const database::row_t& row, const std::string& column);

} // namespace anchorlog

#endif // __cplusplus
