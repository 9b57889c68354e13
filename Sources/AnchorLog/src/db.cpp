#include "anchorlog/db.hpp"
#include "anchorlog/log.hpp"
#include <algorithm>
#include <sstream>
#include <type_traits>

namespace anchorlog {

// ============================================================================
// statement - one prepared sqlite3_stmt with its parameters bound
// ============================================================================

class database::statement {
public:
    statement(const database& owner, const std::string& sql, const std::vector<column_value_t>& params)
        : owner_(owner) {
        if (sqlite3_prepare_v2(owner_.db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            LOG_ERROR("db", "%s in %s", sqlite3_errmsg(owner_.db_), sql.c_str());
            owner_.fail("Failed to prepare statement");
        }
        int index = 1;
        for (const auto& param : params) {
            bind(index++, param);
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    /// True while a row is available; false once the statement is done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        owner_.fail("Statement failed");
    }

    row_t row() const {
        row_t out;
        int count = sqlite3_column_count(stmt_);
        for (int i = 0; i < count; ++i) {
            out[sqlite3_column_name(stmt_, i)] = column(i);
        }
        return out;
    }

private:
    const database& owner_;
    sqlite3_stmt* stmt_ = nullptr;

    void bind(int index, const column_value_t& value) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                sqlite3_bind_double(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else {
                // Empty blobs bind as zero-length, never NULL.
                sqlite3_bind_blob(stmt_, index, v.empty() ? "" : static_cast<const void*>(v.data()),
                                  static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);
    }

    column_value_t column(int i) const {
        switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, i);
            case SQLITE_TEXT: {
                const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt_, i)));
            }
            case SQLITE_BLOB: {
                const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i));
                int size = sqlite3_column_bytes(stmt_, i);
                if (!bytes || size == 0) return std::vector<uint8_t>{};
                return std::vector<uint8_t>(bytes, bytes + size);
            }
            default:
                return nullptr;
        }
    }
};

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database " + path + ": " + error);
    }

    sqlite3_busy_timeout(db_, 5000);
    if (!is_memory()) {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA synchronous = NORMAL");
    }
}

database::~database() {
    if (!is_memory()) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    sqlite3_close(db_);
}

void database::fail(const std::string& what) const {
    throw db_error(what + ": " + sqlite3_errmsg(db_));
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(*this, sql, params);
    while (stmt.step()) {
        // PRAGMA journal_mode answers with a row; nothing to collect.
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(*this, sql, params);
    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

void database::upsert(const std::string& table,
                      const std::vector<std::pair<std::string, column_value_t>>& values,
                      const std::vector<std::string>& conflict_columns) {
    std::ostringstream columns, placeholders, updates;
    std::vector<column_value_t> params;
    params.reserve(values.size());

    for (size_t i = 0; i < values.size(); ++i) {
        const auto& [name, value] = values[i];
        columns << (i ? ", " : "") << name;
        placeholders << (i ? ", ?" : "?");
        params.push_back(value);

        bool is_key = std::find(conflict_columns.begin(), conflict_columns.end(), name) != conflict_columns.end();
        if (!is_key) {
            updates << (updates.tellp() > 0 ? ", " : "") << name << " = excluded." << name;
        }
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (" << columns.str() << ") VALUES (" << placeholders.str() << ")";
    if (!conflict_columns.empty()) {
        sql << " ON CONFLICT (";
        for (size_t i = 0; i < conflict_columns.size(); ++i) {
            sql << (i ? ", " : "") << conflict_columns[i];
        }
        sql << ") DO UPDATE SET " << updates.str();
    }

    try {
        execute(sql.str(), params);
    } catch (const db_error& e) {
        LOG_ERROR("db", "Upsert into %s failed: %s", table.c_str(), e.what());
        throw;
    }
}

void database::begin_transaction() {
    // Take the write lock up front; busy_timeout covers contention.
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (committed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_ERROR("db", "Rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    committed_ = true;
}

// ============================================================================
// Row accessors
// ============================================================================

namespace {

const column_value_t* find_column(const database::row_t& row, const std::string& column) {
    auto it = row.find(column);
    return it == row.end() ? nullptr : &it->second;
}

} // namespace

int64_t row_int(const database::row_t& row, const std::string& column, int64_t fallback) {
    const auto* value = find_column(row, column);
    if (!value) return fallback;
    if (auto* v = std::get_if<int64_t>(value)) return *v;
    if (auto* d = std::get_if<double>(value)) return static_cast<int64_t>(*d);
    return fallback;
}

std::string row_text(const database::row_t& row, const std::string& column) {
    const auto* value = find_column(row, column);
    if (auto* v = value ? std::get_if<std::string>(value) : nullptr) return *v;
    return {};
}

std::vector<uint8_t> row_blob(const database::row_t& row, const std::string& column) {
    const auto* value = find_column(row, column);
    if (auto* v = value ? std::get_if<std::vector<uint8_t>>(value) : nullptr) return *v;
    return {};
}

bool row_is_null(const database::row_t& row, const std::string& column) {
    const auto* value = find_column(row, column);
    return !value || std::holds_alternative<std::nullptr_t>(*value);
}

} // namespace anchorlog
