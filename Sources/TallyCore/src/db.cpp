#include "tally/db.hpp"
#include "tally/log.hpp"
#include <sstream>
#include <cctype>

namespace tally {

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;  // Always use serialized threading mode

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    execute("PRAGMA foreign_keys = ON");

    // WAL only applies to file databases
    if (path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), stats_(other.stats_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        stats_ = other.stats_;
        other.db_ = nullptr;
    }
    return *this;
}

void database::count_statement(const std::string& sql) {
    size_t pos = 0;
    while (pos < sql.size() && std::isspace(static_cast<unsigned char>(sql[pos]))) {
        ++pos;
    }
    std::string verb;
    while (pos < sql.size() && std::isalpha(static_cast<unsigned char>(sql[pos]))) {
        verb += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[pos++])));
    }

    if (verb == "SELECT") {
        ++stats_.reads;
    } else if (verb == "INSERT") {
        ++stats_.inserts;
    } else if (verb == "UPDATE") {
        ++stats_.updates;
    } else if (verb == "DELETE") {
        ++stats_.deletes;
    }
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    count_statement(sql);

    if (params.empty()) {
        // Fast path for parameterless queries
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
    } else {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
            throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        }

        int index = 1;
        for (const auto& param : params) {
            bind_value(stmt, index++, param);
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            LOG_ERROR("db", "Execution failed: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
            throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::create_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << schema.name << " (";

    bool first = true;
    if (!schema.is_link_table) {
        // No AUTOINCREMENT: the highest deleted key is handed out again
        sql << "id INTEGER PRIMARY KEY";
        first = false;
    }

    for (const auto& col : schema.columns) {
        if (!schema.is_link_table && col.name == "id") {
            continue;
        }
        if (!first) sql << ", ";
        sql << col.name << " ";
        first = false;

        switch (col.type) {
            case column_type::integer: sql << "INTEGER"; break;
            case column_type::real: sql << "REAL"; break;
            case column_type::text: sql << "TEXT"; break;
            case column_type::blob: sql << "BLOB"; break;
        }

        if (!col.nullable) {
            sql << " NOT NULL";
        }
        if (col.is_unique) {
            sql << " UNIQUE";
        }
    }

    if (schema.is_link_table) {
        sql << ", UNIQUE(lhs, rhs)";
    }

    sql << ")";
    execute(sql.str());
}

void database::ensure_table(const table_schema& schema) {
    if (!table_exists(schema.name)) {
        create_table(schema);
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table,
                               const std::vector<std::pair<std::string, column_value_t>>& values) {
    std::ostringstream sql;
    if (values.empty()) {
        sql << "INSERT INTO " << table << " DEFAULT VALUES";
    } else {
        sql << "INSERT INTO " << table << " (";

        bool first = true;
        for (const auto& [col, _] : values) {
            if (!first) sql << ", ";
            sql << col;
            first = false;
        }

        sql << ") VALUES (";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
        }
        sql << ")";
    }

    count_statement(sql.str());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare insert: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Insert failed: %s", err.c_str());
        throw db_error("Insert failed: " + err);
    }

    return sqlite3_last_insert_rowid(db_);
}

void database::update(const std::string& table,
                      primary_key_t id,
                      const std::vector<std::pair<std::string, column_value_t>>& values) {
    if (values.empty()) return;

    std::ostringstream sql;
    sql << "UPDATE " << table << " SET ";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << col << " = ?";
        first = false;
    }

    sql << " WHERE id = ?";

    count_statement(sql.str());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to prepare update: %s", error.c_str());
        throw db_error("Failed to prepare update: " + error);
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }
    sqlite3_bind_int64(stmt, index, id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("db", "Update failed: %s", sqlite3_errmsg(db_));
        throw db_error("Update failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

void database::remove(const std::string& table, primary_key_t id) {
    std::string sql = "DELETE FROM " + table + " WHERE id = ?";
    count_statement(sql);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare delete: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare delete: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, id);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("db", "Delete failed: %s", sqlite3_errmsg(db_));
        throw db_error("Delete failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    count_statement(sql);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error);
    }

    return results;
}

void database::begin_transaction() {
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard. Joins an enclosing transaction instead of nesting.
transaction::transaction(database& db) : db_(db) {
    if (db_.is_in_transaction()) {
        completed_ = true;
    } else {
        db_.begin_transaction();
    }
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    if (!completed_) {
        db_.commit();
        completed_ = true;
    }
}

void transaction::rollback() {
    if (!completed_) {
        db_.rollback();
        completed_ = true;
    }
}

} // namespace tally
