#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>
#include <cstddef>

namespace tally {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Number of data statements run on a connection, by kind. Schema and
/// transaction statements are not counted.
struct statement_stats {
    size_t reads = 0;
    size_t inserts = 0;
    size_t updates = 0;
    size_t deletes = 0;

    size_t writes() const { return inserts + updates + deletes; }
};

class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema management
    void create_table(const table_schema& schema);
    void ensure_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // CRUD operations
    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values);

    void update(const std::string& table,
                primary_key_t id,
                const std::vector<std::pair<std::string, column_value_t>>& values);

    void remove(const std::string& table, primary_key_t id);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    const statement_stats& stats() const { return stats_; }
    void reset_stats() { stats_ = {}; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    statement_stats stats_;

    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    void count_statement(const std::string& sql);
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tally
