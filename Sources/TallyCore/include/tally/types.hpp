#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <map>

namespace tally {

// Primary key type
using primary_key_t = int64_t;

// Process-unique identity of one in-memory record representation
using instance_id_t = uint64_t;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text,
    blob
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
    bool is_unique = false;
    bool is_counter = false;  // Excluded from plain saves (see store::save)
};

// Table schema
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    bool is_link_table = false;  // If true, skip the id column
};

/// An SQL scalar expression evaluated by the store at write time, e.g.
/// "(SELECT COUNT(*) FROM Tag WHERE post_id = ?)". It is substituted into the
/// SET clause of an UPDATE against the target row.
struct deferred_expression {
    std::string sql;
    std::vector<column_value_t> params;
};

/// Right-hand side of a counter assignment: a concrete value or an expression.
using counter_value_t = std::variant<int64_t, deferred_expression>;

/// field name -> delta
using counter_deltas_t = std::map<std::string, int64_t>;

/// field name -> assigned value
using counter_values_t = std::map<std::string, counter_value_t>;

namespace detail {

    inline std::optional<int64_t> as_integer(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) {
            return std::get<int64_t>(v);
        }
        if (std::holds_alternative<double>(v)) {
            return static_cast<int64_t>(std::get<double>(v));
        }
        return std::nullopt;
    }

    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }
} // namespace detail

} // namespace tally
