#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace tally {

/// Row selection for bulk counter updates. Conditions are AND-ed together.
class filter {
public:
    filter() = default;

    static filter by_pk(primary_key_t pk);
    static filter pk_in(const std::vector<primary_key_t>& pks);
    static filter where_equals(const std::string& column, column_value_t value);

    filter& and_equals(const std::string& column, column_value_t value);

    /// " WHERE ..." or an empty string when unconstrained
    std::string where_clause() const;
    const std::vector<column_value_t>& params() const { return params_; }
    const std::vector<std::string>& columns() const { return columns_; }

    /// True for pk_in({}), which selects no rows at all
    bool matches_nothing() const { return matches_nothing_; }

private:
    std::vector<std::string> clauses_;
    std::vector<std::string> columns_;
    std::vector<column_value_t> params_;
    bool matches_nothing_ = false;
};

} // namespace tally
