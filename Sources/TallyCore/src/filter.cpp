#include "tally/filter.hpp"
#include <sstream>

namespace tally {

filter filter::by_pk(primary_key_t pk) {
    return where_equals("id", pk);
}

filter filter::pk_in(const std::vector<primary_key_t>& pks) {
    if (pks.size() == 1) {
        return by_pk(pks.front());
    }

    filter f;
    if (pks.empty()) {
        f.matches_nothing_ = true;
        return f;
    }

    std::ostringstream clause;
    clause << "id IN (";
    for (size_t i = 0; i < pks.size(); ++i) {
        if (i > 0) clause << ", ";
        clause << "?";
        f.params_.push_back(pks[i]);
    }
    clause << ")";
    f.clauses_.push_back(clause.str());
    f.columns_.push_back("id");
    return f;
}

filter filter::where_equals(const std::string& column, column_value_t value) {
    filter f;
    f.and_equals(column, std::move(value));
    return f;
}

filter& filter::and_equals(const std::string& column, column_value_t value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        clauses_.push_back(column + " IS NULL");
    } else {
        clauses_.push_back(column + " = ?");
        params_.push_back(std::move(value));
    }
    columns_.push_back(column);
    return *this;
}

std::string filter::where_clause() const {
    if (clauses_.empty()) return "";

    std::ostringstream sql;
    sql << " WHERE ";
    for (size_t i = 0; i < clauses_.size(); ++i) {
        if (i > 0) sql << " AND ";
        sql << clauses_[i];
    }
    return sql.str();
}

} // namespace tally
