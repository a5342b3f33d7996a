#include "tally/record.hpp"
#include "tally/configuration.hpp"
#include "tally/counter_field.hpp"
#include <atomic>
#include <sstream>

namespace tally {

namespace {
    std::atomic<instance_id_t> g_next_instance_id{1};
}

record::record(store& owner, const model_schema& schema)
    : store_(&owner),
      schema_(&schema),
      instance_id_(g_next_instance_id.fetch_add(1, std::memory_order_relaxed)) {
    for (const auto& col : schema.columns) {
        values_[col.name] = nullptr;
    }
}

const column_value_t& record::get(const std::string& column) const {
    auto it = values_.find(column);
    if (it == values_.end()) {
        throw configuration_error("Model " + model_name() + " has no column '" + column + "'");
    }
    return it->second;
}

void record::set(const std::string& column, column_value_t value) {
    auto it = values_.find(column);
    if (it == values_.end()) {
        throw configuration_error("Model " + model_name() + " has no column '" + column + "'");
    }
    it->second = std::move(value);
}

std::optional<int64_t> record::get_int(const std::string& column) const {
    return detail::as_integer(get(column));
}

int64_t record::counter(const std::string& attname) const {
    return get_int(attname).value_or(0);
}

counter_field& record::require_counter(const std::string& attname) const {
    auto* field = schema_->find_counter(attname);
    if (!field) {
        throw configuration_error("Model " + model_name() + " has no counter '" + attname + "'");
    }
    return *field;
}

void record::increment_counter(const std::string& attname, int64_t by) {
    require_counter(attname).increment(*this, true, by);
}

void record::decrement_counter(const std::string& attname, int64_t by) {
    require_counter(attname).decrement(*this, true, by);
}

void record::reload_counter(const std::string& attname) {
    require_counter(attname).reload(*this);
}

void record::reinit_counter(const std::string& attname) {
    require_counter(attname).reinit(*this);
}

std::string record::describe() const {
    std::ostringstream out;
    out << "<" << model_name() << " pk=";
    if (pk_) {
        out << *pk_;
    } else {
        out << "unsaved";
    }
    out << " instance=" << instance_id_ << ">";
    return out.str();
}

} // namespace tally
