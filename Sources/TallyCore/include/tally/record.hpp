#pragma once

#include "types.hpp"
#include "schema.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace tally {

class store;

/// One in-memory representation of a row. Loading the same row twice yields
/// two records with the same pk and distinct instance ids. Records are always
/// owned by a std::shared_ptr handed out by the store.
class record : public std::enable_shared_from_this<record> {
public:
    record(store& owner, const model_schema& schema);

    record(const record&) = delete;
    record& operator=(const record&) = delete;

    const model_schema& schema() const { return *schema_; }
    const std::string& model_name() const { return schema_->name; }
    store& owner() const { return *store_; }

    instance_id_t instance_id() const { return instance_id_; }
    std::optional<primary_key_t> pk() const { return pk_; }
    bool is_saved() const { return pk_.has_value(); }

    /// Throws configuration_error for columns the model does not declare
    const column_value_t& get(const std::string& column) const;
    void set(const std::string& column, column_value_t value);

    std::optional<int64_t> get_int(const std::string& column) const;

    /// Current in-memory counter value, 0 while uninitialized
    int64_t counter(const std::string& attname) const;

    const std::unordered_map<std::string, column_value_t>& values() const { return values_; }

    // Per-counter operations (increment_<field>, decrement_<field>, ...)
    void increment_counter(const std::string& attname, int64_t by = 1);
    void decrement_counter(const std::string& attname, int64_t by = 1);
    void reload_counter(const std::string& attname);
    void reinit_counter(const std::string& attname);

    std::string describe() const;

private:
    friend class store;

    counter_field& require_counter(const std::string& attname) const;

    store* store_;
    const model_schema* schema_;
    instance_id_t instance_id_;
    std::optional<primary_key_t> pk_;
    std::unordered_map<std::string, column_value_t> values_;
};

using record_ptr = std::shared_ptr<record>;

} // namespace tally
