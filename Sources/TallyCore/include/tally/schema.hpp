#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

namespace tally {

class counter_field;
class relation_counter_field;

/// A many-to-many relation declared on the owning model. Links live in the
/// table `_<Model>_<name>` with columns lhs (declaring side) and rhs (target).
struct many_to_many_def {
    std::string name;
    std::string target;
    std::string related_name;  // relation name as seen from `target`
};

/// A single-valued reference stored in column `<name>_id` of the declaring model.
struct foreign_key_def {
    std::string name;
    std::string target;
    std::string related_name;  // multi-valued relation name as seen from `target`

    std::string column() const { return name + "_id"; }
};

// Classification of a named relation from one model's point of view
enum class relation_kind {
    forward_many_to_many,
    reverse_many_to_many,
    forward_foreign_key,   // single-valued, cannot be counted
    reverse_foreign_key
};

const char* to_string(relation_kind kind);

struct relation_info {
    relation_kind kind;
    std::string owner_model;
    std::string name;
    std::string member_model;
    std::string related_name;  // the same relation seen from member_model
    std::string link_table;    // many-to-many only
    std::string fk_column;     // foreign keys only

    bool is_multi_valued() const { return kind != relation_kind::forward_foreign_key; }
    bool is_many_to_many() const {
        return kind == relation_kind::forward_many_to_many ||
               kind == relation_kind::reverse_many_to_many;
    }
    bool is_reverse() const {
        return kind == relation_kind::reverse_many_to_many ||
               kind == relation_kind::reverse_foreign_key;
    }
};

// Schema info for a model
struct model_schema {
    std::string name;
    std::vector<column_def> columns;
    std::vector<many_to_many_def> many_to_many;
    std::vector<foreign_key_def> foreign_keys;
    std::vector<std::shared_ptr<counter_field>> counters;

    model_schema() = default;
    explicit model_schema(std::string model_name) : name(std::move(model_name)) {}

    model_schema& add_column(const std::string& column, column_type type, bool nullable = true);
    model_schema& add_many_to_many(const std::string& relation, const std::string& target,
                                   const std::string& related_name = "");
    model_schema& add_foreign_key(const std::string& relation, const std::string& target,
                                  const std::string& related_name = "");
    model_schema& add_counter(std::shared_ptr<counter_field> field);
    model_schema& add_relation_counter(const std::string& attname, const std::string& relation);

    const column_def* find_column(const std::string& column) const;
    counter_field* find_counter(const std::string& attname) const;
    std::vector<const relation_counter_field*> relation_counters() const;
    std::vector<const relation_counter_field*> relation_counters_for(const std::string& relation) const;

    table_schema to_table_schema() const;
};

std::string link_table_name(const std::string& model, const std::string& relation);

// Models known to one store
class schema_registry {
public:
    const model_schema& register_model(model_schema schema);
    const model_schema* get_schema(const std::string& name) const;

    /// Like get_schema, but throws configuration_error for unknown models
    const model_schema& require(const std::string& name) const;

    std::vector<const model_schema*> all_schemas() const;

    /// Resolve a relation name on `model`, looking at relations declared on
    /// the model itself and at relations other models declare toward it.
    /// Throws configuration_error when nothing matches.
    relation_info describe_relation(const std::string& model, const std::string& relation) const;

    /// Link tables for every many-to-many relation touching `model`
    std::vector<relation_info> many_to_many_relations_of(const std::string& model) const;

private:
    std::unordered_map<std::string, model_schema> schemas_by_name_;
};

} // namespace tally
