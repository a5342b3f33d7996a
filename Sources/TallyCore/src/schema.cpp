#include "tally/schema.hpp"
#include "tally/configuration.hpp"
#include "tally/counter_field.hpp"
#include "tally/relation_counter_field.hpp"

namespace tally {

const char* to_string(relation_kind kind) {
    switch (kind) {
        case relation_kind::forward_many_to_many: return "forward many-to-many";
        case relation_kind::reverse_many_to_many: return "reverse many-to-many";
        case relation_kind::forward_foreign_key: return "forward foreign key";
        case relation_kind::reverse_foreign_key: return "reverse foreign key";
    }
    return "unknown";
}

std::string link_table_name(const std::string& model, const std::string& relation) {
    return "_" + model + "_" + relation;
}

model_schema& model_schema::add_column(const std::string& column, column_type type, bool nullable) {
    column_def def;
    def.name = column;
    def.type = type;
    def.nullable = nullable;
    columns.push_back(std::move(def));
    return *this;
}

model_schema& model_schema::add_many_to_many(const std::string& relation, const std::string& target,
                                             const std::string& related_name) {
    // Same default as Django-style ORMs: "<model>_set"
    many_to_many.push_back({relation, target, related_name.empty() ? name + "_set" : related_name});
    return *this;
}

model_schema& model_schema::add_foreign_key(const std::string& relation, const std::string& target,
                                            const std::string& related_name) {
    foreign_key_def def{relation, target, related_name.empty() ? name + "_set" : related_name};
    add_column(def.column(), column_type::integer, true);
    foreign_keys.push_back(std::move(def));
    return *this;
}

model_schema& model_schema::add_counter(std::shared_ptr<counter_field> field) {
    if (find_column(field->attname())) {
        throw configuration_error("Duplicate column '" + field->attname() + "' on " + name);
    }
    field->attach(name);
    columns.push_back(field->column());
    counters.push_back(std::move(field));
    return *this;
}

model_schema& model_schema::add_relation_counter(const std::string& attname, const std::string& relation) {
    return add_counter(std::make_shared<relation_counter_field>(attname, relation));
}

const column_def* model_schema::find_column(const std::string& column) const {
    for (const auto& col : columns) {
        if (col.name == column) return &col;
    }
    return nullptr;
}

counter_field* model_schema::find_counter(const std::string& attname) const {
    for (const auto& field : counters) {
        if (field->attname() == attname) return field.get();
    }
    return nullptr;
}

std::vector<const relation_counter_field*> model_schema::relation_counters() const {
    std::vector<const relation_counter_field*> result;
    for (const auto& field : counters) {
        if (auto* rel = dynamic_cast<const relation_counter_field*>(field.get())) {
            result.push_back(rel);
        }
    }
    return result;
}

std::vector<const relation_counter_field*> model_schema::relation_counters_for(const std::string& relation) const {
    std::vector<const relation_counter_field*> result;
    for (const auto* field : relation_counters()) {
        if (field->relation_name() == relation) {
            result.push_back(field);
        }
    }
    return result;
}

table_schema model_schema::to_table_schema() const {
    table_schema table;
    table.name = name;
    table.columns = columns;
    return table;
}

const model_schema& schema_registry::register_model(model_schema schema) {
    if (schema.name.empty()) {
        throw configuration_error("Model name must not be empty");
    }
    auto name = schema.name;
    auto [it, inserted] = schemas_by_name_.emplace(name, std::move(schema));
    if (!inserted) {
        throw configuration_error("Model already registered: " + name);
    }
    return it->second;
}

const model_schema* schema_registry::get_schema(const std::string& name) const {
    auto it = schemas_by_name_.find(name);
    return it != schemas_by_name_.end() ? &it->second : nullptr;
}

const model_schema& schema_registry::require(const std::string& name) const {
    auto* schema = get_schema(name);
    if (!schema) {
        throw configuration_error("Unknown model: " + name);
    }
    return *schema;
}

std::vector<const model_schema*> schema_registry::all_schemas() const {
    std::vector<const model_schema*> result;
    result.reserve(schemas_by_name_.size());
    for (const auto& [name, schema] : schemas_by_name_) {
        result.push_back(&schema);
    }
    return result;
}

relation_info schema_registry::describe_relation(const std::string& model, const std::string& relation) const {
    const auto& owner = require(model);

    for (const auto& m2m : owner.many_to_many) {
        if (m2m.name == relation) {
            return {relation_kind::forward_many_to_many, model, relation, m2m.target,
                    m2m.related_name, link_table_name(model, m2m.name), ""};
        }
    }

    for (const auto& fk : owner.foreign_keys) {
        if (fk.name == relation) {
            return {relation_kind::forward_foreign_key, model, relation, fk.target,
                    fk.related_name, "", fk.column()};
        }
    }

    for (const auto& [other_name, other] : schemas_by_name_) {
        for (const auto& m2m : other.many_to_many) {
            if (m2m.target == model && m2m.related_name == relation) {
                return {relation_kind::reverse_many_to_many, model, relation, other_name,
                        m2m.name, link_table_name(other_name, m2m.name), ""};
            }
        }
        for (const auto& fk : other.foreign_keys) {
            if (fk.target == model && fk.related_name == relation) {
                return {relation_kind::reverse_foreign_key, model, relation, other_name,
                        fk.name, "", fk.column()};
            }
        }
    }

    throw configuration_error("Unknown relation '" + relation + "' on model " + model);
}

std::vector<relation_info> schema_registry::many_to_many_relations_of(const std::string& model) const {
    std::vector<relation_info> result;
    const auto& owner = require(model);
    for (const auto& m2m : owner.many_to_many) {
        result.push_back(describe_relation(model, m2m.name));
    }
    for (const auto& [other_name, other] : schemas_by_name_) {
        for (const auto& m2m : other.many_to_many) {
            if (m2m.target == model) {
                result.push_back(describe_relation(model, m2m.related_name));
            }
        }
    }
    return result;
}

} // namespace tally
