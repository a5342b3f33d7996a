#include "tally/store.hpp"
#include "tally/counter_field.hpp"
#include "tally/registry.hpp"
#include "tally/log.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tally {

namespace {

// Where the member keys of a relation live, seen from one owner row
struct relation_columns {
    std::string table;
    std::string self_column;
    std::string member_column;
};

relation_columns columns_for(const relation_info& rel) {
    switch (rel.kind) {
        case relation_kind::forward_many_to_many:
            return {rel.link_table, "lhs", "rhs"};
        case relation_kind::reverse_many_to_many:
            return {rel.link_table, "rhs", "lhs"};
        case relation_kind::reverse_foreign_key:
            return {rel.member_model, rel.fk_column, "id"};
        case relation_kind::forward_foreign_key:
            return {rel.owner_model, "id", rel.fk_column};
    }
    throw configuration_error("Unhandled relation kind");
}

std::string placeholders(size_t count) {
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) result += ", ";
        result += "?";
    }
    return result;
}

std::vector<primary_key_t> unique_ids(const std::vector<primary_key_t>& ids) {
    std::vector<primary_key_t> result;
    std::set<primary_key_t> seen;
    for (auto id : ids) {
        if (seen.insert(id).second) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<primary_key_t> ids_from_rows(const std::vector<database::row_t>& rows) {
    std::vector<primary_key_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        auto it = row.find("id");
        if (it != row.end()) {
            if (auto id = detail::as_integer(it->second)) {
                ids.push_back(*id);
            }
        }
    }
    return ids;
}

} // namespace

store::store(const configuration& config)
    : config_(config),
      db_(std::make_unique<database>(config.path)) {
    if (config_.log) {
        set_log_level(*config_.log);
    }
    counter_registry_ = std::make_unique<relation_counter_registry>(*this);
    LOG_INFO("store", "Opened %s", config_.path.c_str());
}

// Out of line: relation_counter_registry is incomplete in the header
store::~store() = default;

const model_schema& store::register_model(model_schema schema) {
    for (const auto& field : schema.counters) {
        field->check(schema);
    }

    const auto& registered = schemas_.register_model(std::move(schema));

    db_->ensure_table(registered.to_table_schema());
    for (const auto& m2m : registered.many_to_many) {
        table_schema link;
        link.name = link_table_name(registered.name, m2m.name);
        link.is_link_table = true;
        link.columns.push_back({"lhs", column_type::integer});
        link.columns.push_back({"rhs", column_type::integer});
        db_->ensure_table(link);
    }

    for (const auto& field : registered.counters) {
        field->bind(*this, field_bindings_);
    }

    LOG_DEBUG("store", "Registered model %s (%zu counters)",
              registered.name.c_str(), registered.counters.size());
    return registered;
}

record_ptr store::make_record(const model_schema& schema, const field_values_t& values) {
    auto instance = std::make_shared<record>(*this, schema);
    for (const auto& field : schema.counters) {
        if (auto initial = field->default_value()) {
            instance->set(field->attname(), *initial);
        }
    }
    for (const auto& [column, value] : values) {
        instance->set(column, value);
    }
    return instance;
}

record_ptr store::create_record(const std::string& model, const field_values_t& values) {
    auto instance = make_record(schemas_.require(model), values);
    notifications_.notify_post_init(*instance);
    return instance;
}

record_ptr store::create(const std::string& model, const field_values_t& values) {
    auto instance = create_record(model, values);
    save(*instance);
    return instance;
}

record_ptr store::find(const std::string& model, primary_key_t pk) {
    const auto& schema = schemas_.require(model);
    auto rows = db_->query("SELECT * FROM " + schema.name + " WHERE id = ?", {pk});
    if (rows.empty()) {
        return nullptr;
    }

    auto instance = make_record(schema, {});
    for (const auto& col : schema.columns) {
        auto it = rows[0].find(col.name);
        if (it != rows[0].end()) {
            instance->set(col.name, it->second);
        }
    }
    instance->pk_ = pk;

    notifications_.notify_post_init(*instance);
    return instance;
}

record_ptr store::load(const std::string& model, primary_key_t pk) {
    auto instance = find(model, pk);
    if (!instance) {
        LOG_ERROR("store", "No %s with id %lld", model.c_str(), static_cast<long long>(pk));
        throw db_error("No " + model + " with id " + std::to_string(pk));
    }
    return instance;
}

void store::save(record& instance, const std::vector<std::string>& update_fields) {
    const auto& schema = instance.schema();
    check_columns(schema, update_fields);

    if (!instance.pk_) {
        field_values_t values;
        for (const auto& col : schema.columns) {
            values.emplace_back(col.name, instance.values_.at(col.name));
        }
        instance.pk_ = db_->insert(schema.name, values);
        LOG_DEBUG("store", "Inserted %s", instance.describe().c_str());
        notifications_.notify_post_save(instance, true);
        return;
    }

    field_values_t values;
    for (const auto& col : schema.columns) {
        bool requested = update_fields.empty() ||
            std::find(update_fields.begin(), update_fields.end(), col.name) != update_fields.end();
        if (!requested) {
            continue;
        }

        const auto& value = instance.values_.at(col.name);

        // An in-memory counter may be stale next to deltas other
        // representations applied; only write it when asked to, or to reset it.
        if (col.is_counter && update_fields.empty() && !detail::is_null(value)) {
            continue;
        }
        values.emplace_back(col.name, value);
    }

    db_->update(schema.name, *instance.pk_, values);
    notifications_.notify_post_save(instance, false);
}

void store::remove(record& instance) {
    auto pk = require_pk(instance, "delete");
    const auto& schema = instance.schema();

    notifications_.notify_pre_delete(instance);

    {
        transaction txn(*db_);

        for (const auto& rel : schemas_.many_to_many_relations_of(schema.name)) {
            auto columns = columns_for(rel);
            db_->execute("DELETE FROM " + columns.table + " WHERE " + columns.self_column + " = ?", {pk});
        }

        for (const auto* other : schemas_.all_schemas()) {
            for (const auto& fk : other->foreign_keys) {
                if (fk.target == schema.name) {
                    db_->execute("UPDATE " + other->name + " SET " + fk.column() + " = NULL WHERE " +
                                 fk.column() + " = ?", {pk});
                }
            }
        }

        db_->remove(schema.name, pk);
        txn.commit();
    }

    notifications_.notify_post_delete(instance);
    LOG_DEBUG("store", "Deleted %s", instance.describe().c_str());
    instance.pk_.reset();
}

relation_info store::require_many_to_many(const record& instance, const std::string& relation) const {
    auto rel = schemas_.describe_relation(instance.model_name(), relation);
    if (!rel.is_many_to_many()) {
        throw configuration_error("Relation '" + relation + "' on " + instance.model_name() + " is a " +
                                  to_string(rel.kind) + "; only many-to-many members can be linked");
    }
    return rel;
}

primary_key_t store::require_pk(const record& instance, const char* operation) const {
    if (!instance.pk_) {
        throw std::invalid_argument(std::string("Cannot ") + operation + " unsaved " + instance.model_name());
    }
    return *instance.pk_;
}

std::vector<primary_key_t> store::linked_subset(const relation_info& rel, primary_key_t pk,
                                                const std::vector<primary_key_t>& ids) {
    auto columns = columns_for(rel);
    std::vector<column_value_t> params{pk};
    for (auto id : ids) {
        params.push_back(id);
    }
    auto rows = db_->query("SELECT " + columns.member_column + " AS id FROM " + columns.table +
                           " WHERE " + columns.self_column + " = ? AND " + columns.member_column +
                           " IN (" + placeholders(ids.size()) + ")", params);
    return ids_from_rows(rows);
}

void store::add_members(record& instance, const std::string& relation,
                        const std::vector<primary_key_t>& ids) {
    auto rel = require_many_to_many(instance, relation);
    auto pk = require_pk(instance, "add members to");
    auto requested = unique_ids(ids);
    if (requested.empty()) {
        return;
    }

    const auto& member_schema = schemas_.require(rel.member_model);
    std::vector<column_value_t> params(requested.begin(), requested.end());
    auto found = db_->query("SELECT id FROM " + member_schema.name + " WHERE id IN (" +
                            placeholders(requested.size()) + ")", params);
    if (found.size() != requested.size()) {
        throw std::invalid_argument("Cannot link missing " + member_schema.name + " rows to " +
                                    instance.describe());
    }

    auto linked = linked_subset(rel, pk, requested);
    std::vector<primary_key_t> new_ids;
    for (auto id : requested) {
        if (std::find(linked.begin(), linked.end(), id) == linked.end()) {
            new_ids.push_back(id);
        }
    }
    if (new_ids.empty()) {
        return;
    }

    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::pre_add, instance, rel.is_reverse(), member_schema, new_ids});

    {
        auto columns = columns_for(rel);
        transaction txn(*db_);
        for (auto id : new_ids) {
            db_->insert(rel.link_table, {{columns.self_column, pk}, {columns.member_column, id}});
        }
        txn.commit();
    }

    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::post_add, instance, rel.is_reverse(), member_schema, new_ids});
}

void store::remove_members(record& instance, const std::string& relation,
                           const std::vector<primary_key_t>& ids) {
    auto rel = require_many_to_many(instance, relation);
    auto pk = require_pk(instance, "remove members from");
    auto requested = unique_ids(ids);
    if (requested.empty()) {
        return;
    }

    auto linked = linked_subset(rel, pk, requested);
    if (linked.empty()) {
        return;
    }

    const auto& member_schema = schemas_.require(rel.member_model);
    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::pre_remove, instance, rel.is_reverse(), member_schema, linked});

    {
        auto columns = columns_for(rel);
        std::vector<column_value_t> params{pk};
        for (auto id : linked) {
            params.push_back(id);
        }
        transaction txn(*db_);
        db_->execute("DELETE FROM " + rel.link_table + " WHERE " + columns.self_column + " = ? AND " +
                     columns.member_column + " IN (" + placeholders(linked.size()) + ")", params);
        txn.commit();
    }

    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::post_remove, instance, rel.is_reverse(), member_schema, linked});
}

void store::clear_members(record& instance, const std::string& relation) {
    auto rel = require_many_to_many(instance, relation);
    auto pk = require_pk(instance, "clear members of");
    const auto& member_schema = schemas_.require(rel.member_model);

    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::pre_clear, instance, rel.is_reverse(), member_schema, std::nullopt});

    std::optional<std::vector<primary_key_t>> cleared;
    if (config_.report_cleared_ids) {
        cleared = member_ids(instance.model_name(), pk, relation);
    }

    {
        auto columns = columns_for(rel);
        transaction txn(*db_);
        db_->execute("DELETE FROM " + rel.link_table + " WHERE " + columns.self_column + " = ?", {pk});
        txn.commit();
    }

    notifications_.notify_relation(rel.link_table,
        relation_change{relation_action::post_clear, instance, rel.is_reverse(), member_schema, cleared});
}

std::vector<primary_key_t> store::member_ids(const std::string& model, primary_key_t pk,
                                             const std::string& relation) {
    auto columns = columns_for(schemas_.describe_relation(model, relation));
    auto rows = db_->query("SELECT " + columns.member_column + " AS id FROM " + columns.table +
                           " WHERE " + columns.self_column + " = ? AND " + columns.member_column +
                           " IS NOT NULL ORDER BY " + columns.member_column, {pk});
    return ids_from_rows(rows);
}

std::vector<primary_key_t> store::member_ids(const record& instance, const std::string& relation) {
    return member_ids(instance.model_name(), require_pk(instance, "list members of"), relation);
}

int64_t store::count_members(const std::string& model, primary_key_t pk, const std::string& relation) {
    auto columns = columns_for(schemas_.describe_relation(model, relation));
    auto rows = db_->query("SELECT COUNT(*) AS n FROM " + columns.table + " WHERE " +
                           columns.self_column + " = ? AND " + columns.member_column +
                           " IS NOT NULL", {pk});
    if (rows.empty()) {
        return 0;
    }
    return detail::as_integer(rows[0].at("n")).value_or(0);
}

int64_t store::count_members(const record& instance, const std::string& relation) {
    return count_members(instance.model_name(), require_pk(instance, "count members of"), relation);
}

void store::check_columns(const model_schema& schema, const std::vector<std::string>& columns) const {
    for (const auto& column : columns) {
        if (column != "id" && !schema.find_column(column)) {
            throw configuration_error("Model " + schema.name + " has no column '" + column + "'");
        }
    }
}

void store::apply_deltas(const std::string& model, const filter& where, const counter_deltas_t& deltas) {
    const auto& schema = schemas_.require(model);
    if (where.matches_nothing()) {
        return;
    }
    check_columns(schema, where.columns());

    std::ostringstream sql;
    std::vector<column_value_t> params;
    sql << "UPDATE " << schema.name << " SET ";

    for (const auto& [column, delta] : deltas) {
        if (delta == 0) {
            continue;
        }
        check_columns(schema, {column});
        if (!params.empty()) sql << ", ";
        sql << column << " = " << column << " + ?";
        params.push_back(delta);
    }

    if (params.empty()) {
        return;
    }

    sql << where.where_clause();
    params.insert(params.end(), where.params().begin(), where.params().end());
    db_->execute(sql.str(), params);
}

void store::apply_values(const std::string& model, const filter& where, const counter_values_t& values) {
    const auto& schema = schemas_.require(model);
    if (values.empty() || where.matches_nothing()) {
        return;
    }
    check_columns(schema, where.columns());

    std::ostringstream sql;
    std::vector<column_value_t> params;
    sql << "UPDATE " << schema.name << " SET ";

    bool first = true;
    for (const auto& [column, value] : values) {
        check_columns(schema, {column});
        if (!first) sql << ", ";
        first = false;

        if (const auto* expr = std::get_if<deferred_expression>(&value)) {
            sql << column << " = (" << expr->sql << ")";
            params.insert(params.end(), expr->params.begin(), expr->params.end());
        } else {
            sql << column << " = ?";
            params.push_back(std::get<int64_t>(value));
        }
    }

    sql << where.where_clause();
    params.insert(params.end(), where.params().begin(), where.params().end());
    db_->execute(sql.str(), params);
}

database::row_t store::fetch_columns(const std::string& model, primary_key_t pk,
                                     const std::vector<std::string>& columns) {
    const auto& schema = schemas_.require(model);
    check_columns(schema, columns);
    if (columns.empty()) {
        return {};
    }

    std::ostringstream sql;
    sql << "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << columns[i];
    }
    sql << " FROM " << schema.name << " WHERE id = ?";

    auto rows = db_->query(sql.str(), {pk});
    if (rows.empty()) {
        LOG_ERROR("store", "No %s with id %lld to reload", model.c_str(), static_cast<long long>(pk));
        throw db_error("No " + model + " with id " + std::to_string(pk));
    }
    return rows[0];
}

} // namespace tally
