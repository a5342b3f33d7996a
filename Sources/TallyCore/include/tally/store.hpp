#pragma once

#include "configuration.hpp"
#include "db.hpp"
#include "filter.hpp"
#include "observation.hpp"
#include "record.hpp"
#include "schema.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tally {

class relation_counter_registry;

/// SQLite-backed object store. Owns the connection, the models, the signal
/// hub and the relation counter registry for everything loaded through it.
///
/// Usage:
///   tally::store db;
///   db.register_model(tally::model_schema("Tag").add_column("label", tally::column_type::text));
///   db.register_model(tally::model_schema("Post")
///       .add_many_to_many("tags", "Tag", "posts")
///       .add_relation_counter("tag_count", "tags"));
///
///   auto post = db.create("Post");
///   auto tag = db.create("Tag", {{"label", "cpp"}});
///   db.add_members(*post, "tags", {*tag->pk()});
///   post->counter("tag_count");  // 1, without a reload
class store {
public:
    using field_values_t = std::vector<std::pair<std::string, column_value_t>>;

    explicit store(const configuration& config = {});
    ~store();

    store(const store&) = delete;
    store& operator=(const store&) = delete;

    const configuration& config() const { return config_; }
    database& db() { return *db_; }
    notification_center& notifications() { return notifications_; }
    const schema_registry& schemas() const { return schemas_; }
    relation_counter_registry& counter_registry() { return *counter_registry_; }

    /// Create the model's tables and hook up its counter fields. Throws
    /// configuration_error for counters on relations that cannot be counted.
    const model_schema& register_model(model_schema schema);

    // ------------------------------------------------------------------
    // Records
    // ------------------------------------------------------------------

    /// New unsaved record. Fires post_init.
    record_ptr create_record(const std::string& model, const field_values_t& values = {});

    /// Construct, then save. Fires post_init and post_save(created=true).
    record_ptr create(const std::string& model, const field_values_t& values = {});

    /// Fresh representation of a stored row. Throws db_error if missing.
    record_ptr load(const std::string& model, primary_key_t pk);

    /// Like load, but returns nullptr if missing.
    record_ptr find(const std::string& model, primary_key_t pk);

    /// Insert or update. Updates skip counter columns unless they are listed
    /// in `update_fields` or null; a non-empty `update_fields` restricts the
    /// update to those columns.
    void save(record& instance, const std::vector<std::string>& update_fields = {});

    /// Delete the row and its link rows, null out foreign keys pointing at it,
    /// and clear the record's pk. Fires pre_delete and post_delete.
    void remove(record& instance);

    // ------------------------------------------------------------------
    // Relations
    // ------------------------------------------------------------------

    /// Link members on a many-to-many relation (either side). Ids already
    /// linked are skipped. Fires pre_add/post_add.
    void add_members(record& instance, const std::string& relation,
                     const std::vector<primary_key_t>& ids);

    /// Unlink members; ids that are not linked are skipped. Fires
    /// pre_remove/post_remove.
    void remove_members(record& instance, const std::string& relation,
                        const std::vector<primary_key_t>& ids);

    /// Unlink every member. Fires pre_clear/post_clear.
    void clear_members(record& instance, const std::string& relation);

    std::vector<primary_key_t> member_ids(const std::string& model, primary_key_t pk,
                                          const std::string& relation);
    std::vector<primary_key_t> member_ids(const record& instance, const std::string& relation);

    int64_t count_members(const std::string& model, primary_key_t pk, const std::string& relation);
    int64_t count_members(const record& instance, const std::string& relation);

    // ------------------------------------------------------------------
    // Counter writes
    // ------------------------------------------------------------------

    /// UPDATE model SET f = f + delta, ... for every row matching `where`.
    /// Zero deltas are dropped; nothing is issued if none remain.
    void apply_deltas(const std::string& model, const filter& where, const counter_deltas_t& deltas);

    /// UPDATE model SET f = value-or-(expression), ... for matching rows.
    void apply_values(const std::string& model, const filter& where, const counter_values_t& values);

    /// SELECT the given columns of one row. Throws db_error if missing.
    database::row_t fetch_columns(const std::string& model, primary_key_t pk,
                                  const std::vector<std::string>& columns);

private:
    record_ptr make_record(const model_schema& schema, const field_values_t& values);
    relation_info require_many_to_many(const record& instance, const std::string& relation) const;
    primary_key_t require_pk(const record& instance, const char* operation) const;
    std::vector<primary_key_t> linked_subset(const relation_info& rel, primary_key_t pk,
                                             const std::vector<primary_key_t>& ids);
    void check_columns(const model_schema& schema, const std::vector<std::string>& columns) const;

    configuration config_;
    std::unique_ptr<database> db_;
    schema_registry schemas_;
    notification_center notifications_;
    std::vector<notification_token> field_bindings_;
    std::unique_ptr<relation_counter_registry> counter_registry_;
};

} // namespace tally
