#include "tally/relation_tracker.hpp"
#include "tally/configuration.hpp"
#include "tally/registry.hpp"
#include "tally/relation_counter_field.hpp"
#include "tally/store.hpp"
#include "tally/log.hpp"

namespace tally {

namespace {

counter_deltas_t deltas_for(const std::vector<const relation_counter_field*>& fields, int64_t by) {
    counter_deltas_t deltas;
    for (const auto* field : fields) {
        deltas[field->attname()] = by;
    }
    return deltas;
}

} // namespace

relation_tracker::relation_tracker(store& owner, const std::string& model, const std::string& relation)
    : store_(owner),
      info_(owner.schemas().describe_relation(model, relation)) {
    auto& notifications = store_.notifications();

    switch (info_.kind) {
        case relation_kind::forward_foreign_key:
            LOG_ERROR("tracker", "Cannot count %s.%s: forward side of a foreign key",
                      model.c_str(), relation.c_str());
            throw configuration_error("Relation counters cannot follow the forward side of foreign key '" +
                                      relation + "' on " + model);

        case relation_kind::forward_many_to_many:
        case relation_kind::reverse_many_to_many:
            tokens_.push_back(notifications.observe_relation(info_.link_table,
                [this](const relation_change& change) { on_relation_changed(change); }));
            break;

        case relation_kind::reverse_foreign_key:
            tokens_.push_back(notifications.observe_post_save(info_.member_model,
                [this](record& member, bool created) { on_member_saved(member, created); }));
            tokens_.push_back(notifications.observe_post_delete(info_.member_model,
                [this](record& member) { on_member_deleted(member); }));
            break;
    }

    LOG_DEBUG("tracker", "Tracking %s.%s (%s)", model.c_str(), relation.c_str(), to_string(info_.kind));
}

void relation_tracker::on_relation_changed(const relation_change& change) {
    // Both ends of a link share the channel
    if (change.reverse != info_.is_reverse()) {
        return;
    }

    auto owner_pk = change.instance.pk();
    if (!owner_pk) {
        return;
    }

    auto& registry = store_.counter_registry();

    switch (change.action) {
        case relation_action::post_add:
        case relation_action::post_remove: {
            if (!change.ids || change.ids->empty()) {
                return;
            }
            int64_t by = change.action == relation_action::post_add ? 1 : -1;
            update_owner(change.instance, by * static_cast<int64_t>(change.ids->size()));
            update_members(*change.ids, by);
            break;
        }

        case relation_action::pre_clear: {
            // post_clear may not say which members went away, so look now.
            // A clear that failed after its pre_clear leaves ids behind
            auto states = registry.get_saved_states(info_.owner_model, *owner_pk, info_.name);
            for (const auto& state : states) {
                state->consume_pending_clear();
            }
            auto separated = registry.separate_saved_states(states);
            if (separated) {
                separated->first->cache_pending_clear(
                    store_.member_ids(info_.owner_model, *owner_pk, info_.name));
            }
            break;
        }

        case relation_action::post_clear: {
            std::set<primary_key_t> cached;
            for (const auto& state : registry.get_saved_states(info_.owner_model, *owner_pk, info_.name)) {
                auto ids = state->consume_pending_clear();
                cached.insert(ids.begin(), ids.end());
            }

            zero_owner(change.instance);

            std::vector<primary_key_t> ids;
            if (change.ids) {
                ids = *change.ids;
            } else {
                ids.assign(cached.begin(), cached.end());
            }
            if (!ids.empty()) {
                update_members(ids, -1);
            }
            break;
        }

        case relation_action::pre_add:
        case relation_action::pre_remove:
            break;
    }
}

void relation_tracker::on_member_saved(record& member, bool created) {
    if (!created) {
        return;
    }
    if (auto owner_pk = member.get_int(info_.fk_column)) {
        update_owner(*owner_pk, 1);
    }
}

void relation_tracker::on_member_deleted(record& member) {
    if (auto owner_pk = member.get_int(info_.fk_column)) {
        update_owner(*owner_pk, -1);
    }
}

void relation_tracker::update_owner(record& owner_record, int64_t by) {
    if (auto pk = owner_record.pk()) {
        update_owner(*pk, by);
    }
}

void relation_tracker::update_owner(primary_key_t owner_pk, int64_t by) {
    auto& registry = store_.counter_registry();
    auto separated = registry.separate_saved_states(
        registry.get_saved_states(info_.owner_model, owner_pk, info_.name));

    if (separated) {
        auto& [main, others] = *separated;
        main->increment_fields(by);
        main->sync_fields_to(others);
        return;
    }

    const auto& schema = store_.schemas().require(info_.owner_model);
    auto fields = schema.relation_counters_for(info_.name);
    if (!fields.empty()) {
        store_.apply_deltas(info_.owner_model, filter::by_pk(owner_pk), deltas_for(fields, by));
    }
}

void relation_tracker::zero_owner(record& owner_record) {
    auto pk = owner_record.pk();
    if (!pk) {
        return;
    }

    auto& registry = store_.counter_registry();
    auto separated = registry.separate_saved_states(
        registry.get_saved_states(info_.owner_model, *pk, info_.name));

    if (separated) {
        auto& [main, others] = *separated;
        main->zero_fields();
        main->sync_fields_to(others);
        return;
    }

    counter_values_t values;
    for (const auto* field : store_.schemas().require(info_.owner_model).relation_counters_for(info_.name)) {
        values[field->attname()] = int64_t{0};
    }
    store_.apply_values(info_.owner_model, filter::by_pk(*pk), values);
}

void relation_tracker::update_members(const std::vector<primary_key_t>& ids, int64_t by) {
    const auto& member_schema = store_.schemas().require(info_.member_model);
    auto fields = member_schema.relation_counters_for(info_.related_name);
    if (fields.empty()) {
        return;
    }

    // One statement for every member row, then loaded members catch up
    store_.apply_deltas(info_.member_model, filter::pk_in(ids), deltas_for(fields, by));

    auto& registry = store_.counter_registry();
    for (auto id : ids) {
        auto separated = registry.separate_saved_states(
            registry.get_saved_states(info_.member_model, id, info_.related_name));
        if (!separated) {
            continue;
        }
        auto& [main, others] = *separated;
        main->reload_fields();
        main->sync_fields_to(others);
    }

    LOG_DEBUG("tracker", "Applied %lld to %s.%s of %zu members", static_cast<long long>(by),
              info_.member_model.c_str(), info_.related_name.c_str(), ids.size());
}

} // namespace tally
