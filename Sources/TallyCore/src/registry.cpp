#include "tally/registry.hpp"
#include "tally/relation_counter_field.hpp"
#include "tally/relation_tracker.hpp"
#include "tally/store.hpp"
#include "tally/log.hpp"

namespace tally {

relation_counter_registry::relation_counter_registry(store& owner)
    : store_(owner) {}

// Out of line: relation_tracker is incomplete in the header
relation_counter_registry::~relation_counter_registry() = default;

state_ptr relation_counter_registry::store_state(record& instance, const relation_counter_field& field) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sweep_locked();

    state_map_t* states = &unsaved_;
    if (auto pk = instance.pk()) {
        states = &saved_[saved_key_t{instance.model_name(), *pk, field.relation_name()}];
    }

    auto& state = (*states)[instance.instance_id()];
    if (!state) {
        state = std::make_shared<instance_state>(instance.shared_from_this());
        LOG_DEBUG("registry", "Tracking %s for %s", instance.describe().c_str(),
                  field.relation_name().c_str());
    }
    state->track_field(field.attname());
    return state;
}

std::vector<state_ptr> relation_counter_registry::get_saved_states(const std::string& model, primary_key_t pk,
                                                                   const std::string& relation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<state_ptr> result;

    auto it = saved_.find(saved_key_t{model, pk, relation});
    if (it == saved_.end()) {
        return result;
    }
    for (const auto& [id, state] : it->second) {
        if (state->is_alive()) {
            result.push_back(state);
        }
    }
    return result;
}

std::optional<std::pair<state_ptr, std::vector<state_ptr>>>
relation_counter_registry::separate_saved_states(const std::vector<state_ptr>& states) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_ptr main;
    std::vector<state_ptr> others;

    for (const auto& state : states) {
        if (!state->is_alive()) {
            continue;
        }
        if (!main) {
            main = state;
        } else {
            others.push_back(state);
        }
    }

    if (!main) {
        return std::nullopt;
    }
    return std::make_pair(std::move(main), std::move(others));
}

void relation_counter_registry::on_first_persist(record& instance) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!unsaved_.count(instance.instance_id())) {
        return;
    }

    LOG_DEBUG("registry", "First save of %s", instance.describe().c_str());

    // Also drops states left behind by a deleted row that had this pk
    reset_state(instance.model_name(), instance.pk(), instance.instance_id());

    for (const auto* field : instance.schema().relation_counters()) {
        store_state(instance, *field);
    }
}

void relation_counter_registry::on_pre_delete(record& instance) {
    reset_state(instance.model_name(), instance.pk(), instance.instance_id());
}

void relation_counter_registry::reset_state(const std::string& model, std::optional<primary_key_t> pk,
                                            instance_id_t instance_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto should_remove = [&](const state_ptr& state) {
        return !state->is_alive() || state->instance_id() == instance_id;
    };

    for (auto it = unsaved_.begin(); it != unsaved_.end();) {
        if (should_remove(it->second)) {
            it = unsaved_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = saved_.begin(); it != saved_.end();) {
        const auto& [key_model, key_pk, relation] = it->first;
        bool same_row = pk && key_model == model && key_pk == *pk;

        auto& states = it->second;
        for (auto state_it = states.begin(); state_it != states.end();) {
            if (same_row || should_remove(state_it->second)) {
                LOG_DEBUG("registry", "Dropping %s", state_it->second->describe().c_str());
                state_it = states.erase(state_it);
            } else {
                ++state_it;
            }
        }

        if (states.empty()) {
            it = saved_.erase(it);
        } else {
            ++it;
        }
    }
}

void relation_counter_registry::watch_lifecycle(const std::string& model) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (lifecycle_tokens_.count(model)) {
        return;
    }

    auto& notifications = store_.notifications();
    auto& tokens = lifecycle_tokens_[model];

    tokens.push_back(notifications.observe_post_save(model, [this](record& instance, bool created) {
        if (created) {
            on_first_persist(instance);
        }
    }));
    tokens.push_back(notifications.observe_pre_delete(model, [this](record& instance) {
        on_pre_delete(instance);
    }));
}

void relation_counter_registry::sweep() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sweep_locked();
}

void relation_counter_registry::sweep_locked() {
    size_t removed = 0;

    for (auto it = unsaved_.begin(); it != unsaved_.end();) {
        if (!it->second->is_alive()) {
            it = unsaved_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = saved_.begin(); it != saved_.end();) {
        auto& states = it->second;
        for (auto state_it = states.begin(); state_it != states.end();) {
            if (!state_it->second->is_alive()) {
                state_it = states.erase(state_it);
                ++removed;
            } else {
                ++state_it;
            }
        }
        if (states.empty()) {
            it = saved_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("registry", "Swept %zu dead states", removed);
    }
}

bool relation_counter_registry::has_tracked_states() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sweep_locked();
    return !unsaved_.empty() || !saved_.empty();
}

size_t relation_counter_registry::tracked_state_count() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sweep_locked();
    size_t count = unsaved_.size();
    for (const auto& [key, states] : saved_) {
        count += states.size();
    }
    return count;
}

void relation_counter_registry::reset() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    unsaved_.clear();
    saved_.clear();
    trackers_.clear();
}

relation_tracker& relation_counter_registry::tracker_for(const std::string& model, const std::string& relation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto key = std::make_pair(model, relation);

    auto it = trackers_.find(key);
    if (it != trackers_.end()) {
        return *it->second;
    }

    auto tracker = std::make_unique<relation_tracker>(store_, model, relation);
    auto& result = *tracker;
    trackers_.emplace(std::move(key), std::move(tracker));
    return result;
}

bool relation_counter_registry::has_tracker(const std::string& model, const std::string& relation) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return trackers_.count(std::make_pair(model, relation)) > 0;
}

} // namespace tally
