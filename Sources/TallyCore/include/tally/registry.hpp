#pragma once

#include "instance_state.hpp"
#include "observation.hpp"
#include "record.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace tally {

class store;
class relation_counter_field;
class relation_tracker;

/// Live instance states and relation trackers for one store.
///
/// Unsaved records have one state covering all of their relation counters.
/// Saved records have one state per (model, pk, relation) and loaded
/// representation. Dead states are swept lazily, when a state is stored or
/// when has_tracked_states() is asked.
///
/// All access happens under a single recursive mutex, which is never held
/// while the database is touched.
class relation_counter_registry {
public:
    explicit relation_counter_registry(store& owner);
    ~relation_counter_registry();

    relation_counter_registry(const relation_counter_registry&) = delete;
    relation_counter_registry& operator=(const relation_counter_registry&) = delete;

    // ------------------------------------------------------------------
    // States
    // ------------------------------------------------------------------

    /// Look up or create the state for `instance` and track the field on it
    state_ptr store_state(record& instance, const relation_counter_field& field);

    /// Live states of every loaded representation of (model, pk), for one relation
    std::vector<state_ptr> get_saved_states(const std::string& model, primary_key_t pk,
                                            const std::string& relation);

    /// Pick the state that receives writes, and the ones that get copies.
    /// Empty if no state in `states` is alive.
    std::optional<std::pair<state_ptr, std::vector<state_ptr>>>
    separate_saved_states(const std::vector<state_ptr>& states) const;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /// An unsaved record got its pk: swap its unsaved state for one saved
    /// state per relation its counters follow.
    void on_first_persist(record& instance);

    void on_pre_delete(record& instance);

    /// Drop every state that is dead, belongs to `instance_id`, or
    /// represents (model, pk)
    void reset_state(const std::string& model, std::optional<primary_key_t> pk,
                     instance_id_t instance_id);

    /// Subscribe lifecycle hooks for a model with relation counters. Idempotent.
    void watch_lifecycle(const std::string& model);

    // ------------------------------------------------------------------
    // Housekeeping
    // ------------------------------------------------------------------

    /// Discard states whose record is gone
    void sweep();

    bool has_tracked_states();
    size_t tracked_state_count();

    /// Drop all states and trackers. Lifecycle hooks stay subscribed.
    void reset();

    // ------------------------------------------------------------------
    // Trackers
    // ------------------------------------------------------------------

    /// The tracker for (model, relation), created on first use. Throws
    /// configuration_error if the relation cannot be counted; nothing is
    /// cached in that case.
    relation_tracker& tracker_for(const std::string& model, const std::string& relation);

    bool has_tracker(const std::string& model, const std::string& relation) const;

private:
    using saved_key_t = std::tuple<std::string, primary_key_t, std::string>;
    using state_map_t = std::map<instance_id_t, state_ptr>;

    void sweep_locked();

    store& store_;
    mutable std::recursive_mutex mutex_;
    state_map_t unsaved_;
    std::map<saved_key_t, state_map_t> saved_;
    std::map<std::pair<std::string, std::string>, std::unique_ptr<relation_tracker>> trackers_;
    std::map<std::string, std::vector<notification_token>> lifecycle_tokens_;
};

} // namespace tally
