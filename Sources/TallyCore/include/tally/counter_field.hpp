#pragma once

#include "types.hpp"
#include "filter.hpp"
#include "observation.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tally {

class record;
class store;
struct model_schema;

/// An integer column holding a denormalized count.
///
/// Counter columns are nullable: null on a loaded record means "never
/// computed" and triggers reinit when the record is constructed or loaded.
/// Plain saves leave counter columns alone (see store::save), so deltas
/// applied through other representations of the same row are not clobbered.
class counter_field {
public:
    /// Result of an initializer: nothing, a concrete value, or an SQL
    /// expression evaluated by the store when the value is written.
    using initializer_result = std::variant<std::monostate, int64_t, deferred_expression>;
    using initializer_fn = std::function<initializer_result(record&)>;

    explicit counter_field(std::string attname,
                           initializer_fn initializer = nullptr,
                           std::optional<int64_t> default_value = std::nullopt);
    virtual ~counter_field() = default;

    counter_field(const counter_field&) = delete;
    counter_field& operator=(const counter_field&) = delete;

    const std::string& attname() const { return attname_; }
    const std::string& model_name() const { return model_; }
    std::optional<int64_t> default_value() const { return default_; }

    column_def column() const;

    /// Called by model_schema::add_counter. A field belongs to one model.
    void attach(const std::string& model);

    /// Validate the field against its (complete) model. Throws configuration_error.
    virtual void check(const model_schema& schema) const;

    /// Subscribe to the store's signals. Tokens are kept alive by the store.
    virtual void bind(store& owner, std::vector<notification_token>& tokens);

    // ------------------------------------------------------------------
    // Rows matching a filter
    // ------------------------------------------------------------------

    void increment(store& owner, const filter& where, int64_t by = 1) const;
    void decrement(store& owner, const filter& where, int64_t by = 1) const;

    // ------------------------------------------------------------------
    // One record
    // ------------------------------------------------------------------

    void increment(record& instance, bool reload = true, int64_t by = 1) const;
    void decrement(record& instance, bool reload = true, int64_t by = 1) const;
    void reload(record& instance) const;

    /// Recompute the value from the initializer and store it. A nested call
    /// for the same record and field while one is running does nothing.
    void reinit(record& instance) const;

    bool is_reinit_in_flight(const record& instance) const;

    // ------------------------------------------------------------------
    // Several counters of one record in a single statement
    // ------------------------------------------------------------------

    /// Zero deltas are dropped. Nothing is written if none remain.
    static void increment_many(record& instance, const counter_deltas_t& deltas, bool reload = true);
    static void decrement_many(record& instance, const counter_deltas_t& deltas, bool reload = true);
    static void set_values(record& instance, const counter_values_t& values, bool reload = true);
    static void reload_fields(record& instance, const std::vector<std::string>& attnames);

protected:
    /// Runs after a record of the model is constructed or loaded, unless a
    /// reinit of this field on that record is in flight.
    virtual void do_post_init(record& instance);

private:
    void on_post_init(record& instance);
    initializer_result resolve_initial_value(record& instance) const;

    // Scoped membership in the in-flight set
    class reinit_guard {
    public:
        reinit_guard(const counter_field& field, instance_id_t id);
        ~reinit_guard();

        reinit_guard(const reinit_guard&) = delete;
        reinit_guard& operator=(const reinit_guard&) = delete;

        bool acquired() const { return acquired_; }

    private:
        const counter_field& field_;
        instance_id_t id_;
        bool acquired_ = false;
    };

    std::string attname_;
    std::string model_;
    initializer_fn initializer_;
    std::optional<int64_t> default_;

    mutable std::mutex reinit_mutex_;
    mutable std::set<instance_id_t> reinit_in_flight_;
};

} // namespace tally
