#include "tally/counter_field.hpp"
#include "tally/configuration.hpp"
#include "tally/record.hpp"
#include "tally/store.hpp"
#include "tally/log.hpp"
#include <stdexcept>

namespace tally {

namespace {

primary_key_t require_saved(const record& instance, const std::string& attname) {
    if (!instance.pk()) {
        throw std::invalid_argument("Counter '" + attname + "' of unsaved " + instance.model_name() +
                                    " has no row to update");
    }
    return *instance.pk();
}

counter_deltas_t scaled(const counter_deltas_t& deltas, int64_t multiplier) {
    counter_deltas_t result;
    for (const auto& [attname, delta] : deltas) {
        if (delta != 0) {
            result[attname] = delta * multiplier;
        }
    }
    return result;
}

void apply_to_record(record& instance, const counter_deltas_t& deltas, bool reload) {
    if (deltas.empty()) {
        return;
    }
    auto pk = require_saved(instance, deltas.begin()->first);
    instance.owner().apply_deltas(instance.model_name(), filter::by_pk(pk), deltas);

    if (reload) {
        std::vector<std::string> attnames;
        for (const auto& [attname, delta] : deltas) {
            attnames.push_back(attname);
        }
        counter_field::reload_fields(instance, attnames);
    }
}

} // namespace

counter_field::counter_field(std::string attname, initializer_fn initializer,
                             std::optional<int64_t> default_value)
    : attname_(std::move(attname)),
      initializer_(std::move(initializer)),
      default_(default_value) {
    if (attname_.empty()) {
        throw configuration_error("Counter field name must not be empty");
    }
}

column_def counter_field::column() const {
    column_def def;
    def.name = attname_;
    def.type = column_type::integer;
    def.nullable = true;
    def.is_counter = true;
    return def;
}

void counter_field::attach(const std::string& model) {
    if (!model_.empty() && model_ != model) {
        throw configuration_error("Counter '" + attname_ + "' already belongs to " + model_);
    }
    model_ = model;
}

void counter_field::check(const model_schema&) const {}

void counter_field::bind(store& owner, std::vector<notification_token>& tokens) {
    tokens.push_back(owner.notifications().observe_post_init(model_, [this](record& instance) {
        on_post_init(instance);
    }));
}

void counter_field::increment(store& owner, const filter& where, int64_t by) const {
    owner.apply_deltas(model_, where, {{attname_, by}});
}

void counter_field::decrement(store& owner, const filter& where, int64_t by) const {
    owner.apply_deltas(model_, where, {{attname_, -by}});
}

void counter_field::increment(record& instance, bool reload, int64_t by) const {
    if (by != 0) {
        apply_to_record(instance, {{attname_, by}}, reload);
    }
}

void counter_field::decrement(record& instance, bool reload, int64_t by) const {
    if (by != 0) {
        apply_to_record(instance, {{attname_, -by}}, reload);
    }
}

void counter_field::reload(record& instance) const {
    reload_fields(instance, {attname_});
}

bool counter_field::is_reinit_in_flight(const record& instance) const {
    std::lock_guard<std::mutex> lock(reinit_mutex_);
    return reinit_in_flight_.count(instance.instance_id()) > 0;
}

counter_field::reinit_guard::reinit_guard(const counter_field& field, instance_id_t id)
    : field_(field), id_(id) {
    std::lock_guard<std::mutex> lock(field_.reinit_mutex_);
    acquired_ = field_.reinit_in_flight_.insert(id_).second;
}

counter_field::reinit_guard::~reinit_guard() {
    if (acquired_) {
        std::lock_guard<std::mutex> lock(field_.reinit_mutex_);
        field_.reinit_in_flight_.erase(id_);
    }
}

counter_field::initializer_result counter_field::resolve_initial_value(record& instance) const {
    if (!initializer_) {
        return int64_t{0};
    }
    return initializer_(instance);
}

void counter_field::reinit(record& instance) const {
    reinit_guard guard(*this, instance.instance_id());
    if (!guard.acquired()) {
        LOG_DEBUG("counter", "Skipping nested reinit of %s on %s",
                  attname_.c_str(), instance.describe().c_str());
        return;
    }

    // An unsaved record without an initializer is initialized on next access
    // rather than defaulted to 0.
    if (!instance.is_saved() && !initializer_) {
        return;
    }

    auto value = resolve_initial_value(instance);

    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }

    if (auto* expr = std::get_if<deferred_expression>(&value)) {
        if (instance.is_saved()) {
            set_values(instance, {{attname_, *expr}}, true);
            LOG_DEBUG("counter", "Reinitialized %s on %s from expression -> %lld",
                      attname_.c_str(), instance.describe().c_str(),
                      static_cast<long long>(instance.counter(attname_)));
            return;
        }
        value = int64_t{0};
    }

    instance.set(attname_, std::get<int64_t>(value));
    if (instance.is_saved()) {
        instance.owner().save(instance, {attname_});
    }
    LOG_DEBUG("counter", "Reinitialized %s on %s -> %lld",
              attname_.c_str(), instance.describe().c_str(),
              static_cast<long long>(std::get<int64_t>(value)));
}

void counter_field::on_post_init(record& instance) {
    if (is_reinit_in_flight(instance)) {
        return;
    }
    do_post_init(instance);
}

void counter_field::do_post_init(record& instance) {
    if (detail::is_null(instance.get(attname_))) {
        reinit(instance);
    }
}

void counter_field::increment_many(record& instance, const counter_deltas_t& deltas, bool reload) {
    apply_to_record(instance, scaled(deltas, 1), reload);
}

void counter_field::decrement_many(record& instance, const counter_deltas_t& deltas, bool reload) {
    apply_to_record(instance, scaled(deltas, -1), reload);
}

void counter_field::set_values(record& instance, const counter_values_t& values, bool reload) {
    if (values.empty()) {
        return;
    }
    auto pk = require_saved(instance, values.begin()->first);
    instance.owner().apply_values(instance.model_name(), filter::by_pk(pk), values);

    if (reload) {
        std::vector<std::string> attnames;
        for (const auto& [attname, value] : values) {
            attnames.push_back(attname);
        }
        reload_fields(instance, attnames);
    }
}

void counter_field::reload_fields(record& instance, const std::vector<std::string>& attnames) {
    if (attnames.empty()) {
        return;
    }
    auto pk = require_saved(instance, attnames.front());
    auto row = instance.owner().fetch_columns(instance.model_name(), pk, attnames);
    for (const auto& attname : attnames) {
        instance.set(attname, row.at(attname));
    }
}

} // namespace tally
