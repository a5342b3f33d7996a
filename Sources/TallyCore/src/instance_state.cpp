#include "tally/instance_state.hpp"
#include "tally/counter_field.hpp"
#include <sstream>

namespace tally {

instance_state::instance_state(const record_ptr& instance)
    : record_(instance),
      model_(instance->model_name()),
      instance_id_(instance->instance_id()) {}

void instance_state::track_field(const std::string& attname) {
    fields_.insert(attname);
}

counter_deltas_t instance_state::deltas(int64_t by) const {
    counter_deltas_t result;
    for (const auto& attname : fields_) {
        result[attname] = by;
    }
    return result;
}

void instance_state::increment_fields(int64_t by) {
    if (auto instance = lock()) {
        counter_field::increment_many(*instance, deltas(by));
    }
}

void instance_state::decrement_fields(int64_t by) {
    if (auto instance = lock()) {
        counter_field::decrement_many(*instance, deltas(by));
    }
}

void instance_state::zero_fields() {
    if (auto instance = lock()) {
        counter_values_t values;
        for (const auto& attname : fields_) {
            values[attname] = int64_t{0};
        }
        counter_field::set_values(*instance, values);
    }
}

void instance_state::reload_fields() {
    if (auto instance = lock()) {
        counter_field::reload_fields(*instance, std::vector<std::string>(fields_.begin(), fields_.end()));
    }
}

void instance_state::sync_fields_to(const std::vector<state_ptr>& others) const {
    auto main = lock();
    if (!main) {
        for (const auto& other : others) {
            other->reload_fields();
        }
        return;
    }

    for (const auto& other : others) {
        auto instance = other->lock();
        if (!instance) {
            continue;
        }
        for (const auto& attname : other->fields()) {
            instance->set(attname, main->get(attname));
        }
    }
}

void instance_state::cache_pending_clear(const std::vector<primary_key_t>& ids) {
    pending_clear_ = std::set<primary_key_t>(ids.begin(), ids.end());
}

std::set<primary_key_t> instance_state::consume_pending_clear() {
    std::set<primary_key_t> ids;
    ids.swap(pending_clear_);
    return ids;
}

std::string instance_state::describe() const {
    std::ostringstream out;
    out << "<instance_state " << model_ << " instance=" << instance_id_ << " fields=[";
    bool first = true;
    for (const auto& attname : fields_) {
        if (!first) out << ", ";
        first = false;
        out << attname;
    }
    out << "]" << (is_alive() ? "" : " dead") << ">";
    return out.str();
}

} // namespace tally
