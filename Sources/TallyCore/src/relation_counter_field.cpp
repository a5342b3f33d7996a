#include "tally/relation_counter_field.hpp"
#include "tally/configuration.hpp"
#include "tally/record.hpp"
#include "tally/registry.hpp"
#include "tally/store.hpp"

namespace tally {

relation_counter_field::relation_counter_field(std::string attname, std::string relation_name)
    : counter_field(std::move(attname),
                    [relation = relation_name](record& instance) -> initializer_result {
                        if (!instance.is_saved()) {
                            return int64_t{0};
                        }
                        return instance.owner().count_members(instance, relation);
                    }),
      relation_name_(std::move(relation_name)) {
    if (relation_name_.empty()) {
        throw configuration_error("Relation counter '" + this->attname() + "' needs a relation name");
    }
}

void relation_counter_field::check(const model_schema& schema) const {
    for (const auto& fk : schema.foreign_keys) {
        if (fk.name == relation_name_) {
            throw configuration_error("Counter '" + attname() + "' on " + schema.name +
                                      " cannot count the single-valued relation '" +
                                      relation_name_ + "'");
        }
    }
}

void relation_counter_field::bind(store& owner, std::vector<notification_token>& tokens) {
    counter_field::bind(owner, tokens);
    owner.counter_registry().watch_lifecycle(model_name());
}

void relation_counter_field::do_post_init(record& instance) {
    counter_field::do_post_init(instance);

    auto& registry = instance.owner().counter_registry();
    registry.store_state(instance, *this);

    // Subscribes to the relation's signals the first time a record of the
    // model is seen
    registry.tracker_for(model_name(), relation_name_);
}

} // namespace tally
