#pragma once

#include "counter_field.hpp"

namespace tally {

/// A counter of the members of a multi-valued relation, kept in sync as
/// members are added, removed or cleared, and as records pointing at the
/// owner through a foreign key are created or deleted.
///
/// Every loaded representation of an owner sees the same value: one of them
/// receives the database write and the rest are updated in memory.
class relation_counter_field : public counter_field {
public:
    relation_counter_field(std::string attname, std::string relation_name);

    const std::string& relation_name() const { return relation_name_; }

    /// Rejects the forward side of a foreign key declared on the owner
    void check(const model_schema& schema) const override;

    void bind(store& owner, std::vector<notification_token>& tokens) override;

protected:
    void do_post_init(record& instance) override;

private:
    std::string relation_name_;
};

} // namespace tally
