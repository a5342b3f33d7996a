#pragma once

#include "types.hpp"
#include "record.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tally {

/// Bookkeeping for one loaded representation of a record: which relation
/// counters it carries, and the member ids captured before a clear.
///
/// Holds the record weakly. A state whose record is gone is inert and is
/// swept by the registry.
class instance_state {
public:
    explicit instance_state(const record_ptr& instance);

    instance_state(const instance_state&) = delete;
    instance_state& operator=(const instance_state&) = delete;

    record_ptr lock() const { return record_.lock(); }
    bool is_alive() const { return !record_.expired(); }

    const std::string& model_name() const { return model_; }
    instance_id_t instance_id() const { return instance_id_; }
    const std::set<std::string>& fields() const { return fields_; }

    /// Idempotent
    void track_field(const std::string& attname);

    // One statement for all tracked fields of this record, then a reload
    void increment_fields(int64_t by = 1);
    void decrement_fields(int64_t by = 1);
    void zero_fields();
    void reload_fields();

    /// Copy this state's values into the records of `others`. If this
    /// state's record is gone, each of `others` reloads from the database.
    void sync_fields_to(const std::vector<std::shared_ptr<instance_state>>& others) const;

    void cache_pending_clear(const std::vector<primary_key_t>& ids);
    std::set<primary_key_t> consume_pending_clear();

    std::string describe() const;

private:
    counter_deltas_t deltas(int64_t by) const;

    std::weak_ptr<record> record_;
    std::string model_;
    instance_id_t instance_id_;
    std::set<std::string> fields_;
    std::set<primary_key_t> pending_clear_;
};

using state_ptr = std::shared_ptr<instance_state>;

} // namespace tally
