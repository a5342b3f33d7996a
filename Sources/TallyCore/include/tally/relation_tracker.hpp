#pragma once

#include "observation.hpp"
#include "schema.hpp"
#include <set>
#include <string>
#include <vector>

namespace tally {

class store;
class record;

/// Keeps the relation counters of one (model, relation) pair in sync.
///
/// Many-to-many relations are followed through their link table's channel;
/// reverse foreign keys through the member model's post_save and post_delete.
/// For each change one loaded representation of the owner is written and the
/// others receive the new value in memory. Counters on the other side that
/// follow the reciprocal relation are updated in the same pass.
class relation_tracker {
public:
    /// Throws configuration_error for unknown relations and for the forward
    /// side of a foreign key.
    relation_tracker(store& owner, const std::string& model, const std::string& relation);

    relation_tracker(const relation_tracker&) = delete;
    relation_tracker& operator=(const relation_tracker&) = delete;

    const relation_info& info() const { return info_; }

private:
    void on_relation_changed(const relation_change& change);
    void on_member_saved(record& member, bool created);
    void on_member_deleted(record& member);

    /// Apply `by` to the owner's counters for this relation
    void update_owner(record& owner_record, int64_t by);
    void update_owner(primary_key_t owner_pk, int64_t by);
    void zero_owner(record& owner_record);

    /// Apply `by` to the reciprocal counters of each member
    void update_members(const std::vector<primary_key_t>& ids, int64_t by);

    store& store_;
    relation_info info_;
    std::vector<notification_token> tokens_;
};

} // namespace tally
