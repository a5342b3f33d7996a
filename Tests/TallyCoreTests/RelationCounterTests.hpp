#pragma once

#include <TallyCore.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace relation_counter_tests {

using tally::primary_key_t;
using tally::record_ptr;

// Post <-> Tag through Post.tags / Tag.posts, and Comment -> Post through
// Comment.post / Post.comments
inline void register_blog(tally::store& db) {
    db.register_model(tally::model_schema("Tag")
        .add_column("label", tally::column_type::text)
        .add_relation_counter("post_count", "posts"));
    db.register_model(tally::model_schema("Post")
        .add_column("title", tally::column_type::text)
        .add_many_to_many("tags", "Tag", "posts")
        .add_relation_counter("tag_count", "tags")
        .add_relation_counter("comment_count", "comments"));
    db.register_model(tally::model_schema("Comment")
        .add_column("body", tally::column_type::text)
        .add_foreign_key("post", "Post", "comments"));
}

inline primary_key_t new_tag(tally::store& db) {
    return *db.create("Tag")->pk();
}

// ============================================================================
// Two representations of one owner, one member
// ============================================================================

void test_two_representations_converge() {
    std::cout << "  test_two_representations_converge..." << std::flush;

    tally::store db;
    register_blog(db);

    auto pk = *db.create("Post", {{"title", "O"}})->pk();
    auto o1 = db.load("Post", pk);
    auto o2 = db.load("Post", pk);
    assert(o1->instance_id() != o2->instance_id());
    assert(o1->counter("tag_count") == 0);
    assert(o2->counter("tag_count") == 0);

    auto m = db.create("Tag", {{"label", "M"}});
    auto m_pk = *m->pk();

    db.add_members(*o1, "tags", {m_pk});
    assert(o1->counter("tag_count") == 1);
    assert(o2->counter("tag_count") == 1);
    assert(m->counter("post_count") == 1);

    db.remove_members(*o2, "tags", {m_pk});
    assert(o1->counter("tag_count") == 0);
    assert(o2->counter("tag_count") == 0);
    assert(m->counter("post_count") == 0);

    // Two members that are not loaded anywhere
    std::vector<primary_key_t> ids{new_tag(db), new_tag(db)};
    db.add_members(*o1, "tags", ids);
    assert(o1->counter("tag_count") == 2);
    assert(o2->counter("tag_count") == 2);

    db.clear_members(*o2, "tags");
    assert(o1->counter("tag_count") == 0);
    assert(o2->counter("tag_count") == 0);
    assert(db.count_members("Post", pk, "tags") == 0);

    auto member = db.load("Tag", ids[0]);
    assert(member->counter("post_count") == 0);
    member->reinit_counter("post_count");
    assert(member->counter("post_count") == 0);

    auto other = db.load("Tag", ids[1]);
    assert(other->counter("post_count") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// One counter write, however many representations are loaded
// ============================================================================

void test_single_write_for_many_representations() {
    std::cout << "  test_single_write_for_many_representations..." << std::flush;

    tally::store db;
    register_blog(db);

    auto owner = db.create("Post");
    auto pk = *owner->pk();

    std::vector<record_ptr> copies;
    for (int i = 0; i < 4; ++i) {
        copies.push_back(db.load("Post", pk));
    }
    auto tag_pk = new_tag(db);

    db.db().reset_stats();
    db.add_members(*copies[2], "tags", {tag_pk});

    const auto& stats = db.db().stats();
    assert(stats.inserts == 1);   // the link row
    assert(stats.updates == 2);   // owner row, member row
    assert(stats.deletes == 0);

    assert(owner->counter("tag_count") == 1);
    for (const auto& copy : copies) {
        assert(copy->counter("tag_count") == 1);
    }

    // Same again on removal
    db.db().reset_stats();
    db.remove_members(*copies[0], "tags", {tag_pk});
    assert(db.db().stats().updates == 2);
    assert(db.db().stats().deletes == 1);
    for (const auto& copy : copies) {
        assert(copy->counter("tag_count") == 0);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Mutations from the reverse side of the link
// ============================================================================

void test_reverse_many_to_many() {
    std::cout << "  test_reverse_many_to_many..." << std::flush;

    tally::store db;
    register_blog(db);

    auto tag = db.create("Tag");
    auto tag_copy = db.load("Tag", *tag->pk());
    auto a = db.create("Post");
    auto b_pk = *db.create("Post")->pk();

    db.add_members(*tag, "posts", {*a->pk(), b_pk});
    assert(tag->counter("post_count") == 2);
    assert(tag_copy->counter("post_count") == 2);
    assert(a->counter("tag_count") == 1);
    assert(db.load("Post", b_pk)->counter("tag_count") == 1);

    // The link is shared with Post.tags
    assert(db.member_ids(*a, "tags") == std::vector<primary_key_t>{*tag->pk()});

    db.remove_members(*tag_copy, "posts", {*a->pk()});
    assert(tag->counter("post_count") == 1);
    assert(a->counter("tag_count") == 0);

    db.clear_members(*tag, "posts");
    assert(tag->counter("post_count") == 0);
    assert(tag_copy->counter("post_count") == 0);
    assert(db.load("Post", b_pk)->counter("tag_count") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Adding a linked member twice, or removing an unlinked one, changes nothing
// ============================================================================

void test_redundant_mutations() {
    std::cout << "  test_redundant_mutations..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post");
    auto tag_pk = new_tag(db);
    auto unlinked = new_tag(db);

    db.add_members(*post, "tags", {tag_pk, tag_pk});
    assert(post->counter("tag_count") == 1);

    db.db().reset_stats();
    db.add_members(*post, "tags", {tag_pk});
    db.remove_members(*post, "tags", {unlinked});
    db.add_members(*post, "tags", {});
    assert(db.db().stats().writes() == 0);
    assert(post->counter("tag_count") == 1);
    assert(db.load("Tag", unlinked)->counter("post_count") == 0);

    bool threw = false;
    try {
        db.add_members(*post, "tags", {9999});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(post->counter("tag_count") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Clear: member ids from the pre_clear cache or from the notification
// ============================================================================

void test_clear_with_loaded_members() {
    std::cout << "  test_clear_with_loaded_members..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post");
    auto other_post = db.create("Post");
    auto t1 = db.create("Tag");
    auto t1_copy = db.load("Tag", *t1->pk());
    auto t2_pk = new_tag(db);

    db.add_members(*post, "tags", {*t1->pk(), t2_pk});
    db.add_members(*other_post, "tags", {*t1->pk()});
    assert(t1->counter("post_count") == 2);
    assert(t1_copy->counter("post_count") == 2);

    db.clear_members(*post, "tags");
    assert(post->counter("tag_count") == 0);
    assert(other_post->counter("tag_count") == 1);
    assert(t1->counter("post_count") == 1);
    assert(t1_copy->counter("post_count") == 1);
    assert(db.load("Tag", t2_pk)->counter("post_count") == 0);

    // The cache is consumed: clearing an empty relation touches no member
    db.db().reset_stats();
    db.clear_members(*post, "tags");
    assert(db.db().stats().updates == 1);
    assert(t1->counter("post_count") == 1);

    std::cout << " OK" << std::endl;
}

void test_clear_reporting_ids() {
    std::cout << "  test_clear_reporting_ids..." << std::flush;

    tally::configuration config;
    config.report_cleared_ids = true;
    tally::store db(config);
    register_blog(db);

    std::vector<primary_key_t> cleared;
    auto token = db.notifications().observe_relation(tally::link_table_name("Post", "tags"),
        [&cleared](const tally::relation_change& change) {
            if (change.action == tally::relation_action::post_clear && change.ids) {
                cleared = *change.ids;
            }
        });

    auto post = db.create("Post");
    std::vector<primary_key_t> ids{new_tag(db), new_tag(db), new_tag(db)};
    db.add_members(*post, "tags", ids);

    db.clear_members(*post, "tags");
    assert(cleared == ids);
    assert(post->counter("tag_count") == 0);
    for (auto id : ids) {
        assert(db.load("Tag", id)->counter("post_count") == 0);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Reverse foreign key: created and deleted members
// ============================================================================

void test_reverse_foreign_key() {
    std::cout << "  test_reverse_foreign_key..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post");
    auto pk = *post->pk();
    auto copy = db.load("Post", pk);

    auto comment = db.create("Comment", {{"post_id", pk}});
    assert(post->counter("comment_count") == 1);
    assert(copy->counter("comment_count") == 1);

    // Saving an existing comment is not a new member
    comment->set("body", "edited");
    db.save(*comment);
    assert(post->counter("comment_count") == 1);

    db.remove(*comment);
    assert(!comment->is_saved());
    assert(post->counter("comment_count") == 0);
    assert(copy->counter("comment_count") == 0);

    // Comments without a post are ignored
    db.create("Comment");
    assert(post->counter("comment_count") == 0);

    std::cout << " OK" << std::endl;
}

void test_reverse_foreign_key_unloaded_owner() {
    std::cout << "  test_reverse_foreign_key_unloaded_owner..." << std::flush;

    tally::store db;
    register_blog(db);

    auto pk = *db.create("Post")->pk();
    assert(!db.counter_registry().has_tracked_states());

    auto first = db.create("Comment", {{"post_id", pk}});
    db.create("Comment", {{"post_id", pk}});
    assert(db.load("Post", pk)->counter("comment_count") == 2);

    db.remove(*first);
    assert(db.load("Post", pk)->counter("comment_count") == 1);
    assert(db.count_members("Post", pk, "comments") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Deleting an owner drops its state; a reused pk starts clean
// ============================================================================

void test_delete_and_pk_reuse() {
    std::cout << "  test_delete_and_pk_reuse..." << std::flush;

    tally::store db;
    register_blog(db);

    auto tag = db.create("Tag");
    auto post = db.create("Post");
    auto pk = *post->pk();
    auto copy = db.load("Post", pk);

    db.add_members(*post, "tags", {*tag->pk()});
    assert(copy->counter("tag_count") == 1);
    assert(!db.counter_registry().get_saved_states("Post", pk, "tags").empty());

    db.remove(*post);
    assert(db.counter_registry().get_saved_states("Post", pk, "tags").empty());
    assert(db.counter_registry().get_saved_states("Post", pk, "comments").empty());
    assert(db.find("Post", pk) == nullptr);
    assert(db.member_ids("Tag", *tag->pk(), "posts").empty());

    // Highest key is handed out again
    auto reused = db.create("Post");
    assert(*reused->pk() == pk);
    assert(reused->counter("tag_count") == 0);
    assert(db.counter_registry().get_saved_states("Post", pk, "tags").size() == 1);

    // The stale copy of the deleted row no longer receives updates
    db.add_members(*reused, "tags", {*tag->pk()});
    assert(reused->counter("tag_count") == 1);
    db.remove_members(*reused, "tags", {*tag->pk()});
    assert(reused->counter("tag_count") == 0);
    assert(copy->counter("tag_count") == 1);

    // Link rows removed by the delete bypassed the signals; reinit catches up
    tag->reload_counter("post_count");
    assert(tag->counter("post_count") == 1);
    tag->reinit_counter("post_count");
    assert(tag->counter("post_count") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Registry housekeeping
// ============================================================================

void test_dropped_records_are_swept() {
    std::cout << "  test_dropped_records_are_swept..." << std::flush;

    tally::store db;
    register_blog(db);
    auto& registry = db.counter_registry();

    {
        auto post = db.create("Post");
        auto copy = db.load("Post", *post->pk());
        auto unsaved = db.create_record("Post");
        // Two relations per saved representation, one state for the unsaved one
        assert(registry.tracked_state_count() == 5);

        auto dead = registry.get_saved_states("Post", *post->pk(), "tags");
        assert(dead.size() == 2);
    }

    assert(!registry.has_tracked_states());
    assert(registry.tracked_state_count() == 0);

    // Trackers survive; reset() drops them
    assert(registry.has_tracker("Post", "tags"));
    registry.reset();
    assert(!registry.has_tracker("Post", "tags"));

    // Lifecycle hooks survive a reset
    auto post = db.create("Post");
    assert(registry.get_saved_states("Post", *post->pk(), "tags").size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// An unsaved record moves to saved states on its first save
// ============================================================================

void test_first_save_migrates_state() {
    std::cout << "  test_first_save_migrates_state..." << std::flush;

    tally::store db;
    register_blog(db);
    auto& registry = db.counter_registry();

    auto post = db.create_record("Post", {{"title", "draft"}});
    assert(post->counter("tag_count") == 0);
    assert(registry.tracked_state_count() == 1);

    db.save(*post);
    auto pk = *post->pk();
    assert(registry.tracked_state_count() == 2);
    auto tag_states = registry.get_saved_states("Post", pk, "tags");
    auto comment_states = registry.get_saved_states("Post", pk, "comments");
    assert(tag_states.size() == 1);
    assert(comment_states.size() == 1);
    assert(tag_states[0]->fields().count("tag_count") == 1);
    assert(comment_states[0]->fields().count("comment_count") == 1);
    assert(tag_states[0]->lock() == post);

    // A second save does not migrate again
    db.save(*post);
    assert(registry.tracked_state_count() == 2);

    db.add_members(*post, "tags", {new_tag(db)});
    assert(post->counter("tag_count") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Plain saves leave counters alone
// ============================================================================

void test_plain_save_skips_counters() {
    std::cout << "  test_plain_save_skips_counters..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post", {{"title", "a"}});
    auto pk = *post->pk();
    auto stale = db.load("Post", pk);
    db.add_members(*post, "tags", {new_tag(db)});

    // Bypass the sync to simulate a representation that missed an update
    stale->set("tag_count", int64_t{42});
    stale->set("title", "b");
    db.save(*stale);

    auto fresh = db.load("Post", pk);
    assert(std::get<std::string>(fresh->get("title")) == "b");
    assert(fresh->counter("tag_count") == 1);

    // Listed explicitly, the counter is written
    db.save(*stale, {"tag_count"});
    assert(db.load("Post", pk)->counter("tag_count") == 42);

    // Null is written too, and the next load reinitializes it
    stale->set("tag_count", nullptr);
    db.save(*stale);
    auto reloaded = db.load("Post", pk);
    assert(reloaded->counter("tag_count") == 1);
    assert(db.load("Post", pk)->counter("tag_count") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Counters on the forward side of a foreign key are rejected
// ============================================================================

void test_forward_foreign_key_rejected() {
    std::cout << "  test_forward_foreign_key_rejected..." << std::flush;

    tally::store db;
    db.register_model(tally::model_schema("Post"));

    bool threw = false;
    try {
        db.register_model(tally::model_schema("Comment")
            .add_foreign_key("post", "Post", "comments")
            .add_relation_counter("post_count", "post"));
    } catch (const tally::configuration_error&) {
        threw = true;
    }
    assert(threw);
    assert(db.schemas().get_schema("Comment") == nullptr);

    // A tracker cannot be built for it either, and nothing is cached
    db.register_model(tally::model_schema("Reply").add_foreign_key("post", "Post", "replies"));
    for (int attempt = 0; attempt < 2; ++attempt) {
        threw = false;
        try {
            db.counter_registry().tracker_for("Reply", "post");
        } catch (const tally::configuration_error&) {
            threw = true;
        }
        assert(threw);
        assert(!db.counter_registry().has_tracker("Reply", "post"));
    }

    // Unknown relations fail the same way
    threw = false;
    try {
        db.counter_registry().tracker_for("Post", "missing");
    } catch (const tally::configuration_error&) {
        threw = true;
    }
    assert(threw);

    // A relation counter must name its relation
    threw = false;
    try {
        tally::relation_counter_field unnamed("tag_count", "");
    } catch (const tally::configuration_error& e) {
        threw = std::string(e.what()).find("tag_count") != std::string::npos;
    }
    assert(threw);

    // Relation operations only apply to many-to-many relations
    auto post = db.create("Post");
    threw = false;
    try {
        db.add_members(*post, "replies", {1});
    } catch (const tally::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Self-referential many-to-many: both directions on one link table
// ============================================================================

void test_self_referential_many_to_many() {
    std::cout << "  test_self_referential_many_to_many..." << std::flush;

    tally::store db;
    db.register_model(tally::model_schema("Person")
        .add_many_to_many("following", "Person", "followers")
        .add_relation_counter("following_count", "following")
        .add_relation_counter("follower_count", "followers"));

    auto alice = db.create("Person");
    auto bob = db.create("Person");
    auto carol = db.create("Person");

    db.add_members(*alice, "following", {*bob->pk(), *carol->pk()});
    assert(alice->counter("following_count") == 2);
    assert(alice->counter("follower_count") == 0);
    assert(bob->counter("follower_count") == 1);
    assert(bob->counter("following_count") == 0);

    db.add_members(*carol, "followers", {*bob->pk()});
    assert(carol->counter("follower_count") == 2);
    assert(bob->counter("following_count") == 1);

    db.clear_members(*carol, "followers");
    assert(carol->counter("follower_count") == 0);
    assert(alice->counter("following_count") == 1);
    assert(bob->counter("following_count") == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Failures partway through a mutation
// ============================================================================

void test_failed_clear_leaves_no_stale_members() {
    std::cout << "  test_failed_clear_leaves_no_stale_members..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post");
    auto t1_pk = new_tag(db);
    auto t2_pk = new_tag(db);
    db.add_members(*post, "tags", {t1_pk, t2_pk});

    db.db().execute("CREATE TRIGGER refuse_unlink BEFORE DELETE ON _Post_tags "
                    "BEGIN SELECT RAISE(ABORT, 'unlink refused'); END");
    bool threw = false;
    try {
        db.clear_members(*post, "tags");
    } catch (const tally::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(db.count_members("Post", *post->pk(), "tags") == 2);
    assert(post->counter("tag_count") == 2);

    db.db().execute("DROP TRIGGER refuse_unlink");
    db.remove_members(*post, "tags", {t1_pk});
    assert(post->counter("tag_count") == 1);
    assert(db.load("Tag", t1_pk)->counter("post_count") == 0);

    // Only t2 is still linked, so t1 must not be decremented again
    db.clear_members(*post, "tags");
    assert(post->counter("tag_count") == 0);
    assert(db.load("Tag", t1_pk)->counter("post_count") == 0);
    assert(db.load("Tag", t2_pk)->counter("post_count") == 0);

    std::cout << " OK" << std::endl;
}

void test_storage_errors_reach_the_caller() {
    std::cout << "  test_storage_errors_reach_the_caller..." << std::flush;

    tally::store db;
    register_blog(db);

    auto post = db.create("Post");
    auto linked = new_tag(db);
    auto unlinked = new_tag(db);
    db.add_members(*post, "tags", {linked});

    db.db().execute("CREATE TRIGGER refuse_tag_update BEFORE UPDATE ON Tag "
                    "BEGIN SELECT RAISE(ABORT, 'tag update refused'); END");

    bool threw = false;
    try {
        db.add_members(*post, "tags", {unlinked});
    } catch (const tally::db_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        db.remove_members(*post, "tags", {linked});
    } catch (const tally::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Sync from a representation that has been released
// ============================================================================

void test_sync_from_released_main() {
    std::cout << "  test_sync_from_released_main..." << std::flush;

    tally::store db;
    register_blog(db);

    auto pk = *db.create("Post")->pk();
    auto kept = db.load("Post", pk);
    auto released = db.load("Post", pk);

    auto& registry = db.counter_registry();
    auto states = registry.get_saved_states("Post", pk, "tags");
    assert(states.size() == 2);

    tally::state_ptr released_state;
    tally::state_ptr kept_state;
    for (const auto& state : states) {
        if (state->instance_id() == released->instance_id()) {
            released_state = state;
        } else {
            kept_state = state;
        }
    }
    assert(released_state && kept_state);

    released.reset();
    assert(!released_state->is_alive());

    db.apply_deltas("Post", tally::filter::by_pk(pk), {{"tag_count", 3}});
    assert(kept->counter("tag_count") == 0);

    released_state->sync_fields_to({kept_state});
    assert(kept->counter("tag_count") == 3);

    std::cout << " OK" << std::endl;
}

} // namespace relation_counter_tests
