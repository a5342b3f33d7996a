#pragma once

// TallyCore - Denormalized relation counters over SQLite
//
// Usage:
//   #include <TallyCore.hpp>
//
//   int main() {
//       tally::store db;  // in-memory, or db(tally::configuration("path.db"))
//
//       db.register_model(tally::model_schema("Tag")
//           .add_column("label", tally::column_type::text)
//           .add_relation_counter("post_count", "posts"));
//       db.register_model(tally::model_schema("Post")
//           .add_many_to_many("tags", "Tag", "posts")
//           .add_relation_counter("tag_count", "tags"));
//
//       auto post = db.create("Post");
//       auto tag = db.create("Tag", {{"label", "cpp"}});
//       db.add_members(*post, "tags", {*tag->pk()});
//
//       post->counter("tag_count");   // 1
//       tag->counter("post_count");   // 1
//   }

#include "tally/log.hpp"
#include "tally/types.hpp"
#include "tally/configuration.hpp"
#include "tally/db.hpp"
#include "tally/filter.hpp"
#include "tally/observation.hpp"
#include "tally/schema.hpp"
#include "tally/record.hpp"
#include "tally/store.hpp"
#include "tally/counter_field.hpp"
#include "tally/relation_counter_field.hpp"
#include "tally/instance_state.hpp"
#include "tally/relation_tracker.hpp"
#include "tally/registry.hpp"
