#pragma once
#include <corridor/schema/direction.hpp>
#include <corridor/schema/primitives.hpp>

// Schema type: cow stats.
// Aggregate outcome of one batch settlement. Never persisted.
namespace corridor::schema {

struct cow_stats final {
  corridor_id_t corridor_id{};
  uint64_t valid_count{};
  amount_t total_leg0;
  amount_t total_leg1;
  amount_t matched_amount;
  amount_t residual_to_venue;
  // Equal totals resolve to leg0_to_leg1. The tie carries no meaning.
  direction_t residual_direction{direction_t::leg0_to_leg1};
  amount_t cost_saved_estimate;
};

using cow_stats_t = cow_stats;

}  // namespace corridor::schema
