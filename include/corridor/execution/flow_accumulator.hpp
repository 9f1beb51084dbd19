#pragma once

#include <corridor/execution/state_repository.hpp>
#include <corridor/execution/time_source.hpp>
#include <corridor/schema/direction.hpp>
#include <corridor/schema/operation_result.hpp>

namespace corridor::execution {

/// Per-corridor signed running sum of executed trade volume. No decay and no
/// window; only an explicit reset brings it back to zero.
class flow_accumulator final {
 public:
  flow_accumulator(state_repository& repository, time_source_t now);

  /// Add the paid-in amount for leg0_to_leg1, subtract it otherwise.
  /// Returns the new flow.
  corridor::schema::operation_result<corridor::schema::signed_amount_t>
  on_trade_executed(const corridor::schema::corridor_id_t& corridor_id,
                    corridor::schema::direction_t direction,
                    const corridor::schema::amount_t& amount_paid);

  /// Set the corridor's flow to zero. Returns the previous flow.
  corridor::schema::operation_result<corridor::schema::signed_amount_t> reset(
      const corridor::schema::corridor_id_t& corridor_id);

  corridor::schema::signed_amount_t current(
      const corridor::schema::corridor_id_t& corridor_id) const;

 private:
  state_repository& repository_;
  time_source_t now_;
};

}  // namespace corridor::execution
