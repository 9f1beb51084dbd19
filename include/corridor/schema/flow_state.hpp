#pragma once
#include <corridor/schema/primitives.hpp>

// Schema type: flow state.
// Signed running total of directional pressure, stored as sign + magnitude.
namespace corridor::schema {

template <uint16_t Version>
struct flow_state;

template <>
struct flow_state<1> final {
  uint16_t version{1};
  corridor_id_t corridor_id{};
  bool negative{};
  amount_t magnitude;
};

using flow_state_t = flow_state<1>;

signed_amount_t to_signed(const flow_state_t& state);
flow_state_t make_flow_state(const corridor_id_t& corridor_id,
                             const signed_amount_t& value);

}  // namespace corridor::schema
