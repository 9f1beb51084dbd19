#include <corridor/schema/flow_state.hpp>

namespace corridor::schema {

signed_amount_t to_signed(const flow_state_t& state) {
  auto value = signed_amount_t{state.magnitude};
  return state.negative ? -value : value;
}

flow_state_t make_flow_state(const corridor_id_t& corridor_id,
                             const signed_amount_t& value) {
  auto state = flow_state_t{.corridor_id = corridor_id};
  state.negative = value < 0;
  state.magnitude = static_cast<amount_t>(boost::multiprecision::abs(value));
  return state;
}

}  // namespace corridor::schema
