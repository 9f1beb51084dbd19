#pragma once
#include <corridor/schema/direction.hpp>
#include <corridor/schema/primitives.hpp>
#include <optional>

// Schema type: intent state.
// A recorded request to trade, pending settlement. Created by the pre-trade
// hook in deferred mode and flipped to settled exactly once by netting.
namespace corridor::schema {

template <uint16_t Version>
struct intent_state;

template <>
struct intent_state<1> final {
  uint16_t version{1};
  intent_id_t intent_id{};
  account_id_t owner{};
  corridor_id_t corridor_id{};
  direction_t direction{direction_t::leg0_to_leg1};
  amount_t magnitude;
  std::optional<amount_t> price_limit;
  amount_t min_out;
  timestamp_milliseconds_t deadline{};
  timestamp_milliseconds_t created_at{};
  bool settled{};
  amount_t settled_output;
};

using intent_state_t = intent_state<1>;

}  // namespace corridor::schema
