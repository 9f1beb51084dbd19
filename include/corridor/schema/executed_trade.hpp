#pragma once
#include <corridor/schema/direction.hpp>
#include <corridor/schema/primitives.hpp>

// Schema type: executed trade.
// Post-trade report from the venue: direction and the input amount paid in.
namespace corridor::schema {

template <uint16_t Version>
struct executed_trade;

template <>
struct executed_trade<1> final {
  uint16_t version{1};
  corridor_id_t corridor_id{};
  direction_t direction{direction_t::leg0_to_leg1};
  amount_t amount_paid;
};

using executed_trade_t = executed_trade<1>;

}  // namespace corridor::schema
