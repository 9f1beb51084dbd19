#pragma once
#include <corridor/schema/primitives.hpp>

// Schema type: deferred settlement.
// SCALE-encoded into trade_request::hook_data to opt a trade into netting.
namespace corridor::schema {

template <uint16_t Version>
struct deferred_settlement;

template <>
struct deferred_settlement<1> final {
  uint16_t version{1};
  bool defer{};
  amount_t min_out;
  timestamp_milliseconds_t deadline{};
};

using deferred_settlement_t = deferred_settlement<1>;

}  // namespace corridor::schema
