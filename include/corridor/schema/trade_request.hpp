#pragma once
#include <corridor/schema/direction.hpp>
#include <corridor/schema/primitives.hpp>
#include <optional>

// Schema type: trade request.
// What the trade-execution host hands the pre-trade hook. The owner is always
// explicit; the engine never infers identity from the calling context.
namespace corridor::schema {

template <uint16_t Version>
struct trade_request;

template <>
struct trade_request<1> final {
  uint16_t version{1};
  account_id_t owner{};
  corridor_id_t corridor_id{};
  direction_t direction{direction_t::leg0_to_leg1};
  amount_t amount;
  std::optional<amount_t> price_limit;
  bytes_t hook_data;
};

using trade_request_t = trade_request<1>;

}  // namespace corridor::schema
