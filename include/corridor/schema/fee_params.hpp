#pragma once
#include <corridor/schema/primitives.hpp>

// Schema type: fee params.
// Per-corridor dynamic fee configuration. Fees are in venue fee units where
// 1'000'000 is 100%. A zero threshold disables the dynamic component.
namespace corridor::schema {

template <uint16_t Version>
struct fee_params;

template <>
struct fee_params<1> final {
  uint16_t version{1};
  corridor_id_t corridor_id{};
  fee_units_t base_fee{};
  fee_units_t max_extra_fee{};
  amount_t net_flow_threshold;
};

using fee_params_t = fee_params<1>;

}  // namespace corridor::schema
