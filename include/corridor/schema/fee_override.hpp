#pragma once
#include <corridor/schema/primitives.hpp>

namespace corridor::schema {

/// Venue flag marking a per-trade fee as an override of the static fee.
inline constexpr auto kOverrideFeeFlag = fee_units_t{0x400000};
/// Largest fee the venue accepts (100%).
inline constexpr auto kMaxVenueFee = fee_units_t{1'000'000};

/// Fee returned by the pricing path. An inactive override means the venue
/// keeps the corridor's static fee; an active one may still carry 0.
struct fee_override final {
  fee_units_t fee{};
  bool active{};

  fee_units_t encoded() const { return active ? (fee | kOverrideFeeFlag) : 0; }
};

using fee_override_t = fee_override;

}  // namespace corridor::schema
