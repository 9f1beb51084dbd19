#pragma once

#include <corridor/execution/state_repository.hpp>
#include <corridor/execution/time_source.hpp>
#include <corridor/schema/fee_override.hpp>
#include <corridor/schema/fee_params.hpp>
#include <corridor/schema/operation_result.hpp>

#include <optional>

namespace corridor::execution {

/// Cap on each of base_fee and max_extra_fee (1%).
inline constexpr auto kMaxFeeComponent = corridor::schema::fee_units_t{10'000};
/// Basis-point scale used for the excess-flow ratio.
inline constexpr auto kBasisPoints = uint32_t{10'000};

/// Clamped piecewise-linear fee curve over |flow|:
/// base_fee up to the threshold, rising linearly to base_fee + max_extra_fee
/// at twice the threshold, flat afterwards.
corridor::schema::fee_units_t compute_fee(
    const corridor::schema::fee_params_t& params,
    const corridor::schema::signed_amount_t& flow);

bool valid_fee_params(const corridor::schema::fee_params_t& params);

class fee_policy final {
 public:
  fee_policy(state_repository& repository, time_source_t now);

  corridor::schema::status_result_t set_params(
      const corridor::schema::fee_params_t& params);

  std::optional<corridor::schema::fee_params_t> params(
      const corridor::schema::corridor_id_t& corridor_id) const;

  /// Fee for the next immediate trade on the corridor. Inactive (no override)
  /// when the corridor has no base fee.
  corridor::schema::operation_result<corridor::schema::fee_override_t>
  effective_fee(const corridor::schema::corridor_id_t& corridor_id) const;

 private:
  state_repository& repository_;
  time_source_t now_;
};

}  // namespace corridor::execution
