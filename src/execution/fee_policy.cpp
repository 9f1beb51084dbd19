#include <corridor/execution/events.hpp>
#include <corridor/execution/fee_policy.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

namespace {

using wide_t = boost::multiprecision::cpp_int;

}  // namespace

fee_units_t compute_fee(const fee_params_t& params,
                        const signed_amount_t& flow) {
  auto fee = params.base_fee;
  if (params.net_flow_threshold == 0) {
    return fee;
  }

  const auto magnitude = wide_t{boost::multiprecision::abs(flow)};
  const auto threshold = wide_t{params.net_flow_threshold};
  if (magnitude <= threshold) {
    return fee;
  }

  // May exceed 10000 for large imbalances; the min below clamps it.
  const auto excess_ratio =
      wide_t{((magnitude - threshold) * kBasisPoints) / threshold};
  const auto scaled =
      wide_t{(wide_t{params.max_extra_fee} * excess_ratio) / kBasisPoints};
  const auto extra =
      std::min(wide_t{params.max_extra_fee}, scaled).convert_to<fee_units_t>();
  return fee + extra;
}

bool valid_fee_params(const fee_params_t& params) {
  return params.base_fee <= kMaxFeeComponent &&
         params.max_extra_fee <= kMaxFeeComponent &&
         params.base_fee <= kMaxVenueFee && params.max_extra_fee <= kMaxVenueFee;
}

fee_policy::fee_policy(state_repository& repository, time_source_t now)
    : repository_{repository}, now_{std::move(now)} {}

status_result_t fee_policy::set_params(const fee_params_t& params) {
  if (!valid_fee_params(params)) {
    return make_failure<std::monostate>(
        error_code::invalid_fee_params,
        fmt::format("base_fee {} / max_extra_fee {} exceed cap {}",
                    params.base_fee, params.max_extra_fee, kMaxFeeComponent));
  }

  auto changes = repository_.begin();
  changes.put_fee_params(params);
  changes.emit(make_event(
      kFeeParamsUpdatedEvent,
      {{"corridor_id", event_value(params.corridor_id), true},
       {"base_fee", event_value(params.base_fee)},
       {"max_extra_fee", event_value(params.max_extra_fee)},
       {"net_flow_threshold", event_value(params.net_flow_threshold)}}));
  auto events = repository_.commit(changes, now_());

  spdlog::info("Fee params for corridor {}: base={} extra={} threshold={}",
               to_hex(params.corridor_id), params.base_fee,
               params.max_extra_fee, to_string(params.net_flow_threshold));
  return make_success(std::monostate{}, std::move(events));
}

std::optional<fee_params_t> fee_policy::params(
    const corridor_id_t& corridor_id) const {
  return repository_.load_fee_params(corridor_id);
}

operation_result<fee_override_t> fee_policy::effective_fee(
    const corridor_id_t& corridor_id) const {
  const auto params = repository_.load_fee_params(corridor_id);
  if (!params || params->base_fee == 0) {
    return make_success(fee_override_t{});
  }

  const auto flow = to_signed(repository_.load_flow(corridor_id));
  const auto fee = compute_fee(*params, flow);
  if (fee > kMaxVenueFee) {
    return make_failure<fee_override_t>(
        error_code::invalid_fee_params,
        fmt::format("effective fee {} exceeds venue bound {}", fee,
                    kMaxVenueFee));
  }
  spdlog::debug("Effective fee for corridor {} at flow {}: {}",
                to_hex(corridor_id), to_string(flow), fee);
  return make_success(fee_override_t{.fee = fee, .active = true});
}

}  // namespace corridor::execution
