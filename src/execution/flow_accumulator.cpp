#include <corridor/execution/events.hpp>
#include <corridor/execution/flow_accumulator.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

flow_accumulator::flow_accumulator(state_repository& repository,
                                   time_source_t now)
    : repository_{repository}, now_{std::move(now)} {}

operation_result<signed_amount_t> flow_accumulator::on_trade_executed(
    const corridor_id_t& corridor_id,
    const direction_t direction,
    const amount_t& amount_paid) {
  const auto previous = to_signed(repository_.load_flow(corridor_id));
  const auto delta = signed_amount_t{amount_paid};
  auto updated = previous;
  try {
    updated = direction == direction_t::leg0_to_leg1
                  ? signed_amount_t{previous + delta}
                  : signed_amount_t{previous - delta};
  } catch (const std::overflow_error& ex) {
    return make_failure<signed_amount_t>(
        error_code::amount_overflow,
        fmt::format("flow on corridor {} overflows: {}", to_hex(corridor_id),
                    ex.what()));
  }
  if (updated == previous) {
    return make_success(updated);
  }

  auto changes = repository_.begin();
  changes.put_flow(make_flow_state(corridor_id, updated));
  changes.emit(make_event(kFlowUpdatedEvent,
                          {{"corridor_id", event_value(corridor_id), true},
                           {"direction", event_value(direction)},
                           {"amount_paid", event_value(amount_paid)},
                           {"flow", event_value(updated)}}));
  auto events = repository_.commit(changes, now_());

  spdlog::debug("Flow on corridor {} moved {} -> {}", to_hex(corridor_id),
                to_string(previous), to_string(updated));
  return make_success(updated, std::move(events));
}

operation_result<signed_amount_t> flow_accumulator::reset(
    const corridor_id_t& corridor_id) {
  const auto previous = to_signed(repository_.load_flow(corridor_id));

  auto changes = repository_.begin();
  changes.put_flow(make_flow_state(corridor_id, signed_amount_t{0}));
  changes.emit(make_event(kFlowResetEvent,
                          {{"corridor_id", event_value(corridor_id), true},
                           {"previous_flow", event_value(previous)}}));
  auto events = repository_.commit(changes, now_());

  spdlog::info("Flow on corridor {} reset from {}", to_hex(corridor_id),
               to_string(previous));
  return make_success(previous, std::move(events));
}

signed_amount_t flow_accumulator::current(
    const corridor_id_t& corridor_id) const {
  return to_signed(repository_.load_flow(corridor_id));
}

}  // namespace corridor::execution
