#include <corridor/execution/engine.hpp>
#include <corridor/execution/events.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               engine_config config,
               time_source_t now)
    : encoder_{encoder},
      config_{std::move(config)},
      now_{std::move(now)},
      repository_{encoder, storage},
      ledger_{repository_, now_},
      fee_policy_{repository_, now_},
      flow_accumulator_{repository_, now_},
      netting_engine_{repository_, ledger_, now_,
                      config_.per_intent_processing_cost} {
  auto lock = std::scoped_lock{mutex_};
  if (is_zero(config_.administrator)) {
    spdlog::warn("No administrator configured; administrative calls will fail");
  }
  spdlog::info("Settlement engine ready: {} intent(s), {} event(s)",
               repository_.last_intent_id(), repository_.last_event_id());
}

operation_result<before_trade_result> engine::on_before_trade(
    const trade_request_t& request) {
  auto lock = std::scoped_lock{mutex_};

  auto deferred = std::optional<deferred_settlement_t>{};
  if (!request.hook_data.empty()) {
    deferred = encoder_.try_decode<deferred_settlement_t>(
        bytes_view_t{request.hook_data.data(), request.hook_data.size()});
    if (!deferred) {
      spdlog::warn("Rejecting trade on corridor {}: undecodable hook data",
                   to_hex(request.corridor_id));
      return make_failure<before_trade_result>(
          error_code::invalid_hook_data,
          fmt::format("{} bytes of hook data do not decode",
                      request.hook_data.size()));
    }
  }

  if (!deferred || !deferred->defer) {
    auto quote = fee_policy_.effective_fee(request.corridor_id);
    if (!quote.ok()) {
      return forward_failure<before_trade_result>(quote);
    }
    return make_success(before_trade_result{.fee = quote.value});
  }

  auto created = ledger_.create(intent_request{
      .owner = request.owner,
      .corridor_id = request.corridor_id,
      .direction = request.direction,
      .magnitude = request.amount,
      .price_limit = request.price_limit,
      .min_out = deferred->min_out,
      .deadline = deferred->deadline});
  if (!created.ok()) {
    spdlog::warn("Rejecting deferred trade from {}: {}", to_hex(request.owner),
                 created.log);
    return forward_failure<before_trade_result>(created);
  }
  return publish(make_success(
      before_trade_result{.fee = fee_override_t{.fee = 0, .active = true},
                          .proceed = false,
                          .intent_id = created.value},
      std::move(created.events)));
}

operation_result<signed_amount_t> engine::on_after_trade(
    const executed_trade_t& trade) {
  auto lock = std::scoped_lock{mutex_};
  return publish(flow_accumulator_.on_trade_executed(
      trade.corridor_id, trade.direction, trade.amount_paid));
}

status_result_t engine::register_corridor(const account_id_t& caller,
                                          const corridor_id_t& corridor_id,
                                          const bool nettable) {
  auto lock = std::scoped_lock{mutex_};
  if (!authorized(caller, "register_corridor")) {
    return make_failure<std::monostate>(
        error_code::unauthorized,
        fmt::format("{} is not the administrator", to_hex(caller)));
  }

  auto changes = repository_.begin();
  changes.put_corridor(
      corridor_state_t{.corridor_id = corridor_id, .nettable = nettable});
  changes.emit(make_event(kCorridorRegisteredEvent,
                          {{"corridor_id", event_value(corridor_id), true},
                           {"nettable", nettable ? "true" : "false"}}));
  auto events = repository_.commit(changes, now_());

  spdlog::info("Corridor {} registered (nettable={})", to_hex(corridor_id),
               nettable);
  return publish(make_success(std::monostate{}, std::move(events)));
}

status_result_t engine::set_fee_params(const account_id_t& caller,
                                       const fee_params_t& params) {
  auto lock = std::scoped_lock{mutex_};
  if (!authorized(caller, "set_fee_params")) {
    return make_failure<std::monostate>(
        error_code::unauthorized,
        fmt::format("{} is not the administrator", to_hex(caller)));
  }
  return publish(fee_policy_.set_params(params));
}

operation_result<signed_amount_t> engine::reset_flow(
    const account_id_t& caller,
    const corridor_id_t& corridor_id) {
  auto lock = std::scoped_lock{mutex_};
  if (!authorized(caller, "reset_flow")) {
    return make_failure<signed_amount_t>(
        error_code::unauthorized,
        fmt::format("{} is not the administrator", to_hex(caller)));
  }
  return publish(flow_accumulator_.reset(corridor_id));
}

status_result_t engine::settle_one(const intent_id_t intent_id,
                                   const amount_t& proposed_output) {
  auto lock = std::scoped_lock{mutex_};
  return publish(netting_engine_.settle_one(intent_id, proposed_output));
}

operation_result<cow_stats_t> engine::settle_batch(
    const std::vector<intent_id_t>& intent_ids,
    const std::vector<amount_t>& proposed_outputs) {
  auto lock = std::scoped_lock{mutex_};
  return publish(netting_engine_.settle_batch(intent_ids, proposed_outputs));
}

intent_state_t engine::get_intent(const intent_id_t intent_id) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.get(intent_id);
}

std::vector<intent_id_t> engine::intents_of(
    const account_id_t& owner,
    const std::size_t max_results) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.intents_of(owner, max_results);
}

intent_id_t engine::intent_count() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.intent_count();
}

std::optional<fee_params_t> engine::fee_params(
    const corridor_id_t& corridor_id) const {
  auto lock = std::scoped_lock{mutex_};
  return fee_policy_.params(corridor_id);
}

operation_result<fee_override_t> engine::effective_fee(
    const corridor_id_t& corridor_id) const {
  auto lock = std::scoped_lock{mutex_};
  return fee_policy_.effective_fee(corridor_id);
}

signed_amount_t engine::current_flow(const corridor_id_t& corridor_id) const {
  auto lock = std::scoped_lock{mutex_};
  return flow_accumulator_.current(corridor_id);
}

std::optional<corridor_state_t> engine::find_corridor(
    const corridor_id_t& corridor_id) const {
  auto lock = std::scoped_lock{mutex_};
  return repository_.load_corridor(corridor_id);
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return repository_.load_events(from_id, to_id);
}

uint64_t engine::last_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return repository_.last_event_id();
}

void engine::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

bool engine::authorized(const account_id_t& caller,
                        const std::string_view operation) const {
  if (!is_zero(config_.administrator) && caller == config_.administrator) {
    return true;
  }
  spdlog::warn("Rejected {} from non-administrator {}", operation,
               to_hex(caller));
  return false;
}

}  // namespace corridor::execution
