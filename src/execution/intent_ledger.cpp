#include <corridor/execution/events.hpp>
#include <corridor/execution/intent_ledger.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

intent_ledger::intent_ledger(state_repository& repository, time_source_t now)
    : repository_{repository}, now_{std::move(now)} {}

operation_result<intent_id_t> intent_ledger::create(
    const intent_request& request) {
  const auto now = now_();
  if (is_zero(request.owner)) {
    return make_failure<intent_id_t>(error_code::invalid_owner,
                                     "intent owner must not be empty");
  }
  if (request.deadline <= now) {
    return make_failure<intent_id_t>(
        error_code::invalid_deadline,
        fmt::format("deadline {} is not after now {}", request.deadline, now));
  }
  if (request.magnitude == 0 || request.min_out == 0) {
    return make_failure<intent_id_t>(error_code::zero_amount,
                                     "magnitude and min_out must be positive");
  }
  if (request.magnitude > kMaxIntentMagnitude) {
    return make_failure<intent_id_t>(
        error_code::amount_too_large,
        fmt::format("magnitude {} exceeds 2^128-1", to_string(request.magnitude)));
  }

  const auto intent_id = repository_.last_intent_id() + 1;
  auto intent = intent_state_t{.intent_id = intent_id,
                               .owner = request.owner,
                               .corridor_id = request.corridor_id,
                               .direction = request.direction,
                               .magnitude = request.magnitude,
                               .price_limit = request.price_limit,
                               .min_out = request.min_out,
                               .deadline = request.deadline,
                               .created_at = now,
                               .settled = false};

  auto changes = repository_.begin();
  changes.put_intent(intent);
  changes.put_intent_sequence(intent_id);
  changes.put_owner_index(intent.owner, intent_id);
  changes.emit(make_event(
      kIntentCreatedEvent,
      {{"intent_id", event_value(intent_id), true},
       {"owner", event_value(intent.owner), true},
       {"corridor_id", event_value(intent.corridor_id), true},
       {"direction", event_value(intent.direction)},
       {"magnitude", event_value(intent.magnitude)},
       {"min_out", event_value(intent.min_out)},
       {"deadline", event_value(intent.deadline)}}));
  auto events = repository_.commit(changes, now);

  spdlog::info("Created intent {} on corridor {} ({} {})", intent_id,
               to_hex(intent.corridor_id), to_string(intent.direction),
               to_string(intent.magnitude));
  return make_success(intent_id, std::move(events));
}

intent_state_t intent_ledger::get(const intent_id_t intent_id) const {
  return find(intent_id).value_or(intent_state_t{});
}

std::optional<intent_state_t> intent_ledger::find(
    const intent_id_t intent_id) const {
  return repository_.load_intent(intent_id);
}

std::vector<intent_id_t> intent_ledger::intents_of(
    const account_id_t& owner,
    const std::size_t max_results) const {
  return repository_.load_owner_intents(owner, max_results);
}

intent_id_t intent_ledger::intent_count() const {
  return repository_.last_intent_id();
}

bool exists(const intent_state_t& intent) {
  return !is_zero(intent.owner);
}

}  // namespace corridor::execution
