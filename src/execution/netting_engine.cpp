#include <corridor/execution/events.hpp>
#include <corridor/execution/netting_engine.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

namespace {

// Common settleability rule for both entry points.
error_code check_settleable(const intent_state_t& intent,
                            const amount_t& proposed_output,
                            const timestamp_milliseconds_t now) {
  if (!exists(intent)) {
    return error_code::not_found;
  }
  if (intent.settled) {
    return error_code::already_settled;
  }
  if (now > intent.deadline) {
    return error_code::expired;
  }
  if (proposed_output < intent.min_out) {
    return error_code::min_output_not_met;
  }
  return error_code::ok;
}

std::string describe_failure(const error_code code,
                             const intent_id_t intent_id,
                             const intent_state_t& intent,
                             const amount_t& proposed_output) {
  switch (code) {
    case error_code::not_found:
      return fmt::format("intent {} not found", intent_id);
    case error_code::already_settled:
      return fmt::format("intent {} already settled", intent_id);
    case error_code::expired:
      return fmt::format("intent {} expired at {}", intent_id,
                         intent.deadline);
    case error_code::min_output_not_met:
      return fmt::format("intent {} min_out {} not met by {}", intent_id,
                         to_string(intent.min_out), to_string(proposed_output));
    default:
      return std::string{to_string(code)};
  }
}

transaction_event_t make_settled_event(const intent_state_t& intent,
                                       const amount_t& proposed_output) {
  return make_event(kIntentSettledEvent,
                    {{"intent_id", event_value(intent.intent_id), true},
                     {"owner", event_value(intent.owner), true},
                     {"magnitude", event_value(intent.magnitude)},
                     {"output", event_value(proposed_output)}});
}

struct batch_entry final {
  intent_state_t intent;
  amount_t proposed_output;
};

}  // namespace

cow_stats_t net_totals(const amount_t& total_leg0, const amount_t& total_leg1) {
  auto stats = cow_stats_t{};
  stats.total_leg0 = total_leg0;
  stats.total_leg1 = total_leg1;
  stats.matched_amount = std::min(total_leg0, total_leg1);
  stats.residual_to_venue = total_leg0 >= total_leg1 ? total_leg0 - total_leg1
                                                     : total_leg1 - total_leg0;
  stats.residual_direction = total_leg0 >= total_leg1
                                 ? direction_t::leg0_to_leg1
                                 : direction_t::leg1_to_leg0;
  return stats;
}

netting_engine::netting_engine(state_repository& repository,
                               const intent_ledger& ledger,
                               time_source_t now,
                               const uint64_t per_intent_processing_cost)
    : repository_{repository},
      ledger_{ledger},
      now_{std::move(now)},
      per_intent_processing_cost_{per_intent_processing_cost} {}

status_result_t netting_engine::settle_one(const intent_id_t intent_id,
                                           const amount_t& proposed_output) {
  const auto now = now_();
  auto intent = ledger_.get(intent_id);
  const auto check = check_settleable(intent, proposed_output, now);
  if (check != error_code::ok) {
    return make_failure<std::monostate>(
        check, describe_failure(check, intent_id, intent, proposed_output));
  }

  intent.settled = true;
  intent.settled_output = proposed_output;

  auto changes = repository_.begin();
  changes.put_intent(intent);
  changes.emit(make_settled_event(intent, proposed_output));
  auto events = repository_.commit(changes, now);

  spdlog::info("Settled intent {} for owner {} with output {}", intent_id,
               to_hex(intent.owner), to_string(proposed_output));
  return make_success(std::monostate{}, std::move(events));
}

operation_result<cow_stats_t> netting_engine::settle_batch(
    const std::vector<intent_id_t>& intent_ids,
    const std::vector<amount_t>& proposed_outputs) {
  if (intent_ids.size() != proposed_outputs.size()) {
    return make_failure<cow_stats_t>(
        error_code::length_mismatch,
        fmt::format("{} ids but {} outputs", intent_ids.size(),
                    proposed_outputs.size()));
  }
  if (intent_ids.empty()) {
    return make_failure<cow_stats_t>(error_code::empty_batch, "empty batch");
  }

  const auto now = now_();
  auto included = std::vector<batch_entry>{};
  included.reserve(intent_ids.size());
  auto included_ids = std::set<intent_id_t>{};
  auto batch_corridor = std::optional<corridor_id_t>{};
  auto total_leg0 = amount_t{0};
  auto total_leg1 = amount_t{0};

  for (std::size_t i = 0; i < intent_ids.size(); ++i) {
    const auto intent_id = intent_ids[i];
    const auto& proposed_output = proposed_outputs[i];

    // A repeat of an included id would already be settled by the time the
    // commit reaches it.
    if (included_ids.contains(intent_id)) {
      spdlog::debug("Excluding repeated intent {} from batch", intent_id);
      continue;
    }

    auto intent = ledger_.get(intent_id);
    const auto check = check_settleable(intent, proposed_output, now);
    if (check != error_code::ok) {
      spdlog::debug("Excluding intent {} from batch: {}", intent_id,
                    to_string(check));
      continue;
    }

    if (!batch_corridor.has_value()) {
      batch_corridor = intent.corridor_id;
      const auto registry = repository_.load_corridor(*batch_corridor);
      if (!registry.has_value() || !registry->nettable) {
        return make_failure<cow_stats_t>(
            error_code::not_nettable,
            fmt::format("corridor {} is not registered for netting",
                        to_hex(*batch_corridor)));
      }
    } else if (intent.corridor_id != *batch_corridor) {
      return make_failure<cow_stats_t>(
          error_code::mixed_corridors,
          fmt::format("intent {} belongs to corridor {}, batch is {}",
                      intent_id, to_hex(intent.corridor_id),
                      to_hex(*batch_corridor)));
    }

    if (intent.direction == direction_t::leg0_to_leg1) {
      total_leg0 += intent.magnitude;
    } else {
      total_leg1 += intent.magnitude;
    }
    included_ids.insert(intent_id);
    included.push_back(
        batch_entry{.intent = std::move(intent), .proposed_output = proposed_output});
  }

  if (included.empty()) {
    return make_failure<cow_stats_t>(
        error_code::no_valid_intents,
        fmt::format("none of {} intents could be settled", intent_ids.size()));
  }

  auto stats = net_totals(total_leg0, total_leg1);
  stats.corridor_id = *batch_corridor;
  stats.valid_count = included.size();
  stats.cost_saved_estimate =
      amount_t{stats.valid_count} * amount_t{per_intent_processing_cost_};

  auto changes = repository_.begin();
  for (auto& [intent, proposed_output] : included) {
    intent.settled = true;
    intent.settled_output = proposed_output;
    changes.put_intent(intent);
    changes.emit(make_settled_event(intent, proposed_output));
  }
  if (stats.valid_count > 1 && stats.matched_amount > 0) {
    changes.emit(make_event(
        kCowSettlementEvent,
        {{"corridor_id", event_value(stats.corridor_id), true},
         {"valid_count", event_value(stats.valid_count)},
         {"total_leg0", event_value(stats.total_leg0)},
         {"total_leg1", event_value(stats.total_leg1)},
         {"matched_amount", event_value(stats.matched_amount)},
         {"residual_to_venue", event_value(stats.residual_to_venue)},
         {"residual_direction", event_value(stats.residual_direction)},
         {"cost_saved_estimate", event_value(stats.cost_saved_estimate)}}));
  }
  auto events = repository_.commit(changes, now);

  spdlog::info(
      "Settled batch on corridor {}: {}/{} intents, matched={} residual={} {}",
      to_hex(stats.corridor_id), stats.valid_count, intent_ids.size(),
      to_string(stats.matched_amount), to_string(stats.residual_to_venue),
      to_string(stats.residual_direction));
  return make_success(std::move(stats), std::move(events));
}

}  // namespace corridor::execution
