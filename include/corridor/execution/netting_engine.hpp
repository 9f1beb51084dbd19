#pragma once

#include <corridor/execution/intent_ledger.hpp>
#include <corridor/execution/state_repository.hpp>
#include <corridor/execution/time_source.hpp>
#include <corridor/schema/cow_stats.hpp>
#include <corridor/schema/operation_result.hpp>

#include <vector>

namespace corridor::execution {

/// Default informational cost attributed to each intent kept off the venue.
inline constexpr auto kDefaultPerIntentProcessingCost = uint64_t{100'000};

/// Coincidence-of-Wants settlement.
///
/// The two entry points apply different failure policies:
/// `settle_one` aborts on any intent-state problem, while `settle_batch`
/// silently drops individually invalid entries and only aborts on structural
/// problems (shape, mixed corridors, unregistered corridor, nothing to
/// settle). Either way a failed call commits nothing.
class netting_engine final {
 public:
  netting_engine(state_repository& repository,
                 const intent_ledger& ledger,
                 time_source_t now,
                 uint64_t per_intent_processing_cost =
                     kDefaultPerIntentProcessingCost);

  corridor::schema::status_result_t settle_one(
      corridor::schema::intent_id_t intent_id,
      const corridor::schema::amount_t& proposed_output);

  corridor::schema::operation_result<corridor::schema::cow_stats_t>
  settle_batch(const std::vector<corridor::schema::intent_id_t>& intent_ids,
               const std::vector<corridor::schema::amount_t>& proposed_outputs);

 private:
  state_repository& repository_;
  const intent_ledger& ledger_;
  time_source_t now_;
  uint64_t per_intent_processing_cost_{kDefaultPerIntentProcessingCost};
};

/// Net two leg totals against each other. Ties resolve to leg0_to_leg1.
corridor::schema::cow_stats_t net_totals(
    const corridor::schema::amount_t& total_leg0,
    const corridor::schema::amount_t& total_leg1);

}  // namespace corridor::execution
