#pragma once

#include <corridor/execution/event_sink.hpp>
#include <corridor/execution/fee_policy.hpp>
#include <corridor/execution/flow_accumulator.hpp>
#include <corridor/execution/intent_ledger.hpp>
#include <corridor/execution/netting_engine.hpp>
#include <corridor/execution/state_repository.hpp>
#include <corridor/execution/time_source.hpp>
#include <corridor/execution/trade_hooks.hpp>
#include <corridor/schema/corridor_state.hpp>
#include <corridor/schema/cow_stats.hpp>
#include <corridor/schema/event_record.hpp>
#include <corridor/schema/fee_params.hpp>
#include <corridor/schema/intent_state.hpp>
#include <corridor/schema/operation_result.hpp>
#include <corridor/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace corridor::execution {

struct engine_config final {
  /// Only identity allowed on the administrative surface.
  corridor::schema::account_id_t administrator{};
  uint64_t per_intent_processing_cost{kDefaultPerIntentProcessingCost};
};

/// Intent settlement engine.
///
/// Owns the state repository and the four components built on it, and
/// exposes them as the trade hooks, the administrative surface (checked
/// against the configured administrator), the operator surface and read-only
/// queries. Every public call runs to completion under one lock.
class engine final : public trade_hooks {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         engine_config config,
         time_source_t now = system_time_source());

  /// Immediate mode quotes the effective fee. Hook data carrying a deferred
  /// settlement with `defer` set records an intent instead and answers with
  /// a zero-fee override and `proceed = false`.
  corridor::schema::operation_result<before_trade_result> on_before_trade(
      const corridor::schema::trade_request_t& request) override;

  corridor::schema::operation_result<corridor::schema::signed_amount_t>
  on_after_trade(const corridor::schema::executed_trade_t& trade) override;

  corridor::schema::status_result_t register_corridor(
      const corridor::schema::account_id_t& caller,
      const corridor::schema::corridor_id_t& corridor_id,
      bool nettable);

  corridor::schema::status_result_t set_fee_params(
      const corridor::schema::account_id_t& caller,
      const corridor::schema::fee_params_t& params);

  /// Returns the flow that was discarded.
  corridor::schema::operation_result<corridor::schema::signed_amount_t>
  reset_flow(const corridor::schema::account_id_t& caller,
             const corridor::schema::corridor_id_t& corridor_id);

  corridor::schema::status_result_t settle_one(
      corridor::schema::intent_id_t intent_id,
      const corridor::schema::amount_t& proposed_output);

  corridor::schema::operation_result<corridor::schema::cow_stats_t>
  settle_batch(const std::vector<corridor::schema::intent_id_t>& intent_ids,
               const std::vector<corridor::schema::amount_t>& proposed_outputs);

  /// A record with a zero owner means the id does not exist.
  corridor::schema::intent_state_t get_intent(
      corridor::schema::intent_id_t intent_id) const;
  std::vector<corridor::schema::intent_id_t> intents_of(
      const corridor::schema::account_id_t& owner,
      std::size_t max_results) const;
  corridor::schema::intent_id_t intent_count() const;

  std::optional<corridor::schema::fee_params_t> fee_params(
      const corridor::schema::corridor_id_t& corridor_id) const;
  corridor::schema::operation_result<corridor::schema::fee_override_t>
  effective_fee(const corridor::schema::corridor_id_t& corridor_id) const;
  corridor::schema::signed_amount_t current_flow(
      const corridor::schema::corridor_id_t& corridor_id) const;
  std::optional<corridor::schema::corridor_state_t> find_corridor(
      const corridor::schema::corridor_id_t& corridor_id) const;

  /// Committed events with ids in the inclusive range.
  std::vector<corridor::schema::event_record_t> events(uint64_t from_id,
                                                       uint64_t to_id) const;
  uint64_t last_event_id() const;

  /// Install an observer for committed events. It runs while the engine lock
  /// is held and must not call back into the engine.
  void set_event_sink(event_sink_t sink);

 private:
  bool authorized(const corridor::schema::account_id_t& caller,
                  std::string_view operation) const;

  template <typename T>
  corridor::schema::operation_result<T> publish(
      corridor::schema::operation_result<T> result) const {
    if (event_sink_) {
      for (const auto& record : result.events) {
        event_sink_(record);
      }
    }
    return result;
  }

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  engine_config config_;
  time_source_t now_;
  state_repository repository_;
  intent_ledger ledger_;
  fee_policy fee_policy_;
  flow_accumulator flow_accumulator_;
  netting_engine netting_engine_;
  event_sink_t event_sink_;
};

}  // namespace corridor::execution
