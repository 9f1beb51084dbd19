#pragma once

#include <corridor/execution/state_repository.hpp>
#include <corridor/execution/time_source.hpp>
#include <corridor/schema/intent_state.hpp>
#include <corridor/schema/operation_result.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace corridor::execution {

/// Parameters of a new intent, as decoded by the pre-trade hook.
struct intent_request final {
  corridor::schema::account_id_t owner{};
  corridor::schema::corridor_id_t corridor_id{};
  corridor::schema::direction_t direction{
      corridor::schema::direction_t::leg0_to_leg1};
  corridor::schema::amount_t magnitude;
  std::optional<corridor::schema::amount_t> price_limit;
  corridor::schema::amount_t min_out;
  corridor::schema::timestamp_milliseconds_t deadline{};
};

/// Keyed intent storage with a monotonic id generator and an owner index.
class intent_ledger final {
 public:
  intent_ledger(state_repository& repository, time_source_t now);

  /// Validate and record a new intent; ids start at 1 and never repeat.
  corridor::schema::operation_result<corridor::schema::intent_id_t> create(
      const intent_request& request);

  /// Return the intent, or a record whose owner is the zero identity when the
  /// id does not exist.
  corridor::schema::intent_state_t get(
      corridor::schema::intent_id_t intent_id) const;

  std::optional<corridor::schema::intent_state_t> find(
      corridor::schema::intent_id_t intent_id) const;

  /// Ids created by owner, oldest first, at most max_results of them.
  std::vector<corridor::schema::intent_id_t> intents_of(
      const corridor::schema::account_id_t& owner,
      std::size_t max_results) const;

  corridor::schema::intent_id_t intent_count() const;

 private:
  state_repository& repository_;
  time_source_t now_;
};

bool exists(const corridor::schema::intent_state_t& intent);

}  // namespace corridor::execution
