#pragma once

#include <corridor/schema/executed_trade.hpp>
#include <corridor/schema/fee_override.hpp>
#include <corridor/schema/operation_result.hpp>
#include <corridor/schema/trade_request.hpp>

namespace corridor::execution {

/// Answer to the pre-trade hook.
struct before_trade_result final {
  corridor::schema::fee_override_t fee;
  /// False when the trade was recorded as an intent; the host must not
  /// execute it.
  bool proceed{true};
  /// Id of the recorded intent; 0 in immediate mode.
  corridor::schema::intent_id_t intent_id{};
};

/// Capability interface the trade-execution host calls synchronously around
/// every trade on a corridor.
class trade_hooks {
 public:
  virtual ~trade_hooks() = default;

  virtual corridor::schema::operation_result<before_trade_result>
  on_before_trade(const corridor::schema::trade_request_t& request) = 0;

  /// Returns the corridor flow after the update.
  virtual corridor::schema::operation_result<corridor::schema::signed_amount_t>
  on_after_trade(const corridor::schema::executed_trade_t& trade) = 0;
};

}  // namespace corridor::execution
