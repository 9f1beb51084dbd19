#pragma once

#include <corridor/v1/settlement.grpc.pb.h>
#include <corridor/execution/engine.hpp>
#include <corridor/schema/cow_stats.hpp>
#include <corridor/schema/direction.hpp>
#include <corridor/schema/event_record.hpp>
#include <corridor/schema/fee_override.hpp>
#include <corridor/schema/intent_state.hpp>
#include <corridor/schema/operation_result.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace corridor::rpc {

/// Parse a 32-byte identity field. On failure `status` is filled with
/// invalid_identity naming the field.
std::optional<corridor::schema::hash32_t> parse_identity(
    const std::string& value,
    std::string_view field,
    corridor::v1::Status* status);

/// Parse an unsigned base-10 amount field. On failure `status` is filled with
/// invalid_amount naming the field.
std::optional<corridor::schema::amount_t> parse_amount(
    const std::string& value,
    std::string_view field,
    corridor::v1::Status* status);

std::optional<corridor::schema::direction_t> parse_direction(
    int value,
    corridor::v1::Status* status);

corridor::v1::Direction to_proto(corridor::schema::direction_t direction);

void populate_event(const corridor::schema::event_record_t& source,
                    corridor::v1::Event* destination);
void populate_fee_override(const corridor::schema::fee_override_t& source,
                           corridor::v1::FeeOverride* destination);
void populate_intent(const corridor::schema::intent_state_t& source,
                     corridor::v1::Intent* destination);
void populate_cow_stats(const corridor::schema::cow_stats_t& source,
                        corridor::v1::CowStats* destination);

template <typename T>
void populate_status(const corridor::schema::operation_result<T>& source,
                     corridor::v1::Status* destination) {
  destination->set_code(source.code);
  destination->set_log(source.log);
  destination->set_codespace(source.codespace);
  for (const auto& record : source.events) {
    populate_event(record, destination->add_events());
  }
}

/// gRPC callback listener exposing the settlement engine.
///
/// Handlers only translate: every request field is parsed up front, a parse
/// failure is answered in the response status without touching the engine,
/// and engine results are copied back verbatim. Transport status is always OK;
/// domain outcomes travel in `Status.code`.
struct listener final : public corridor::v1::Settlement::CallbackService {
  explicit listener(corridor::execution::engine& engine);

  /// Pre-trade hook: fee quote or deferred intent creation.
  virtual grpc::ServerUnaryReactor* BeforeTrade(
      grpc::CallbackServerContext* context,
      const corridor::v1::BeforeTradeRequest* request,
      corridor::v1::BeforeTradeResponse* response) override final;

  /// Post-trade hook: flow update.
  virtual grpc::ServerUnaryReactor* AfterTrade(
      grpc::CallbackServerContext* context,
      const corridor::v1::AfterTradeRequest* request,
      corridor::v1::FlowResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterCorridor(
      grpc::CallbackServerContext* context,
      const corridor::v1::RegisterCorridorRequest* request,
      corridor::v1::StatusResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SetFeeParams(
      grpc::CallbackServerContext* context,
      const corridor::v1::SetFeeParamsRequest* request,
      corridor::v1::StatusResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ResetFlow(
      grpc::CallbackServerContext* context,
      const corridor::v1::ResetFlowRequest* request,
      corridor::v1::FlowResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SettleOne(
      grpc::CallbackServerContext* context,
      const corridor::v1::SettleOneRequest* request,
      corridor::v1::StatusResponse* response) override final;

  /// Best-effort batch settlement; exclusions are not errors.
  virtual grpc::ServerUnaryReactor* SettleBatch(
      grpc::CallbackServerContext* context,
      const corridor::v1::SettleBatchRequest* request,
      corridor::v1::SettleBatchResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetIntent(
      grpc::CallbackServerContext* context,
      const corridor::v1::GetIntentRequest* request,
      corridor::v1::GetIntentResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IntentsOf(
      grpc::CallbackServerContext* context,
      const corridor::v1::IntentsOfRequest* request,
      corridor::v1::IntentsOfResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetFeeParams(
      grpc::CallbackServerContext* context,
      const corridor::v1::CorridorRequest* request,
      corridor::v1::FeeParamsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* EffectiveFee(
      grpc::CallbackServerContext* context,
      const corridor::v1::CorridorRequest* request,
      corridor::v1::EffectiveFeeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CurrentFlow(
      grpc::CallbackServerContext* context,
      const corridor::v1::CorridorRequest* request,
      corridor::v1::FlowResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetCorridor(
      grpc::CallbackServerContext* context,
      const corridor::v1::CorridorRequest* request,
      corridor::v1::CorridorResponse* response) override final;

  /// Inclusive event-id range from the persisted event log.
  virtual grpc::ServerUnaryReactor* Events(
      grpc::CallbackServerContext* context,
      const corridor::v1::EventsRequest* request,
      corridor::v1::EventsResponse* response) override final;

  corridor::execution::engine& engine_;
};

}  // namespace corridor::rpc
