#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <corridor/rpc/server.hpp>
#include <cstddef>
#include <vector>

using namespace corridor::rpc;
using namespace corridor::schema;

namespace {

constexpr auto kDefaultIntentsPage = uint32_t{100};
constexpr auto kMaxIntentsPage = uint32_t{1'000};
constexpr auto kMaxEventsPerQuery = uint64_t{1'000};

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void reject(corridor::v1::Status* status,
            const error_code code,
            const std::string& log) {
  spdlog::warn("Rejecting request: {}", log);
  status->set_code(static_cast<uint32_t>(code));
  status->set_log(log);
  status->set_codespace(std::string{codespace(code)});
}

}  // namespace

namespace corridor::rpc {

std::optional<hash32_t> parse_identity(const std::string& value,
                                       const std::string_view field,
                                       corridor::v1::Status* status) {
  auto identity = try_make_hash32(value);
  if (!identity) {
    reject(status, error_code::invalid_identity,
           fmt::format("{} is not a 32-byte identity", field));
  }
  return identity;
}

std::optional<amount_t> parse_amount(const std::string& value,
                                     const std::string_view field,
                                     corridor::v1::Status* status) {
  auto amount = try_parse_amount(value);
  if (!amount) {
    reject(status, error_code::invalid_amount,
           fmt::format("{} '{}' is not an unsigned decimal amount", field,
                       value));
  }
  return amount;
}

std::optional<direction_t> parse_direction(const int value,
                                           corridor::v1::Status* status) {
  switch (value) {
    case corridor::v1::DIRECTION_LEG0_TO_LEG1:
      return direction_t::leg0_to_leg1;
    case corridor::v1::DIRECTION_LEG1_TO_LEG0:
      return direction_t::leg1_to_leg0;
    default:
      reject(status, error_code::invalid_direction,
             fmt::format("direction {} is not a corridor leg", value));
      return std::nullopt;
  }
}

corridor::v1::Direction to_proto(const direction_t direction) {
  switch (direction) {
    case direction_t::leg1_to_leg0:
      return corridor::v1::DIRECTION_LEG1_TO_LEG0;
    case direction_t::leg0_to_leg1:
    default:
      return corridor::v1::DIRECTION_LEG0_TO_LEG1;
  }
}

void populate_event(const event_record_t& source,
                    corridor::v1::Event* destination) {
  destination->set_event_id(source.event_id);
  destination->set_recorded_at(source.recorded_at);
  destination->set_type(source.event.type);
  for (const auto& attribute : source.event.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.index);
  }
}

void populate_fee_override(const fee_override_t& source,
                           corridor::v1::FeeOverride* destination) {
  destination->set_fee(source.fee);
  destination->set_active(source.active);
  destination->set_encoded(source.encoded());
}

void populate_intent(const intent_state_t& source,
                     corridor::v1::Intent* destination) {
  destination->set_intent_id(source.intent_id);
  destination->set_owner(make_string(
      bytes_view_t{source.owner.data(), source.owner.size()}));
  destination->set_corridor_id(make_string(
      bytes_view_t{source.corridor_id.data(), source.corridor_id.size()}));
  destination->set_direction(to_proto(source.direction));
  destination->set_magnitude(to_string(source.magnitude));
  if (source.price_limit) {
    destination->set_price_limit(to_string(*source.price_limit));
  }
  destination->set_min_out(to_string(source.min_out));
  destination->set_deadline(source.deadline);
  destination->set_created_at(source.created_at);
  destination->set_settled(source.settled);
  destination->set_settled_output(to_string(source.settled_output));
}

void populate_cow_stats(const cow_stats_t& source,
                        corridor::v1::CowStats* destination) {
  destination->set_corridor_id(make_string(
      bytes_view_t{source.corridor_id.data(), source.corridor_id.size()}));
  destination->set_valid_count(source.valid_count);
  destination->set_total_leg0(to_string(source.total_leg0));
  destination->set_total_leg1(to_string(source.total_leg1));
  destination->set_matched_amount(to_string(source.matched_amount));
  destination->set_residual_to_venue(to_string(source.residual_to_venue));
  destination->set_residual_direction(to_proto(source.residual_direction));
  destination->set_cost_saved_estimate(to_string(source.cost_saved_estimate));
}

listener::listener(corridor::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::BeforeTrade(
    grpc::CallbackServerContext* context,
    const corridor::v1::BeforeTradeRequest* request,
    corridor::v1::BeforeTradeResponse* response) {
  auto* status = response->mutable_status();
  auto owner = parse_identity(request->owner(), "owner", status);
  if (!owner) {
    return finish_ok(context);
  }
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto direction = parse_direction(request->direction(), status);
  if (!direction) {
    return finish_ok(context);
  }
  auto amount = parse_amount(request->amount(), "amount", status);
  if (!amount) {
    return finish_ok(context);
  }
  auto price_limit = std::optional<amount_t>{};
  if (request->has_price_limit()) {
    price_limit = parse_amount(request->price_limit(), "price_limit", status);
    if (!price_limit) {
      return finish_ok(context);
    }
  }

  auto trade = trade_request_t{};
  trade.owner = *owner;
  trade.corridor_id = *corridor_id;
  trade.direction = *direction;
  trade.amount = *amount;
  trade.price_limit = price_limit;
  trade.hook_data = make_bytes(request->hook_data());

  auto result = engine_.on_before_trade(trade);
  populate_status(result, status);
  if (result.ok()) {
    populate_fee_override(result.value.fee, response->mutable_fee());
    response->set_proceed(result.value.proceed);
    response->set_intent_id(result.value.intent_id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AfterTrade(
    grpc::CallbackServerContext* context,
    const corridor::v1::AfterTradeRequest* request,
    corridor::v1::FlowResponse* response) {
  auto* status = response->mutable_status();
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto direction = parse_direction(request->direction(), status);
  if (!direction) {
    return finish_ok(context);
  }
  auto amount_paid = parse_amount(request->amount_paid(), "amount_paid", status);
  if (!amount_paid) {
    return finish_ok(context);
  }

  auto trade = executed_trade_t{};
  trade.corridor_id = *corridor_id;
  trade.direction = *direction;
  trade.amount_paid = *amount_paid;

  auto result = engine_.on_after_trade(trade);
  populate_status(result, status);
  if (result.ok()) {
    response->set_flow(to_string(result.value));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterCorridor(
    grpc::CallbackServerContext* context,
    const corridor::v1::RegisterCorridorRequest* request,
    corridor::v1::StatusResponse* response) {
  auto* status = response->mutable_status();
  auto caller = parse_identity(request->caller(), "caller", status);
  if (!caller) {
    return finish_ok(context);
  }
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  populate_status(
      engine_.register_corridor(*caller, *corridor_id, request->nettable()),
      status);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SetFeeParams(
    grpc::CallbackServerContext* context,
    const corridor::v1::SetFeeParamsRequest* request,
    corridor::v1::StatusResponse* response) {
  auto* status = response->mutable_status();
  auto caller = parse_identity(request->caller(), "caller", status);
  if (!caller) {
    return finish_ok(context);
  }
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  // An empty threshold disables the dynamic component.
  auto threshold = amount_t{0};
  if (!request->net_flow_threshold().empty()) {
    auto parsed = parse_amount(request->net_flow_threshold(),
                               "net_flow_threshold", status);
    if (!parsed) {
      return finish_ok(context);
    }
    threshold = *parsed;
  }

  auto params = fee_params_t{};
  params.corridor_id = *corridor_id;
  params.base_fee = request->base_fee();
  params.max_extra_fee = request->max_extra_fee();
  params.net_flow_threshold = threshold;
  populate_status(engine_.set_fee_params(*caller, params), status);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ResetFlow(
    grpc::CallbackServerContext* context,
    const corridor::v1::ResetFlowRequest* request,
    corridor::v1::FlowResponse* response) {
  auto* status = response->mutable_status();
  auto caller = parse_identity(request->caller(), "caller", status);
  if (!caller) {
    return finish_ok(context);
  }
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto result = engine_.reset_flow(*caller, *corridor_id);
  populate_status(result, status);
  if (result.ok()) {
    response->set_flow(to_string(result.value));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SettleOne(
    grpc::CallbackServerContext* context,
    const corridor::v1::SettleOneRequest* request,
    corridor::v1::StatusResponse* response) {
  auto* status = response->mutable_status();
  auto proposed_output =
      parse_amount(request->proposed_output(), "proposed_output", status);
  if (!proposed_output) {
    return finish_ok(context);
  }
  populate_status(engine_.settle_one(request->intent_id(), *proposed_output),
                  status);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SettleBatch(
    grpc::CallbackServerContext* context,
    const corridor::v1::SettleBatchRequest* request,
    corridor::v1::SettleBatchResponse* response) {
  auto* status = response->mutable_status();
  auto intent_ids = std::vector<intent_id_t>{std::begin(request->intent_ids()),
                                             std::end(request->intent_ids())};
  auto proposed_outputs = std::vector<amount_t>{};
  proposed_outputs.reserve(request->proposed_outputs_size());
  for (int i = 0; i < request->proposed_outputs_size(); ++i) {
    auto output = parse_amount(request->proposed_outputs(i),
                               fmt::format("proposed_outputs[{}]", i), status);
    if (!output) {
      return finish_ok(context);
    }
    proposed_outputs.push_back(*output);
  }

  auto result = engine_.settle_batch(intent_ids, proposed_outputs);
  populate_status(result, status);
  if (result.ok()) {
    populate_cow_stats(result.value, response->mutable_stats());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetIntent(
    grpc::CallbackServerContext* context,
    const corridor::v1::GetIntentRequest* request,
    corridor::v1::GetIntentResponse* response) {
  auto intent = engine_.get_intent(request->intent_id());
  auto found = corridor::execution::exists(intent);
  response->set_found(found);
  if (found) {
    populate_intent(intent, response->mutable_intent());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IntentsOf(
    grpc::CallbackServerContext* context,
    const corridor::v1::IntentsOfRequest* request,
    corridor::v1::IntentsOfResponse* response) {
  auto* status = response->mutable_status();
  auto owner = parse_identity(request->owner(), "owner", status);
  if (!owner) {
    return finish_ok(context);
  }
  auto max_results = request->max_results() == 0
                         ? kDefaultIntentsPage
                         : std::min(request->max_results(), kMaxIntentsPage);
  for (const auto intent_id : engine_.intents_of(*owner, max_results)) {
    response->add_intent_ids(intent_id);
  }
  response->set_intent_count(engine_.intent_count());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetFeeParams(
    grpc::CallbackServerContext* context,
    const corridor::v1::CorridorRequest* request,
    corridor::v1::FeeParamsResponse* response) {
  auto* status = response->mutable_status();
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto params = engine_.fee_params(*corridor_id);
  response->set_found(params.has_value());
  if (params) {
    response->set_base_fee(params->base_fee);
    response->set_max_extra_fee(params->max_extra_fee);
    response->set_net_flow_threshold(to_string(params->net_flow_threshold));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::EffectiveFee(
    grpc::CallbackServerContext* context,
    const corridor::v1::CorridorRequest* request,
    corridor::v1::EffectiveFeeResponse* response) {
  auto* status = response->mutable_status();
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto result = engine_.effective_fee(*corridor_id);
  populate_status(result, status);
  if (result.ok()) {
    populate_fee_override(result.value, response->mutable_fee());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CurrentFlow(
    grpc::CallbackServerContext* context,
    const corridor::v1::CorridorRequest* request,
    corridor::v1::FlowResponse* response) {
  auto* status = response->mutable_status();
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  response->set_flow(to_string(engine_.current_flow(*corridor_id)));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetCorridor(
    grpc::CallbackServerContext* context,
    const corridor::v1::CorridorRequest* request,
    corridor::v1::CorridorResponse* response) {
  auto* status = response->mutable_status();
  auto corridor_id =
      parse_identity(request->corridor_id(), "corridor_id", status);
  if (!corridor_id) {
    return finish_ok(context);
  }
  auto registered = engine_.find_corridor(*corridor_id);
  response->set_registered(registered.has_value());
  response->set_nettable(registered && registered->nettable);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Events(
    grpc::CallbackServerContext* context,
    const corridor::v1::EventsRequest* request,
    corridor::v1::EventsResponse* response) {
  auto from_id = std::max<uint64_t>(request->from_id(), 1);
  auto to_id = request->to_id();
  if (to_id >= from_id && to_id - from_id >= kMaxEventsPerQuery) {
    to_id = from_id + kMaxEventsPerQuery - 1;
  }
  if (to_id >= from_id) {
    for (const auto& record : engine_.events(from_id, to_id)) {
      populate_event(record, response->add_events());
    }
  }
  response->set_last_event_id(engine_.last_event_id());
  return finish_ok(context);
}

}  // namespace corridor::rpc
