#pragma once

#include <corridor/schema/direction.hpp>
#include <corridor/schema/primitives.hpp>
#include <corridor/schema/transaction_event.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace corridor::execution {

inline constexpr std::string_view kIntentCreatedEvent{"intent_created"};
inline constexpr std::string_view kIntentSettledEvent{"intent_settled"};
inline constexpr std::string_view kCowSettlementEvent{"cow_settlement"};
inline constexpr std::string_view kFeeParamsUpdatedEvent{"fee_params_updated"};
inline constexpr std::string_view kFlowUpdatedEvent{"flow_updated"};
inline constexpr std::string_view kFlowResetEvent{"flow_reset"};
inline constexpr std::string_view kCorridorRegisteredEvent{
    "corridor_registered"};

struct event_attribute final {
  std::string_view key;
  std::string value;
  bool index{};
};

inline corridor::schema::transaction_event_t make_event(
    const std::string_view type,
    std::initializer_list<event_attribute> attributes) {
  auto event = corridor::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& attribute : attributes) {
    event.attributes.push_back(corridor::schema::transaction_event_attribute_t{
        .key = std::string{attribute.key},
        .value = attribute.value,
        .index = attribute.index});
  }
  return event;
}

inline std::string event_value(const corridor::schema::hash32_t& value) {
  return corridor::schema::to_hex(value);
}

inline std::string event_value(const corridor::schema::amount_t& value) {
  return corridor::schema::to_string(value);
}

inline std::string event_value(const corridor::schema::signed_amount_t& value) {
  return corridor::schema::to_string(value);
}

inline std::string event_value(const corridor::schema::direction_t value) {
  return std::string{corridor::schema::to_string(value)};
}

inline std::string event_value(const uint64_t value) {
  return std::to_string(value);
}

}  // namespace corridor::execution
