#pragma once

#include <corridor/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Signal emitted by a state transition (intent_created, intent_settled,
// cow_settlement, fee_params_updated, flow_updated, flow_reset,
// corridor_registered).
namespace corridor::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace corridor::schema
