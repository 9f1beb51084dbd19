#pragma once

#include <corridor/schema/primitives.hpp>
#include <corridor/schema/transaction_event.hpp>

namespace corridor::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  timestamp_milliseconds_t recorded_at{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace corridor::schema
