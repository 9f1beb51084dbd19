#pragma once

#include <corridor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace corridor::schema {

enum class error_code : uint32_t {
  ok = 0,
  // Malformed request shape.
  length_mismatch = 1,
  empty_batch = 2,
  no_valid_intents = 3,
  invalid_deadline = 4,
  zero_amount = 5,
  amount_too_large = 6,
  invalid_owner = 7,
  invalid_hook_data = 8,
  amount_overflow = 9,
  invalid_identity = 10,
  invalid_amount = 11,
  invalid_direction = 12,
  // Administrative identity.
  unauthorized = 20,
  // Corridor configuration.
  invalid_fee_params = 30,
  not_nettable = 31,
  mixed_corridors = 32,
  // Intent lifecycle.
  not_found = 40,
  already_settled = 41,
  expired = 42,
  min_output_not_met = 43,
};

enum class error_class : uint8_t {
  none = 0,
  validation = 1,
  authorization = 2,
  configuration = 3,
  intent_state = 4,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"length_mismatch",
                                            error_code::length_mismatch},
    std::pair<std::string_view, error_code>{"empty_batch",
                                            error_code::empty_batch},
    std::pair<std::string_view, error_code>{"no_valid_intents",
                                            error_code::no_valid_intents},
    std::pair<std::string_view, error_code>{"invalid_deadline",
                                            error_code::invalid_deadline},
    std::pair<std::string_view, error_code>{"zero_amount",
                                            error_code::zero_amount},
    std::pair<std::string_view, error_code>{"amount_too_large",
                                            error_code::amount_too_large},
    std::pair<std::string_view, error_code>{"invalid_owner",
                                            error_code::invalid_owner},
    std::pair<std::string_view, error_code>{"invalid_hook_data",
                                            error_code::invalid_hook_data},
    std::pair<std::string_view, error_code>{"amount_overflow",
                                            error_code::amount_overflow},
    std::pair<std::string_view, error_code>{"invalid_identity",
                                            error_code::invalid_identity},
    std::pair<std::string_view, error_code>{"invalid_amount",
                                            error_code::invalid_amount},
    std::pair<std::string_view, error_code>{"invalid_direction",
                                            error_code::invalid_direction},
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{"invalid_fee_params",
                                            error_code::invalid_fee_params},
    std::pair<std::string_view, error_code>{"not_nettable",
                                            error_code::not_nettable},
    std::pair<std::string_view, error_code>{"mixed_corridors",
                                            error_code::mixed_corridors},
    std::pair<std::string_view, error_code>{"not_found",
                                            error_code::not_found},
    std::pair<std::string_view, error_code>{"already_settled",
                                            error_code::already_settled},
    std::pair<std::string_view, error_code>{"expired", error_code::expired},
    std::pair<std::string_view, error_code>{"min_output_not_met",
                                            error_code::min_output_not_met}};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr error_class classify(const error_code value) {
  const auto raw = static_cast<uint32_t>(value);
  if (raw == 0) {
    return error_class::none;
  }
  if (raw < 20) {
    return error_class::validation;
  }
  if (raw < 30) {
    return error_class::authorization;
  }
  if (raw < 40) {
    return error_class::configuration;
  }
  return error_class::intent_state;
}

inline constexpr std::string_view codespace(const error_code value) {
  switch (classify(value)) {
    case error_class::validation:
      return "corridor.validation";
    case error_class::authorization:
      return "corridor.authorization";
    case error_class::configuration:
      return "corridor.configuration";
    case error_class::intent_state:
      return "corridor.intent_state";
    case error_class::none:
    default:
      return "";
  }
}

}  // namespace corridor::schema
