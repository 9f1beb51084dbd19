#pragma once

#include <corridor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: direction.
// Corridor leg a trade or intent moves along. leg0_to_leg1 adds to the flow
// accumulator, leg1_to_leg0 subtracts from it.
namespace corridor::schema {

enum class direction_t : uint8_t {
  leg0_to_leg1 = 0,
  leg1_to_leg0 = 1,
};

inline constexpr auto kDirectionMappings =
    std::array{std::pair<std::string_view, direction_t>{
                   "leg0_to_leg1", direction_t::leg0_to_leg1},
               std::pair<std::string_view, direction_t>{
                   "leg1_to_leg0", direction_t::leg1_to_leg0}};

template <>
inline std::optional<direction_t> try_from_string<direction_t>(
    const std::string_view value) {
  return from_string(value, kDirectionMappings);
}

inline constexpr std::string_view to_string(const direction_t value) {
  return to_string(value, kDirectionMappings).value_or("unknown");
}

}  // namespace corridor::schema
