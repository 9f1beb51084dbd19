#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace corridor::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using corridor_id_t = hash32_t;
using intent_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
// Sign-magnitude, so the range is +/-(2^256 - 1). Overflow throws.
using signed_amount_t = boost::multiprecision::checked_int256_t;
using fee_units_t = uint32_t;
using timestamp_milliseconds_t = uint64_t;

/// Largest magnitude an intent may carry (2^128 - 1).
inline const auto kMaxIntentMagnitude =
    amount_t{std::numeric_limits<boost::multiprecision::uint128_t>::max()};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& value);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& value);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::optional<amount_t> try_parse_amount(std::string_view decimal);
std::string to_string(const amount_t& value);
std::string to_string(const signed_amount_t& value);

}  // namespace corridor::schema
