#include <gtest/gtest.h>
#include <corridor/schema/direction.hpp>
#include <corridor/schema/error_code.hpp>
#include <corridor/schema/fee_override.hpp>
#include <corridor/schema/flow_state.hpp>
#include <corridor/schema/primitives.hpp>

#include <limits>
#include <string>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = corridor::schema::bytes_t(32, 0xAB);
  auto hash = corridor::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = corridor::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(corridor::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_sizes_and_bad_digits) {
  EXPECT_FALSE(corridor::schema::try_make_hash32("abcd").has_value());
  EXPECT_FALSE(
      corridor::schema::try_make_hash32(std::string(63, 'a')).has_value());
  EXPECT_FALSE(
      corridor::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_TRUE(
      corridor::schema::try_make_hash32(std::string(64, 'F')).has_value());
}

TEST(primitives, zero_hash_is_the_null_identity) {
  auto zero = corridor::schema::make_zero_hash();
  EXPECT_TRUE(corridor::schema::is_zero(zero));
  zero[17] = 1;
  EXPECT_FALSE(corridor::schema::is_zero(zero));
}

TEST(primitives, try_parse_amount_accepts_decimal_up_to_uint256_max) {
  auto small = corridor::schema::try_parse_amount("12345");
  ASSERT_TRUE(small.has_value());
  EXPECT_EQ(*small, corridor::schema::amount_t{12345});

  auto max_text = corridor::schema::to_string(
      std::numeric_limits<corridor::schema::amount_t>::max());
  auto max = corridor::schema::try_parse_amount(max_text);
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, std::numeric_limits<corridor::schema::amount_t>::max());

  // uint256 max + 1
  auto too_large = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639936"};
  EXPECT_FALSE(corridor::schema::try_parse_amount(too_large).has_value());
}

TEST(primitives, try_parse_amount_rejects_non_decimal_input) {
  EXPECT_FALSE(corridor::schema::try_parse_amount("").has_value());
  EXPECT_FALSE(corridor::schema::try_parse_amount("-1").has_value());
  EXPECT_FALSE(corridor::schema::try_parse_amount("0x10").has_value());
  EXPECT_FALSE(corridor::schema::try_parse_amount("1.5").has_value());
  EXPECT_FALSE(corridor::schema::try_parse_amount(" 7").has_value());
}

TEST(primitives, intent_magnitude_cap_is_uint128_max) {
  auto expected = corridor::schema::amount_t{
      (corridor::schema::amount_t{1} << 128) - 1};
  EXPECT_EQ(corridor::schema::kMaxIntentMagnitude, expected);
}

TEST(primitives, direction_strings_round_trip) {
  using corridor::schema::direction_t;
  EXPECT_EQ(corridor::schema::to_string(direction_t::leg0_to_leg1),
            "leg0_to_leg1");
  EXPECT_EQ(corridor::schema::try_from_string<direction_t>("leg1_to_leg0"),
            direction_t::leg1_to_leg0);
  EXPECT_FALSE(
      corridor::schema::try_from_string<direction_t>("sideways").has_value());
}

TEST(primitives, error_codes_map_to_codespaces) {
  using corridor::schema::codespace;
  using corridor::schema::error_code;
  EXPECT_EQ(codespace(error_code::ok), "");
  EXPECT_EQ(codespace(error_code::length_mismatch), "corridor.validation");
  EXPECT_EQ(codespace(error_code::invalid_hook_data), "corridor.validation");
  EXPECT_EQ(codespace(error_code::unauthorized), "corridor.authorization");
  EXPECT_EQ(codespace(error_code::not_nettable), "corridor.configuration");
  EXPECT_EQ(codespace(error_code::mixed_corridors), "corridor.configuration");
  EXPECT_EQ(codespace(error_code::expired), "corridor.intent_state");
  EXPECT_EQ(corridor::schema::to_string(error_code::min_output_not_met),
            "min_output_not_met");
}

TEST(primitives, fee_override_encoding_sets_the_venue_flag) {
  auto inactive = corridor::schema::fee_override_t{};
  EXPECT_EQ(inactive.encoded(), 0u);

  auto active = corridor::schema::fee_override_t{.fee = 2500, .active = true};
  EXPECT_EQ(active.encoded(), 2500u | 0x400000u);

  auto zero = corridor::schema::fee_override_t{.fee = 0, .active = true};
  EXPECT_EQ(zero.encoded(), 0x400000u);
}

TEST(primitives, flow_state_keeps_sign_and_magnitude) {
  auto corridor_id = corridor::schema::make_zero_hash();
  auto negative = corridor::schema::make_flow_state(
      corridor_id, corridor::schema::signed_amount_t{-250});
  EXPECT_TRUE(negative.negative);
  EXPECT_EQ(negative.magnitude, corridor::schema::amount_t{250});
  EXPECT_EQ(corridor::schema::to_signed(negative),
            corridor::schema::signed_amount_t{-250});

  auto zero = corridor::schema::make_flow_state(
      corridor_id, corridor::schema::signed_amount_t{0});
  EXPECT_FALSE(zero.negative);
  EXPECT_EQ(corridor::schema::to_signed(zero),
            corridor::schema::signed_amount_t{0});
}
