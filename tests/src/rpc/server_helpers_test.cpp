#include <corridor/rpc/server.hpp>
#include <corridor/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using corridor::schema::amount_t;
using corridor::schema::direction_t;
using corridor::testing::make_hash;

namespace {

std::string raw(const corridor::schema::hash32_t& hash) {
  return std::string{hash.begin(), hash.end()};
}

}  // namespace

TEST(rpc_helpers, parse_identity_accepts_raw_and_hex) {
  auto expected = make_hash(12);
  auto status = corridor::v1::Status{};

  auto from_raw = corridor::rpc::parse_identity(raw(expected), "owner", &status);
  ASSERT_TRUE(from_raw.has_value());
  EXPECT_EQ(*from_raw, expected);

  auto hex = corridor::schema::to_hex(expected);
  auto from_hex = corridor::rpc::parse_identity(hex, "owner", &status);
  ASSERT_TRUE(from_hex.has_value());
  EXPECT_EQ(*from_hex, expected);
  EXPECT_EQ(status.code(), 0u);
  EXPECT_TRUE(status.log().empty());
}

TEST(rpc_helpers, parse_identity_rejects_wrong_length) {
  auto status = corridor::v1::Status{};
  auto identity =
      corridor::rpc::parse_identity(std::string(31, 'x'), "corridor_id", &status);
  EXPECT_FALSE(identity.has_value());
  EXPECT_EQ(status.code(), 10u);
  EXPECT_EQ(status.codespace(), "corridor.validation");
  EXPECT_NE(status.log().find("corridor_id"), std::string::npos);
}

TEST(rpc_helpers, parse_amount_is_unsigned_decimal) {
  auto status = corridor::v1::Status{};
  auto amount = corridor::rpc::parse_amount("123456789012345678901234567890",
                                            "amount", &status);
  ASSERT_TRUE(amount.has_value());
  EXPECT_EQ(corridor::schema::to_string(*amount),
            "123456789012345678901234567890");

  for (const auto* text : {"", "-5", "12a", "0x10"}) {
    auto rejected = corridor::v1::Status{};
    EXPECT_FALSE(
        corridor::rpc::parse_amount(text, "min_out", &rejected).has_value())
        << text;
    EXPECT_EQ(rejected.code(), 11u);
    EXPECT_NE(rejected.log().find("min_out"), std::string::npos);
  }
}

TEST(rpc_helpers, parse_direction_maps_both_legs) {
  auto status = corridor::v1::Status{};
  EXPECT_EQ(corridor::rpc::parse_direction(corridor::v1::DIRECTION_LEG0_TO_LEG1,
                                           &status),
            direction_t::leg0_to_leg1);
  EXPECT_EQ(corridor::rpc::parse_direction(corridor::v1::DIRECTION_LEG1_TO_LEG0,
                                           &status),
            direction_t::leg1_to_leg0);
  EXPECT_EQ(status.code(), 0u);

  EXPECT_FALSE(corridor::rpc::parse_direction(7, &status).has_value());
  EXPECT_EQ(status.code(), 12u);

  EXPECT_EQ(corridor::rpc::to_proto(direction_t::leg1_to_leg0),
            corridor::v1::DIRECTION_LEG1_TO_LEG0);
  EXPECT_EQ(corridor::rpc::to_proto(direction_t::leg0_to_leg1),
            corridor::v1::DIRECTION_LEG0_TO_LEG1);
}

TEST(rpc_helpers, intent_without_price_limit_leaves_field_unset) {
  auto intent = corridor::schema::intent_state_t{};
  intent.intent_id = 4;
  intent.owner = make_hash(1);
  intent.corridor_id = make_hash(2);
  intent.direction = direction_t::leg1_to_leg0;
  intent.magnitude = amount_t{"340282366920938463463374607431768211455"};
  intent.min_out = 9;
  intent.deadline = 1'000;
  intent.created_at = 500;

  auto message = corridor::v1::Intent{};
  corridor::rpc::populate_intent(intent, &message);
  EXPECT_EQ(message.intent_id(), 4u);
  EXPECT_EQ(message.owner(), raw(intent.owner));
  EXPECT_EQ(message.corridor_id(), raw(intent.corridor_id));
  EXPECT_EQ(message.direction(), corridor::v1::DIRECTION_LEG1_TO_LEG0);
  EXPECT_EQ(message.magnitude(), "340282366920938463463374607431768211455");
  EXPECT_FALSE(message.has_price_limit());
  EXPECT_EQ(message.min_out(), "9");
  EXPECT_EQ(message.deadline(), 1'000u);
  EXPECT_FALSE(message.settled());
  EXPECT_EQ(message.settled_output(), "0");

  intent.price_limit = amount_t{77};
  auto limited = corridor::v1::Intent{};
  corridor::rpc::populate_intent(intent, &limited);
  ASSERT_TRUE(limited.has_price_limit());
  EXPECT_EQ(limited.price_limit(), "77");
}

TEST(rpc_helpers, cow_stats_are_rendered_as_decimals) {
  auto stats = corridor::schema::cow_stats_t{};
  stats.corridor_id = make_hash(3);
  stats.valid_count = 3;
  stats.total_leg0 = 150;
  stats.total_leg1 = 100;
  stats.matched_amount = 100;
  stats.residual_to_venue = 50;
  stats.cost_saved_estimate = 300'000;

  auto message = corridor::v1::CowStats{};
  corridor::rpc::populate_cow_stats(stats, &message);
  EXPECT_EQ(message.corridor_id(), raw(stats.corridor_id));
  EXPECT_EQ(message.valid_count(), 3u);
  EXPECT_EQ(message.total_leg0(), "150");
  EXPECT_EQ(message.total_leg1(), "100");
  EXPECT_EQ(message.matched_amount(), "100");
  EXPECT_EQ(message.residual_to_venue(), "50");
  EXPECT_EQ(message.residual_direction(), corridor::v1::DIRECTION_LEG0_TO_LEG1);
  EXPECT_EQ(message.cost_saved_estimate(), "300000");
}

TEST(rpc_helpers, status_carries_failure_and_events) {
  auto failed = corridor::schema::make_failure<amount_t>(
      corridor::schema::error_code::expired, "intent 3 expired at 10");
  auto status = corridor::v1::Status{};
  corridor::rpc::populate_status(failed, &status);
  EXPECT_EQ(status.code(), 42u);
  EXPECT_EQ(status.codespace(), "corridor.intent_state");
  EXPECT_EQ(status.log(), "intent 3 expired at 10");
  EXPECT_EQ(status.events_size(), 0);

  auto record = corridor::schema::event_record_t{};
  record.event_id = 8;
  record.recorded_at = 99;
  record.event.type = "flow_reset";
  record.event.attributes.push_back(
      corridor::schema::transaction_event_attribute_t{
          .key = "corridor_id", .value = "ab", .index = true});
  auto succeeded =
      corridor::schema::make_success(amount_t{1}, {record});
  auto ok_status = corridor::v1::Status{};
  corridor::rpc::populate_status(succeeded, &ok_status);
  EXPECT_EQ(ok_status.code(), 0u);
  ASSERT_EQ(ok_status.events_size(), 1);
  EXPECT_EQ(ok_status.events(0).event_id(), 8u);
  EXPECT_EQ(ok_status.events(0).recorded_at(), 99u);
  EXPECT_EQ(ok_status.events(0).type(), "flow_reset");
  ASSERT_EQ(ok_status.events(0).attributes_size(), 1);
  EXPECT_EQ(ok_status.events(0).attributes(0).key(), "corridor_id");
  EXPECT_TRUE(ok_status.events(0).attributes(0).index());
}
