#include <corridor/execution/events.hpp>
#include <corridor/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

using corridor::execution::intent_request;
using corridor::schema::amount_t;
using corridor::schema::direction_t;
using corridor::schema::error_code;
using corridor::testing::component_fixture;
using corridor::testing::make_account;
using corridor::testing::make_hash;

namespace {

intent_request make_request(component_fixture& fixture) {
  return intent_request{.owner = make_account(1),
                        .corridor_id = make_hash(50),
                        .direction = direction_t::leg0_to_leg1,
                        .magnitude = 1'000,
                        .price_limit = std::nullopt,
                        .min_out = 990,
                        .deadline = fixture.clock().now() + 60'000};
}

}  // namespace

TEST(intent_ledger, ids_start_at_one_and_increase) {
  auto fixture = component_fixture{"corridor_ledger_ids"};
  EXPECT_EQ(fixture.ledger().intent_count(), 0u);

  auto first = fixture.ledger().create(make_request(fixture));
  auto second = fixture.ledger().create(make_request(fixture));
  ASSERT_TRUE(first.ok()) << first.log;
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(first.value, 1u);
  EXPECT_EQ(second.value, 2u);
  EXPECT_EQ(fixture.ledger().intent_count(), 2u);
}

TEST(intent_ledger, created_intent_is_stored_unsettled) {
  auto fixture = component_fixture{"corridor_ledger_store"};
  auto request = make_request(fixture);
  request.direction = direction_t::leg1_to_leg0;
  request.price_limit = amount_t{1'010};

  auto created = fixture.ledger().create(request);
  ASSERT_TRUE(created.ok()) << created.log;

  auto intent = fixture.ledger().get(created.value);
  EXPECT_TRUE(corridor::execution::exists(intent));
  EXPECT_EQ(intent.intent_id, created.value);
  EXPECT_EQ(intent.owner, request.owner);
  EXPECT_EQ(intent.corridor_id, request.corridor_id);
  EXPECT_EQ(intent.direction, direction_t::leg1_to_leg0);
  EXPECT_EQ(intent.magnitude, request.magnitude);
  ASSERT_TRUE(intent.price_limit.has_value());
  EXPECT_EQ(*intent.price_limit, amount_t{1'010});
  EXPECT_EQ(intent.min_out, request.min_out);
  EXPECT_EQ(intent.deadline, request.deadline);
  EXPECT_EQ(intent.created_at, fixture.clock().now());
  EXPECT_FALSE(intent.settled);
  EXPECT_EQ(intent.settled_output, amount_t{0});
}

TEST(intent_ledger, create_emits_intent_created) {
  auto fixture = component_fixture{"corridor_ledger_event"};
  auto created = fixture.ledger().create(make_request(fixture));
  ASSERT_TRUE(created.ok());
  ASSERT_EQ(created.events.size(), 1u);

  const auto& record = created.events[0];
  EXPECT_EQ(record.event_id, 1u);
  EXPECT_EQ(record.recorded_at, fixture.clock().now());
  EXPECT_EQ(record.event.type, corridor::execution::kIntentCreatedEvent);
  ASSERT_FALSE(record.event.attributes.empty());
  EXPECT_EQ(record.event.attributes[0].key, "intent_id");
  EXPECT_EQ(record.event.attributes[0].value, "1");
}

TEST(intent_ledger, missing_id_reads_as_null_owner) {
  auto fixture = component_fixture{"corridor_ledger_missing"};
  EXPECT_FALSE(corridor::execution::exists(fixture.ledger().get(0)));
  EXPECT_FALSE(corridor::execution::exists(fixture.ledger().get(42)));
  EXPECT_FALSE(fixture.ledger().find(42).has_value());
}

TEST(intent_ledger, rejects_deadline_not_in_the_future) {
  auto fixture = component_fixture{"corridor_ledger_deadline"};
  auto request = make_request(fixture);
  request.deadline = fixture.clock().now();

  auto result = fixture.ledger().create(request);
  EXPECT_EQ(result.error(), error_code::invalid_deadline);
  EXPECT_EQ(result.codespace, "corridor.validation");
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(fixture.ledger().intent_count(), 0u);
}

TEST(intent_ledger, rejects_zero_magnitude_and_zero_min_out) {
  auto fixture = component_fixture{"corridor_ledger_zero"};
  auto zero_magnitude = make_request(fixture);
  zero_magnitude.magnitude = 0;
  EXPECT_EQ(fixture.ledger().create(zero_magnitude).error(),
            error_code::zero_amount);

  auto zero_min_out = make_request(fixture);
  zero_min_out.min_out = 0;
  EXPECT_EQ(fixture.ledger().create(zero_min_out).error(),
            error_code::zero_amount);
  EXPECT_EQ(fixture.ledger().intent_count(), 0u);
}

TEST(intent_ledger, magnitude_is_capped_at_uint128_max) {
  auto fixture = component_fixture{"corridor_ledger_cap"};
  auto at_cap = make_request(fixture);
  at_cap.magnitude = corridor::schema::kMaxIntentMagnitude;
  EXPECT_TRUE(fixture.ledger().create(at_cap).ok());

  auto over_cap = make_request(fixture);
  over_cap.magnitude = amount_t{corridor::schema::kMaxIntentMagnitude + 1};
  EXPECT_EQ(fixture.ledger().create(over_cap).error(),
            error_code::amount_too_large);
}

TEST(intent_ledger, rejects_null_owner) {
  auto fixture = component_fixture{"corridor_ledger_owner"};
  auto request = make_request(fixture);
  request.owner = corridor::schema::make_zero_hash();
  EXPECT_EQ(fixture.ledger().create(request).error(),
            error_code::invalid_owner);
}

TEST(intent_ledger, owner_index_lists_in_creation_order_with_cap) {
  auto fixture = component_fixture{"corridor_ledger_owner_index"};
  auto alice = make_account(1);
  auto bob = make_account(2);

  auto alice_ids = std::vector<corridor::schema::intent_id_t>{};
  for (auto i = 0; i < 300; ++i) {
    auto request = make_request(fixture);
    request.owner = (i % 3 == 0) ? bob : alice;
    auto created = fixture.ledger().create(request);
    ASSERT_TRUE(created.ok());
    if (request.owner == alice) {
      alice_ids.push_back(created.value);
    }
  }

  auto all = fixture.ledger().intents_of(alice, 1'000);
  EXPECT_EQ(all, alice_ids);

  auto capped = fixture.ledger().intents_of(alice, 5);
  ASSERT_EQ(capped.size(), 5u);
  EXPECT_EQ(capped,
            std::vector<corridor::schema::intent_id_t>(alice_ids.begin(),
                                                       alice_ids.begin() + 5));

  EXPECT_EQ(fixture.ledger().intents_of(bob, 1'000).size(), 100u);
  EXPECT_TRUE(fixture.ledger().intents_of(make_account(3), 10).empty());
  EXPECT_TRUE(fixture.ledger().intents_of(alice, 0).empty());
}
