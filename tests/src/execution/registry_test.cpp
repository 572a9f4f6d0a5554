#include <notary/schema/transaction_error_code.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using notary::schema::role_id_t;
using notary::schema::transaction_error_code;
using notary::testing::make_account;

namespace {

constexpr uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

notary::schema::register_item_t make_item(std::string uri) {
  return notary::schema::register_item_t{.uri = std::move(uri),
                                         .category = "art"};
}

}  // namespace

TEST(registry, anyone_registers_items_with_sequential_ids) {
  auto fixture = notary::testing::execution_fixture{"notary_registry_ids"};
  auto alice = make_account(0x21);
  auto bob = make_account(0x22);

  auto first = fixture.submit(alice, make_item("ipfs://first"));
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(notary::testing::decode_result<uint64_t>(first), 0u);
  ASSERT_TRUE(notary::testing::has_event(first, "ItemRegistered"));
  EXPECT_EQ(notary::testing::attribute_of(first.events.front(), "uri"),
            "ipfs://first");
  EXPECT_EQ(notary::testing::attribute_of(first.events.front(), "item_id"),
            "0");

  auto second = fixture.submit(bob, make_item("ipfs://second"));
  auto third = fixture.submit(alice, make_item("ipfs://third"));
  EXPECT_EQ(notary::testing::decode_result<uint64_t>(second), 1u);
  EXPECT_EQ(notary::testing::decode_result<uint64_t>(third), 2u);

  EXPECT_EQ(fixture.engine().items_of(alice),
            (std::vector<notary::schema::item_id_t>{0, 2}));
  EXPECT_EQ(fixture.engine().items_of(bob),
            (std::vector<notary::schema::item_id_t>{1}));
  EXPECT_TRUE(fixture.engine().items_of(make_account(0x23)).empty());

  auto item = fixture.engine().get_item(2);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->submitter, alice);
  EXPECT_EQ(item->category, "art");
  EXPECT_TRUE(item->is_active);
  EXPECT_FALSE(item->is_verified);
  EXPECT_GT(item->created_at, 0u);
}

TEST(registry, empty_uri_is_rejected_without_consuming_an_id) {
  auto fixture = notary::testing::execution_fixture{"notary_registry_empty"};
  auto alice = make_account(0x24);

  auto empty = fixture.submit(alice, make_item(""));
  EXPECT_EQ(empty.code, code_of(transaction_error_code::invalid_input));

  auto accepted = fixture.submit(alice, make_item("ipfs://ok"));
  ASSERT_EQ(accepted.code, 0u);
  EXPECT_EQ(notary::testing::decode_result<uint64_t>(accepted), 0u);
}

TEST(registry, curator_moderates_any_item) {
  auto fixture = notary::testing::execution_fixture{"notary_registry_moderate"};
  auto curator = make_account(0x25);
  auto alice = make_account(0x26);
  ASSERT_EQ(fixture.submit(alice, make_item("ipfs://a")).code, 0u);

  auto denied = fixture.submit(
      alice, notary::schema::moderate_item_t{
                 .item_id = 0, .verified = true, .active = true});
  EXPECT_EQ(denied.code, code_of(transaction_error_code::unauthorized));

  ASSERT_EQ(fixture
                .submit(fixture.owner(),
                        notary::schema::grant_role_t{
                            .account = curator, .role = role_id_t::curator})
                .code,
            0u);
  auto missing = fixture.submit(
      curator, notary::schema::moderate_item_t{
                   .item_id = 9, .verified = true, .active = true});
  EXPECT_EQ(missing.code, code_of(transaction_error_code::not_found));

  auto verified = fixture.submit(
      curator, notary::schema::moderate_item_t{
                   .item_id = 0, .verified = true, .active = false});
  ASSERT_EQ(verified.code, 0u) << verified.log;
  ASSERT_TRUE(notary::testing::has_event(verified, "ItemStatusUpdated"));
  const auto& event = verified.events.front();
  EXPECT_EQ(notary::testing::attribute_of(event, "verified"), "true");
  EXPECT_EQ(notary::testing::attribute_of(event, "active"), "false");

  auto item = fixture.engine().get_item(0);
  ASSERT_TRUE(item.has_value());
  EXPECT_TRUE(item->is_verified);
  EXPECT_FALSE(item->is_active);

  // Curators may bring an inactive item back.
  auto reactivated = fixture.submit(
      curator, notary::schema::moderate_item_t{
                   .item_id = 0, .verified = true, .active = true});
  ASSERT_EQ(reactivated.code, 0u);
  EXPECT_TRUE(fixture.engine().get_item(0)->is_active);
}

TEST(registry, submitter_deactivates_once) {
  auto fixture = notary::testing::execution_fixture{"notary_registry_deactivate"};
  auto alice = make_account(0x27);
  auto bob = make_account(0x28);
  ASSERT_EQ(fixture.submit(alice, make_item("ipfs://a")).code, 0u);

  auto missing =
      fixture.submit(alice, notary::schema::deactivate_item_t{.item_id = 4});
  EXPECT_EQ(missing.code, code_of(transaction_error_code::not_found));

  auto stranger =
      fixture.submit(bob, notary::schema::deactivate_item_t{.item_id = 0});
  EXPECT_EQ(stranger.code, code_of(transaction_error_code::unauthorized));

  auto deactivated =
      fixture.submit(alice, notary::schema::deactivate_item_t{.item_id = 0});
  ASSERT_EQ(deactivated.code, 0u) << deactivated.log;
  EXPECT_TRUE(notary::testing::has_event(deactivated, "ItemStatusUpdated"));
  EXPECT_FALSE(fixture.engine().get_item(0)->is_active);

  auto again =
      fixture.submit(alice, notary::schema::deactivate_item_t{.item_id = 0});
  EXPECT_EQ(again.code, code_of(transaction_error_code::already_inactive));
}
