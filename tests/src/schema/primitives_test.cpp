#include <gtest/gtest.h>
#include <notary/schema/primitives.hpp>

#include <limits>
#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_copies_all_bytes) {
  auto input = notary::schema::bytes_t(32, 0xAB);
  auto hash = notary::schema::make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = notary::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(notary::schema::try_make_hash32(std::string_view{"0102"})
                   .has_value());
  EXPECT_FALSE(notary::schema::try_make_hash32(
                   std::string_view{"zz02030405060708090a0b0c0d0e0f10"
                                    "1112131415161718191a1b1c1d1e1f20"})
                   .has_value());
}

TEST(primitives, null_account_is_only_the_zero_hash) {
  EXPECT_TRUE(notary::schema::is_null_account(notary::schema::make_zero_hash()));
  auto account = notary::schema::make_zero_hash();
  account[17] = 1;
  EXPECT_FALSE(notary::schema::is_null_account(account));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = notary::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = notary::schema::to_hex(
      notary::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(notary::schema::from_hex(encoded), payload);
  EXPECT_FALSE(notary::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(notary::schema::try_from_hex("0g").has_value());
}

TEST(primitives, try_make_amount_parses_decimal_uint256) {
  auto small = notary::schema::try_make_amount("1250");
  ASSERT_TRUE(small.has_value());
  EXPECT_EQ(*small, notary::schema::amount_t{1250});

  auto max = notary::schema::try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935");
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, std::numeric_limits<notary::schema::amount_t>::max());
}

TEST(primitives, try_make_amount_rejects_overflow_and_garbage) {
  EXPECT_FALSE(notary::schema::try_make_amount(
                   "11579208923731619542357098500868790785326998466564056403945"
                   "7584007913129639936")
                   .has_value());
  EXPECT_FALSE(notary::schema::try_make_amount("").has_value());
  EXPECT_FALSE(notary::schema::try_make_amount("-5").has_value());
  EXPECT_FALSE(notary::schema::try_make_amount("12a").has_value());
}
