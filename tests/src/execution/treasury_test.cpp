#include <notary/schema/transaction_error_code.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <tuple>

using notary::schema::transaction_error_code;
using notary::testing::make_account;

namespace {

constexpr uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

notary::schema::create_document_t make_document(
    const notary::schema::account_id_t& signer) {
  return notary::schema::create_document_t{.document_hash = "sha256:fee",
                                           .required_signers = {signer}};
}

}  // namespace

TEST(treasury, owner_sets_storage_fee) {
  auto fixture = notary::testing::execution_fixture{"notary_treasury_fee"};
  EXPECT_EQ(fixture.engine().storage_fee(), 100);

  auto outsider = fixture.submit(make_account(0x41),
                                 notary::schema::set_storage_fee_t{.fee = 1});
  EXPECT_EQ(outsider.code, code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture.engine().storage_fee(), 100);

  auto updated = fixture.submit(fixture.owner(),
                                notary::schema::set_storage_fee_t{.fee = 250});
  ASSERT_EQ(updated.code, 0u) << updated.log;
  EXPECT_TRUE(updated.events.empty());
  EXPECT_EQ(fixture.engine().storage_fee(), 250);

  auto creator = make_account(0x42);
  fixture.ledger().credit(creator, 1000);
  auto old_fee = fixture.submit(creator, make_document(make_account(0x43)),
                                notary::schema::amount_t{100});
  EXPECT_EQ(old_fee.code, code_of(transaction_error_code::insufficient_fee));
}

TEST(treasury, owner_withdraws_entire_balance) {
  auto fixture = notary::testing::execution_fixture{"notary_treasury_withdraw"};
  auto creator = make_account(0x44);
  fixture.ledger().credit(creator, 1000);
  ASSERT_EQ(fixture
                .submit(creator, make_document(make_account(0x45)),
                        notary::schema::amount_t{100})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(creator, make_document(make_account(0x46)),
                        notary::schema::amount_t{120})
                .code,
            0u);
  EXPECT_EQ(fixture.engine().treasury_balance(), 220);

  auto outsider =
      fixture.submit(creator, notary::schema::withdraw_fees_t{});
  EXPECT_EQ(outsider.code, code_of(transaction_error_code::unauthorized));

  auto withdrawn =
      fixture.submit(fixture.owner(), notary::schema::withdraw_fees_t{});
  ASSERT_EQ(withdrawn.code, 0u) << withdrawn.log;
  EXPECT_EQ(notary::testing::decode_result<notary::schema::amount_t>(withdrawn),
            220);
  EXPECT_EQ(fixture.ledger().balance(fixture.owner()), 220);
  EXPECT_EQ(fixture.engine().treasury_balance(), 0);

  auto empty =
      fixture.submit(fixture.owner(), notary::schema::withdraw_fees_t{});
  ASSERT_EQ(empty.code, 0u);
  EXPECT_EQ(notary::testing::decode_result<notary::schema::amount_t>(empty), 0);
}

TEST(treasury, rejected_withdrawal_keeps_balance) {
  auto fixture = notary::testing::execution_fixture{"notary_treasury_reject"};
  fixture.ledger().credit(fixture.treasury(), 500);
  fixture.ledger().reject(fixture.owner());

  auto result =
      fixture.submit(fixture.owner(), notary::schema::withdraw_fees_t{});
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_rejected));
  EXPECT_EQ(fixture.ledger().balance(fixture.treasury()), 500);
}

TEST(treasury, state_query_reports_fee_account_and_balance) {
  auto fixture = notary::testing::execution_fixture{"notary_treasury_query", 7};
  fixture.ledger().credit(fixture.treasury(), 33);

  auto result = fixture.engine().query("/treasury/state", {});
  ASSERT_EQ(result.code, 0u) << result.log;
  auto [fee, account, balance] = notary::testing::decode_query<
      std::tuple<notary::schema::amount_t, notary::schema::account_id_t,
                 notary::schema::amount_t>>(result);
  EXPECT_EQ(fee, 7);
  EXPECT_EQ(account, fixture.treasury());
  EXPECT_EQ(balance, 33);
}
