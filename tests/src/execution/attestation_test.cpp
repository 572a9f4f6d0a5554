#include <notary/schema/transaction_error_code.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using notary::schema::transaction_error_code;
using notary::testing::make_account;

namespace {

constexpr uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

notary::schema::create_document_t make_document(
    std::vector<notary::schema::account_id_t> signers,
    std::string hash = "sha256:0011") {
  return notary::schema::create_document_t{
      .document_hash = std::move(hash), .required_signers = std::move(signers)};
}

class attestation_test : public ::testing::Test {
 protected:
  attestation_test() : fixture_{"notary_attestation"} {
    fixture_.ledger().credit(creator_, 1000);
  }

  notary::schema::document_id_t create(
      std::vector<notary::schema::account_id_t> signers) {
    auto result = fixture_.submit(creator_, make_document(std::move(signers)),
                                  notary::schema::amount_t{100});
    EXPECT_EQ(result.code, 0u) << result.log;
    return notary::testing::decode_result<uint64_t>(result);
  }

  notary::schema::transaction_result_t sign(
      const notary::schema::account_id_t& signer,
      const notary::schema::document_id_t id) {
    return fixture_.submit(signer,
                           notary::schema::sign_document_t{.document_id = id});
  }

  notary::testing::execution_fixture fixture_;
  notary::schema::account_id_t creator_{make_account(0x31)};
  notary::schema::account_id_t signer_a_{make_account(0x32)};
  notary::schema::account_id_t signer_b_{make_account(0x33)};
};

}  // namespace

TEST_F(attestation_test, create_charges_fee_and_indexes_document) {
  auto result = fixture_.submit(creator_, make_document({signer_a_, signer_b_}),
                                notary::schema::amount_t{150});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(notary::testing::decode_result<uint64_t>(result), 1u);
  ASSERT_TRUE(notary::testing::has_event(result, "DocumentCreated"));
  EXPECT_EQ(notary::testing::attribute_of(result.events.front(),
                                          "document_hash"),
            "sha256:0011");

  // The whole attached value lands in the treasury, not just the fee.
  EXPECT_EQ(fixture_.ledger().balance(fixture_.treasury()), 150);
  EXPECT_EQ(fixture_.ledger().balance(creator_), 850);
  EXPECT_EQ(fixture_.engine().treasury_balance(), 150);

  auto document = fixture_.engine().get_document(1);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->creator, creator_);
  EXPECT_EQ(document->required_signers.size(), 2u);
  EXPECT_EQ(document->signature_count, 0u);
  EXPECT_TRUE(document->is_active);
  EXPECT_FALSE(document->is_completed);

  EXPECT_EQ(fixture_.engine().user_documents(creator_),
            (std::vector<notary::schema::document_id_t>{1}));
  EXPECT_EQ(fixture_.engine().signer_documents(signer_b_),
            (std::vector<notary::schema::document_id_t>{1}));
  EXPECT_TRUE(fixture_.engine().is_required_signer(1, signer_a_));
  EXPECT_FALSE(fixture_.engine().is_required_signer(1, creator_));
}

TEST_F(attestation_test, create_rejects_bad_input_in_order) {
  auto underpaid = fixture_.submit(creator_, make_document({signer_a_}),
                                   notary::schema::amount_t{99});
  EXPECT_EQ(underpaid.code, code_of(transaction_error_code::insufficient_fee));

  // Fee is checked before the payload.
  auto underpaid_empty = fixture_.submit(creator_, make_document({}, ""),
                                         notary::schema::amount_t{0});
  EXPECT_EQ(underpaid_empty.code,
            code_of(transaction_error_code::insufficient_fee));

  auto empty_hash = fixture_.submit(creator_, make_document({signer_a_}, ""),
                                    notary::schema::amount_t{100});
  EXPECT_EQ(empty_hash.code, code_of(transaction_error_code::invalid_input));

  auto no_signers = fixture_.submit(creator_, make_document({}),
                                    notary::schema::amount_t{100});
  EXPECT_EQ(no_signers.code, code_of(transaction_error_code::invalid_input));

  auto null_signer = fixture_.submit(
      creator_,
      make_document({signer_a_, notary::schema::make_zero_hash()}),
      notary::schema::amount_t{100});
  EXPECT_EQ(null_signer.code, code_of(transaction_error_code::invalid_account));

  EXPECT_EQ(fixture_.ledger().balance(creator_), 1000);
  EXPECT_FALSE(fixture_.engine().get_document(1).has_value());

  // Rejected creations consume no id.
  EXPECT_EQ(create({signer_a_}), 1u);
}

TEST_F(attestation_test, zero_fee_allows_free_documents) {
  ASSERT_EQ(fixture_
                .submit(fixture_.owner(),
                        notary::schema::set_storage_fee_t{.fee = 0})
                .code,
            0u);
  auto result = fixture_.submit(creator_, make_document({signer_a_}));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture_.ledger().balance(fixture_.treasury()), 0);
}

TEST_F(attestation_test, rejected_fee_transfer_leaves_no_document) {
  fixture_.ledger().reject(fixture_.treasury());
  auto result = fixture_.submit(creator_, make_document({signer_a_}),
                                notary::schema::amount_t{100});
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_rejected));
  EXPECT_FALSE(fixture_.engine().get_document(1).has_value());
  EXPECT_TRUE(fixture_.engine().user_documents(creator_).empty());

  auto broke = make_account(0x34);
  auto unfunded = fixture_.submit(broke, make_document({signer_a_}),
                                  notary::schema::amount_t{100});
  EXPECT_EQ(unfunded.code, code_of(transaction_error_code::transfer_rejected));
}

TEST_F(attestation_test, duplicate_signers_are_collapsed) {
  auto id = create({signer_a_, signer_b_, signer_a_});
  auto document = fixture_.engine().get_document(id);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->required_signers,
            (std::vector<notary::schema::account_id_t>{signer_a_, signer_b_}));
  EXPECT_EQ(fixture_.engine().signer_documents(signer_a_),
            (std::vector<notary::schema::document_id_t>{id}));

  ASSERT_EQ(sign(signer_a_, id).code, 0u);
  auto last = sign(signer_b_, id);
  ASSERT_EQ(last.code, 0u);
  EXPECT_TRUE(notary::testing::has_event(last, "DocumentCompleted"));
}

TEST_F(attestation_test, last_signature_completes_document) {
  auto id = create({signer_a_, signer_b_});

  auto first = sign(signer_a_, id);
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_TRUE(notary::testing::has_event(first, "DocumentSigned"));
  EXPECT_FALSE(notary::testing::has_event(first, "DocumentCompleted"));
  EXPECT_TRUE(fixture_.engine().has_user_signed(id, signer_a_));
  EXPECT_FALSE(fixture_.engine().has_user_signed(id, signer_b_));

  auto twice = sign(signer_a_, id);
  EXPECT_EQ(twice.code, code_of(transaction_error_code::already_signed));

  auto outsider = sign(make_account(0x35), id);
  EXPECT_EQ(outsider.code,
            code_of(transaction_error_code::not_required_signer));

  auto second = sign(signer_b_, id);
  ASSERT_EQ(second.code, 0u) << second.log;
  ASSERT_EQ(second.events.size(), 2u);
  EXPECT_EQ(second.events[0].type, "DocumentSigned");
  EXPECT_EQ(second.events[1].type, "DocumentCompleted");

  auto document = fixture_.engine().get_document(id);
  ASSERT_TRUE(document.has_value());
  EXPECT_TRUE(document->is_completed);
  EXPECT_EQ(document->signature_count, 2u);
  EXPECT_EQ(document->signatures,
            (std::vector<notary::schema::account_id_t>{signer_a_, signer_b_}));

  auto after = sign(signer_b_, id);
  EXPECT_EQ(after.code, code_of(transaction_error_code::already_completed));
}

TEST_F(attestation_test, partial_signatures_leave_document_open) {
  auto signer_c = make_account(0x36);
  auto id = create({signer_a_, signer_b_, signer_c});
  ASSERT_EQ(sign(signer_a_, id).code, 0u);
  auto second = sign(signer_b_, id);
  ASSERT_EQ(second.code, 0u) << second.log;
  EXPECT_FALSE(notary::testing::has_event(second, "DocumentCompleted"));

  auto document = fixture_.engine().get_document(id);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->signature_count, 2u);
  EXPECT_FALSE(document->is_completed);
  EXPECT_TRUE(document->is_active);
  EXPECT_FALSE(fixture_.engine().has_user_signed(id, signer_c));
  EXPECT_TRUE(fixture_.engine().is_required_signer(id, signer_c));
}

TEST_F(attestation_test, sign_on_missing_document_is_not_found) {
  auto result = sign(signer_a_, 42);
  EXPECT_EQ(result.code, code_of(transaction_error_code::not_found));
  EXPECT_FALSE(fixture_.engine().has_user_signed(42, signer_a_));
  EXPECT_FALSE(fixture_.engine().is_required_signer(42, signer_a_));
}

TEST_F(attestation_test, creator_revokes_active_document) {
  auto id = create({signer_a_, signer_b_});
  ASSERT_EQ(sign(signer_a_, id).code, 0u);

  auto stranger = fixture_.submit(
      signer_a_, notary::schema::revoke_document_t{.document_id = id});
  EXPECT_EQ(stranger.code, code_of(transaction_error_code::unauthorized));

  auto revoked = fixture_.submit(
      creator_, notary::schema::revoke_document_t{.document_id = id});
  ASSERT_EQ(revoked.code, 0u) << revoked.log;
  EXPECT_TRUE(notary::testing::has_event(revoked, "DocumentRevoked"));
  auto document = fixture_.engine().get_document(id);
  ASSERT_TRUE(document.has_value());
  EXPECT_FALSE(document->is_active);
  EXPECT_FALSE(document->is_completed);
  EXPECT_EQ(document->signature_count, 1u);
  EXPECT_EQ(document->signatures,
            (std::vector<notary::schema::account_id_t>{signer_a_}));

  auto signing_revoked = sign(signer_b_, id);
  EXPECT_EQ(signing_revoked.code,
            code_of(transaction_error_code::document_inactive));

  auto again = fixture_.submit(
      creator_, notary::schema::revoke_document_t{.document_id = id});
  EXPECT_EQ(again.code, code_of(transaction_error_code::already_inactive));

  // No refund on revocation.
  EXPECT_EQ(fixture_.ledger().balance(fixture_.treasury()), 100);
}

TEST_F(attestation_test, completed_documents_cannot_be_revoked) {
  auto id = create({signer_a_});
  ASSERT_EQ(sign(signer_a_, id).code, 0u);
  auto result = fixture_.submit(
      creator_, notary::schema::revoke_document_t{.document_id = id});
  EXPECT_EQ(result.code, code_of(transaction_error_code::already_completed));
  EXPECT_TRUE(fixture_.engine().get_document(id)->is_active);

  auto missing = fixture_.submit(
      creator_, notary::schema::revoke_document_t{.document_id = 77});
  EXPECT_EQ(missing.code, code_of(transaction_error_code::not_found));
}
