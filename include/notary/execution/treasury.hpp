#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/set_storage_fee.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/schema/withdraw_fees.hpp>

// Storage fee parameter and owner withdrawal of the treasury account's
// environment-held balance. Neither operation emits event records.
namespace notary::execution::treasury {

/// Genesis: fix the treasury account and the initial storage fee.
void initialize(execution_context& ctx,
                const notary::schema::account_id_t& treasury_account,
                const notary::schema::amount_t& storage_fee);

notary::schema::transaction_result_t set_storage_fee(
    execution_context& ctx,
    const notary::schema::set_storage_fee_t& payload);

/// Moves the full treasury balance to the owner. The withdrawn amount is
/// returned SCALE-encoded in the result data.
notary::schema::transaction_result_t withdraw_fees(
    execution_context& ctx,
    const notary::schema::withdraw_fees_t& payload);

notary::schema::amount_t storage_fee(const state_overlay& state,
                                     encoder_t& encoder);

notary::schema::account_id_t treasury_account(const state_overlay& state,
                                              encoder_t& encoder);

notary::schema::amount_t treasury_balance(const state_overlay& state,
                                          encoder_t& encoder,
                                          const value_rail& rail);

}  // namespace notary::execution::treasury
