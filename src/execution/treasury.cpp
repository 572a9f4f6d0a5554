#include <spdlog/spdlog.h>
#include <notary/execution/access_control.hpp>
#include <notary/execution/reentrancy_guard.hpp>
#include <notary/execution/result.hpp>
#include <notary/execution/treasury.hpp>
#include <notary/schema/key/engine_keys.hpp>

using namespace notary::schema;

namespace notary::execution::treasury {

namespace {

bool is_owner(execution_context& ctx) {
  auto current = access_control::owner(ctx.state, ctx.encoder);
  return current.has_value() && *current == ctx.caller;
}

}  // namespace

void initialize(execution_context& ctx,
                const account_id_t& treasury_account,
                const amount_t& storage_fee) {
  ctx.state.put(ctx.encoder,
                key::make_prefix_key(ctx.encoder, key::kTreasuryAccountKey),
                treasury_account);
  ctx.state.put(ctx.encoder,
                key::make_prefix_key(ctx.encoder, key::kStorageFeeKey),
                storage_fee);
}

transaction_result_t set_storage_fee(execution_context& ctx,
                                     const set_storage_fee_t& payload) {
  if (!is_owner(ctx)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not the owner");
  }
  ctx.state.put(ctx.encoder,
                key::make_prefix_key(ctx.encoder, key::kStorageFeeKey),
                payload.fee);
  spdlog::info("Storage fee set to {}", payload.fee.str());
  return make_success("storage fee updated");
}

transaction_result_t withdraw_fees(execution_context& ctx,
                                   const withdraw_fees_t&) {
  if (!is_owner(ctx)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not the owner");
  }
  if (ctx.entered) {
    return make_error(transaction_error_code::reentrant,
                      "re-entrant call rejected");
  }

  auto guard = reentrancy_guard{ctx.entered};
  auto amount = treasury_balance(ctx.state, ctx.encoder, ctx.rail);
  if (amount > 0) {
    auto source = treasury_account(ctx.state, ctx.encoder);
    if (!ctx.rail.transfer || !ctx.rail.transfer(source, ctx.caller, amount)) {
      return make_error(transaction_error_code::transfer_rejected,
                        "treasury withdrawal was rejected");
    }
  }
  spdlog::info("Withdrew {} from treasury to {}", amount.str(),
               to_hex(ctx.caller));
  return make_success_with(ctx.encoder, amount, "fees withdrawn");
}

amount_t storage_fee(const state_overlay& state, encoder_t& encoder) {
  return state
      .get<amount_t>(encoder,
                     key::make_prefix_key(encoder, key::kStorageFeeKey))
      .value_or(amount_t{0});
}

account_id_t treasury_account(const state_overlay& state, encoder_t& encoder) {
  return state
      .get<account_id_t>(
          encoder, key::make_prefix_key(encoder, key::kTreasuryAccountKey))
      .value_or(make_zero_hash());
}

amount_t treasury_balance(const state_overlay& state,
                          encoder_t& encoder,
                          const value_rail& rail) {
  if (!rail.balance) {
    return amount_t{0};
  }
  return rail.balance(treasury_account(state, encoder));
}

}  // namespace notary::execution::treasury
