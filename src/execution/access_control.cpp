#include <spdlog/spdlog.h>
#include <notary/execution/access_control.hpp>
#include <notary/execution/result.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <string>

using namespace notary::schema;

namespace notary::execution::access_control {

namespace {

void set_role(execution_context& ctx,
              const account_id_t& account,
              const role_id_t role,
              const bool granted) {
  ctx.state.put(ctx.encoder, key::make_role_key(ctx.encoder, account, role),
                granted);
}

void emit_role_event(execution_context& ctx,
                     const ledger_event_type_t type,
                     const account_id_t& account,
                     const role_id_t role) {
  emit(ctx, type,
       {make_account_attribute("account", account),
        make_attribute("role", std::string{to_string(role)}, true),
        make_account_attribute("sender", ctx.caller)});
}

}  // namespace

void initialize(execution_context& ctx, const account_id_t& owner) {
  ctx.state.put(ctx.encoder, key::make_prefix_key(ctx.encoder, key::kOwnerKey),
                owner);
  set_role(ctx, owner, role_id_t::admin, true);
  emit_role_event(ctx, ledger_event_type_t::role_granted, owner,
                  role_id_t::admin);
}

transaction_result_t grant_role(execution_context& ctx,
                                const grant_role_t& payload) {
  if (!has_role(ctx.state, ctx.encoder, ctx.caller, role_id_t::admin)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller does not hold the admin role");
  }
  if (is_null_account(payload.account)) {
    return make_error(transaction_error_code::invalid_account,
                      "cannot grant a role to the null account");
  }
  if (!is_known_role(payload.role)) {
    return make_error(transaction_error_code::invalid_input, "unknown role");
  }
  if (has_role(ctx.state, ctx.encoder, payload.account, payload.role)) {
    return make_error(transaction_error_code::already_granted,
                      "role already granted");
  }

  set_role(ctx, payload.account, payload.role, true);
  emit_role_event(ctx, ledger_event_type_t::role_granted, payload.account,
                  payload.role);
  spdlog::debug("Granted role '{}' to {}", to_string(payload.role),
                to_hex(payload.account));
  return make_success("role granted");
}

transaction_result_t revoke_role(execution_context& ctx,
                                 const revoke_role_t& payload) {
  if (!has_role(ctx.state, ctx.encoder, ctx.caller, role_id_t::admin)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller does not hold the admin role");
  }
  if (!has_role(ctx.state, ctx.encoder, payload.account, payload.role)) {
    return make_error(transaction_error_code::not_granted,
                      "role is not granted to account");
  }

  set_role(ctx, payload.account, payload.role, false);
  emit_role_event(ctx, ledger_event_type_t::role_revoked, payload.account,
                  payload.role);
  spdlog::debug("Revoked role '{}' from {}", to_string(payload.role),
                to_hex(payload.account));
  return make_success("role revoked");
}

transaction_result_t transfer_ownership(execution_context& ctx,
                                        const transfer_ownership_t& payload) {
  auto current = owner(ctx.state, ctx.encoder);
  if (!current || *current != ctx.caller) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not the owner");
  }
  if (is_null_account(payload.new_owner)) {
    return make_error(transaction_error_code::invalid_account,
                      "new owner is the null account");
  }

  ctx.state.put(ctx.encoder, key::make_prefix_key(ctx.encoder, key::kOwnerKey),
                payload.new_owner);
  emit(ctx, ledger_event_type_t::ownership_transferred,
       {make_account_attribute("previous_owner", *current),
        make_account_attribute("new_owner", payload.new_owner)});
  spdlog::info("Ownership transferred from {} to {}", to_hex(*current),
               to_hex(payload.new_owner));
  return make_success("ownership transferred");
}

bool has_role(const state_overlay& state,
              encoder_t& encoder,
              const account_id_t& account,
              const role_id_t role) {
  return state.get<bool>(encoder, key::make_role_key(encoder, account, role))
      .value_or(false);
}

std::optional<account_id_t> owner(const state_overlay& state,
                                  encoder_t& encoder) {
  return state.get<account_id_t>(encoder,
                                 key::make_prefix_key(encoder, key::kOwnerKey));
}

}  // namespace notary::execution::access_control
