#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/grant_role.hpp>
#include <notary/schema/revoke_role.hpp>
#include <notary/schema/role_id.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/schema/transfer_ownership.hpp>
#include <optional>

// Role grants and the single owner identity. Owner and the admin role are
// stored in separate rows and never change each other.
namespace notary::execution::access_control {

/// Genesis: record `owner` and grant it the admin role.
void initialize(execution_context& ctx,
                const notary::schema::account_id_t& owner);

notary::schema::transaction_result_t grant_role(
    execution_context& ctx,
    const notary::schema::grant_role_t& payload);

notary::schema::transaction_result_t revoke_role(
    execution_context& ctx,
    const notary::schema::revoke_role_t& payload);

notary::schema::transaction_result_t transfer_ownership(
    execution_context& ctx,
    const notary::schema::transfer_ownership_t& payload);

bool has_role(const state_overlay& state,
              encoder_t& encoder,
              const notary::schema::account_id_t& account,
              notary::schema::role_id_t role);

std::optional<notary::schema::account_id_t> owner(const state_overlay& state,
                                                  encoder_t& encoder);

}  // namespace notary::execution::access_control
