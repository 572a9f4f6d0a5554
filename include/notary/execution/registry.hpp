#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/deactivate_item.hpp>
#include <notary/schema/item_state.hpp>
#include <notary/schema/moderate_item.hpp>
#include <notary/schema/register_item.hpp>
#include <notary/schema/transaction_result.hpp>
#include <optional>
#include <vector>

// Item lifecycle: community submission, curator moderation and submitter
// deactivation.
namespace notary::execution::registry {

/// Ids start at 0. The new id is returned SCALE-encoded in the result data.
notary::schema::transaction_result_t register_item(
    execution_context& ctx,
    const notary::schema::register_item_t& payload);

/// Curator-only. Both flags are overwritten, so a curator may also
/// re-activate an item its submitter deactivated.
notary::schema::transaction_result_t moderate_item(
    execution_context& ctx,
    const notary::schema::moderate_item_t& payload);

notary::schema::transaction_result_t deactivate_item(
    execution_context& ctx,
    const notary::schema::deactivate_item_t& payload);

std::optional<notary::schema::item_state_t> get_item(
    const state_overlay& state,
    encoder_t& encoder,
    notary::schema::item_id_t item_id);

std::vector<notary::schema::item_id_t> items_of(
    const state_overlay& state,
    encoder_t& encoder,
    const notary::schema::account_id_t& account);

}  // namespace notary::execution::registry
