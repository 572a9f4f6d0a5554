#include <spdlog/spdlog.h>
#include <notary/execution/access_control.hpp>
#include <notary/execution/account_index.hpp>
#include <notary/execution/registry.hpp>
#include <notary/execution/result.hpp>
#include <notary/execution/sequence.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <string>

using namespace notary::schema;

namespace notary::execution::registry {

namespace {

constexpr auto kItemIds = sequence{key::kItemSequence, 0};

void emit_status(execution_context& ctx, const item_state_t& item) {
  emit(ctx, ledger_event_type_t::item_status_updated,
       {make_id_attribute("item_id", item.item_id),
        make_flag_attribute("verified", item.is_verified),
        make_flag_attribute("active", item.is_active),
        make_attribute("timestamp", std::to_string(ctx.block_time))});
}

}  // namespace

transaction_result_t register_item(execution_context& ctx,
                                   const register_item_t& payload) {
  if (payload.uri.empty()) {
    return make_error(transaction_error_code::invalid_input,
                      "item uri must not be empty");
  }

  auto item = item_state_t{};
  item.item_id = kItemIds.next(ctx.state, ctx.encoder);
  item.submitter = ctx.caller;
  item.uri = payload.uri;
  item.category = payload.category;
  item.created_at = ctx.block_time;

  ctx.state.put(ctx.encoder, key::make_item_key(ctx.encoder, item.item_id),
                item);
  account_index::append(ctx.state, ctx.encoder, key::kSubmitterIndexPrefix,
                        ctx.caller, item.item_id);
  emit(ctx, ledger_event_type_t::item_registered,
       {make_id_attribute("item_id", item.item_id),
        make_account_attribute("submitter", item.submitter),
        make_attribute("uri", item.uri),
        make_attribute("category", item.category),
        make_attribute("created_at", std::to_string(item.created_at))});
  spdlog::debug("Registered item {} by {}", item.item_id,
                to_hex(item.submitter));
  return make_success_with(ctx.encoder, item.item_id, "item registered");
}

transaction_result_t moderate_item(execution_context& ctx,
                                   const moderate_item_t& payload) {
  if (!access_control::has_role(ctx.state, ctx.encoder, ctx.caller,
                                role_id_t::curator)) {
    return make_error(transaction_error_code::unauthorized,
                      "caller does not hold the curator role");
  }
  auto item = get_item(ctx.state, ctx.encoder, payload.item_id);
  if (!item) {
    return make_error(transaction_error_code::not_found, "item not found");
  }

  item->is_verified = payload.verified;
  item->is_active = payload.active;
  ctx.state.put(ctx.encoder, key::make_item_key(ctx.encoder, item->item_id),
                *item);
  emit_status(ctx, *item);
  return make_success("item moderated");
}

transaction_result_t deactivate_item(execution_context& ctx,
                                     const deactivate_item_t& payload) {
  auto item = get_item(ctx.state, ctx.encoder, payload.item_id);
  if (!item) {
    return make_error(transaction_error_code::not_found, "item not found");
  }
  if (item->submitter != ctx.caller) {
    return make_error(transaction_error_code::unauthorized,
                      "caller is not the item submitter");
  }
  if (!item->is_active) {
    return make_error(transaction_error_code::already_inactive,
                      "item is already inactive");
  }

  item->is_active = false;
  ctx.state.put(ctx.encoder, key::make_item_key(ctx.encoder, item->item_id),
                *item);
  emit_status(ctx, *item);
  return make_success("item deactivated");
}

std::optional<item_state_t> get_item(const state_overlay& state,
                                     encoder_t& encoder,
                                     const item_id_t item_id) {
  return state.get<item_state_t>(encoder, key::make_item_key(encoder, item_id));
}

std::vector<item_id_t> items_of(const state_overlay& state,
                                encoder_t& encoder,
                                const account_id_t& account) {
  return account_index::read(state, encoder, key::kSubmitterIndexPrefix,
                             account);
}

}  // namespace notary::execution::registry
