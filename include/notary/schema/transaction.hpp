#pragma once
#include <notary/schema/create_document.hpp>
#include <notary/schema/deactivate_item.hpp>
#include <notary/schema/grant_role.hpp>
#include <notary/schema/moderate_item.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/register_item.hpp>
#include <notary/schema/revoke_document.hpp>
#include <notary/schema/revoke_role.hpp>
#include <notary/schema/set_storage_fee.hpp>
#include <notary/schema/sign_document.hpp>
#include <notary/schema/transfer_ownership.hpp>
#include <notary/schema/withdraw_fees.hpp>
#include <variant>

namespace notary::schema {

using transaction_payload_t = std::variant<grant_role_t,
                                           revoke_role_t,
                                           transfer_ownership_t,
                                           register_item_t,
                                           moderate_item_t,
                                           deactivate_item_t,
                                           create_document_t,
                                           sign_document_t,
                                           revoke_document_t,
                                           set_storage_fee_t,
                                           withdraw_fees_t>;

template <uint16_t Version>
struct transaction;

/// `signer` is the caller identity, authenticated by the host before the
/// transaction reaches the engine. `value` is the native amount attached to
/// the call; only create_document accepts a non-zero value.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  amount_t value;
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace notary::schema
