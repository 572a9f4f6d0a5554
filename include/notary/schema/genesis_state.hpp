#pragma once

#include <notary/schema/primitives.hpp>

// Schema type: genesis state.
// Chain initialization parameters. The owner receives the admin role and
// fee authority; the treasury account is where creation deposits land.
namespace notary::schema {

template <uint16_t Version>
struct genesis_state;

template <>
struct genesis_state<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  account_id_t owner{};
  account_id_t treasury_account{};
  amount_t storage_fee;
};

using genesis_state_t = genesis_state<1>;

}  // namespace notary::schema
