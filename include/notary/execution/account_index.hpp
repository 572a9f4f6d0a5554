#pragma once

#include <notary/execution/context.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

// Append-only account -> ids reverse indexes (submitter, creator, signer).
namespace notary::execution::account_index {

inline std::vector<uint64_t> read(const state_overlay& state,
                                  encoder_t& encoder,
                                  const std::string_view prefix,
                                  const notary::schema::account_id_t& account) {
  auto key = notary::schema::key::make_index_key(encoder, prefix, account);
  return state.get<std::vector<uint64_t>>(encoder, key)
      .value_or(std::vector<uint64_t>{});
}

inline void append(state_overlay& state,
                   encoder_t& encoder,
                   const std::string_view prefix,
                   const notary::schema::account_id_t& account,
                   const uint64_t id) {
  auto key = notary::schema::key::make_index_key(encoder, prefix, account);
  auto ids = state.get<std::vector<uint64_t>>(encoder, key)
                 .value_or(std::vector<uint64_t>{});
  ids.push_back(id);
  state.put(encoder, key, ids);
}

}  // namespace notary::execution::account_index
