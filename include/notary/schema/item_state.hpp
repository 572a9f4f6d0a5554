#pragma once

#include <notary/schema/primitives.hpp>
#include <string>

// Schema type: item state.
// Registry row. submitter, uri, category and created_at never change after
// registration; the two flags are the only mutable fields.
namespace notary::schema {

template <uint16_t Version>
struct item_state;

template <>
struct item_state<1> final {
  uint16_t version{1};
  item_id_t item_id{};
  account_id_t submitter{};
  std::string uri;
  std::string category;
  timestamp_milliseconds_t created_at{};
  bool is_verified{};
  bool is_active{true};
};

using item_state_t = item_state<1>;

}  // namespace notary::schema
