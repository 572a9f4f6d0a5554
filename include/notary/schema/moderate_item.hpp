#pragma once

#include <notary/schema/primitives.hpp>

// Schema type: moderate item.
// Registry operation: a curator overwrites the verified and active flags.
namespace notary::schema {

template <uint16_t Version>
struct moderate_item;

template <>
struct moderate_item<1> final {
  uint16_t version{1};
  item_id_t item_id{};
  bool verified{};
  bool active{true};
};

using moderate_item_t = moderate_item<1>;

}  // namespace notary::schema
