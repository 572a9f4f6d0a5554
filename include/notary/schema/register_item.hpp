#pragma once

#include <notary/schema/primitives.hpp>
#include <string>

// Schema type: register item.
// Registry operation: any caller submits an off-chain content reference for
// curator review.
namespace notary::schema {

template <uint16_t Version>
struct register_item;

template <>
struct register_item<1> final {
  uint16_t version{1};
  std::string uri;
  std::string category;
};

using register_item_t = register_item<1>;

}  // namespace notary::schema
