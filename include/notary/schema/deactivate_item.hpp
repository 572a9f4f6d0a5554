#pragma once

#include <notary/schema/primitives.hpp>

// Schema type: deactivate item.
// Registry operation: the submitter withdraws its own item. One-directional.
namespace notary::schema {

template <uint16_t Version>
struct deactivate_item;

template <>
struct deactivate_item<1> final {
  uint16_t version{1};
  item_id_t item_id{};
};

using deactivate_item_t = deactivate_item<1>;

}  // namespace notary::schema
