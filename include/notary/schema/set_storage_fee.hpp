#pragma once

#include <notary/schema/primitives.hpp>

namespace notary::schema {

template <uint16_t Version>
struct set_storage_fee;

template <>
struct set_storage_fee<1> final {
  uint16_t version{1};
  amount_t fee;
};

using set_storage_fee_t = set_storage_fee<1>;

}  // namespace notary::schema
