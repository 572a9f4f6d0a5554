#pragma once

#include <notary/schema/primitives.hpp>

// Schema type: withdraw fees.
// Owner sweeps the whole treasury balance to its own account.
namespace notary::schema {

template <uint16_t Version>
struct withdraw_fees;

template <>
struct withdraw_fees<1> final {
  uint16_t version{1};
};

using withdraw_fees_t = withdraw_fees<1>;

}  // namespace notary::schema
