#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/role_id.hpp>

namespace notary::schema {

template <uint16_t Version>
struct grant_role;

template <>
struct grant_role<1> final {
  uint16_t version{1};
  account_id_t account{};
  role_id_t role{role_id_t::curator};
};

using grant_role_t = grant_role<1>;

}  // namespace notary::schema
