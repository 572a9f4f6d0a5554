#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/role_id.hpp>

namespace notary::schema {

template <uint16_t Version>
struct revoke_role;

template <>
struct revoke_role<1> final {
  uint16_t version{1};
  account_id_t account{};
  role_id_t role{role_id_t::curator};
};

using revoke_role_t = revoke_role<1>;

}  // namespace notary::schema
