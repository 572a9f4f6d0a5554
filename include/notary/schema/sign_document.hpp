#pragma once

#include <notary/schema/primitives.hpp>

namespace notary::schema {

template <uint16_t Version>
struct sign_document;

template <>
struct sign_document<1> final {
  uint16_t version{1};
  document_id_t document_id{};
};

using sign_document_t = sign_document<1>;

}  // namespace notary::schema
