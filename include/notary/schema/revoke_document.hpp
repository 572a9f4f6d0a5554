#pragma once

#include <notary/schema/primitives.hpp>

// Schema type: revoke document.
// Creator-only, pre-completion deactivation. The fee is not refunded.
namespace notary::schema {

template <uint16_t Version>
struct revoke_document;

template <>
struct revoke_document<1> final {
  uint16_t version{1};
  document_id_t document_id{};
};

using revoke_document_t = revoke_document<1>;

}  // namespace notary::schema
