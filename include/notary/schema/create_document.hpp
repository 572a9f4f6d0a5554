#pragma once

#include <notary/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: create document.
// Attestation operation: the creator pays the storage fee (transaction value)
// and names the signers whose attestations complete the document.
namespace notary::schema {

template <uint16_t Version>
struct create_document;

template <>
struct create_document<1> final {
  uint16_t version{1};
  std::string document_hash;
  std::vector<account_id_t> required_signers;
};

using create_document_t = create_document<1>;

}  // namespace notary::schema
