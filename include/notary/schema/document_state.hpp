#pragma once

#include <notary/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: document state.
// Attestation row. required_signers is fixed at creation; signatures is an
// append-only set kept in signing order, and signature_count mirrors its size
// so completion is a single comparison.
namespace notary::schema {

template <uint16_t Version>
struct document_state;

template <>
struct document_state<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  std::string document_hash;
  account_id_t creator{};
  timestamp_milliseconds_t created_at{};
  std::vector<account_id_t> required_signers;
  std::vector<account_id_t> signatures;
  uint32_t signature_count{};
  bool is_active{true};
  bool is_completed{};
};

using document_state_t = document_state<1>;

}  // namespace notary::schema
