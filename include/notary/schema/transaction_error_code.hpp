#pragma once

#include <cstdint>
#include <string_view>

namespace notary::schema {

enum class transaction_error_code : uint32_t {
  // Envelope admission.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  chain_not_initialized = 5,
  unexpected_value = 6,
  // Operation preconditions.
  unauthorized = 10,
  not_required_signer = 11,
  not_found = 12,
  document_inactive = 13,
  invalid_input = 14,
  invalid_account = 15,
  already_granted = 16,
  not_granted = 17,
  already_inactive = 18,
  already_completed = 19,
  already_signed = 20,
  insufficient_fee = 21,
  reentrant = 22,
  transfer_rejected = 23,
};

/// Coarse failure class. Callers use it to tell "retrying will not help"
/// (unauthorized, invalid_state) from "adjust and retry" (invalid_input,
/// insufficient_fee).
enum class error_category : uint8_t {
  none = 0,
  envelope,
  unauthorized,
  not_found,
  invalid_input,
  invalid_state,
  insufficient_fee,
  reentrant,
  transfer_failed
};

constexpr error_category category_of(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
    case transaction_error_code::unsupported_transaction_version:
    case transaction_error_code::invalid_chain_id:
    case transaction_error_code::invalid_nonce:
    case transaction_error_code::chain_not_initialized:
      return error_category::envelope;
    case transaction_error_code::unauthorized:
    case transaction_error_code::not_required_signer:
      return error_category::unauthorized;
    case transaction_error_code::not_found:
    case transaction_error_code::document_inactive:
      return error_category::not_found;
    case transaction_error_code::unexpected_value:
    case transaction_error_code::invalid_input:
    case transaction_error_code::invalid_account:
      return error_category::invalid_input;
    case transaction_error_code::already_granted:
    case transaction_error_code::not_granted:
    case transaction_error_code::already_inactive:
    case transaction_error_code::already_completed:
    case transaction_error_code::already_signed:
      return error_category::invalid_state;
    case transaction_error_code::insufficient_fee:
      return error_category::insufficient_fee;
    case transaction_error_code::reentrant:
      return error_category::reentrant;
    case transaction_error_code::transfer_rejected:
      return error_category::transfer_failed;
  }
  return error_category::none;
}

constexpr error_category category_of(const uint32_t code) {
  if (code == 0) {
    return error_category::none;
  }
  return category_of(static_cast<transaction_error_code>(code));
}

constexpr std::string_view to_string(const error_category value) {
  switch (value) {
    case error_category::none:
      return "none";
    case error_category::envelope:
      return "envelope";
    case error_category::unauthorized:
      return "unauthorized";
    case error_category::not_found:
      return "not_found";
    case error_category::invalid_input:
      return "invalid_input";
    case error_category::invalid_state:
      return "invalid_state";
    case error_category::insufficient_fee:
      return "insufficient_fee";
    case error_category::reentrant:
      return "reentrant";
    case error_category::transfer_failed:
      return "transfer_failed";
  }
  return "unknown";
}

}  // namespace notary::schema
