#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger event type.
// One value per state transition record the engine emits.
namespace notary::schema {

enum class ledger_event_type_t : uint8_t {
  role_granted = 0,
  role_revoked = 1,
  ownership_transferred = 2,
  item_registered = 3,
  item_status_updated = 4,
  document_created = 5,
  document_signed = 6,
  document_completed = 7,
  document_revoked = 8
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    std::pair<std::string_view, ledger_event_type_t>{
        "RoleGranted", ledger_event_type_t::role_granted},
    std::pair<std::string_view, ledger_event_type_t>{
        "RoleRevoked", ledger_event_type_t::role_revoked},
    std::pair<std::string_view, ledger_event_type_t>{
        "OwnershipTransferred", ledger_event_type_t::ownership_transferred},
    std::pair<std::string_view, ledger_event_type_t>{
        "ItemRegistered", ledger_event_type_t::item_registered},
    std::pair<std::string_view, ledger_event_type_t>{
        "ItemStatusUpdated", ledger_event_type_t::item_status_updated},
    std::pair<std::string_view, ledger_event_type_t>{
        "DocumentCreated", ledger_event_type_t::document_created},
    std::pair<std::string_view, ledger_event_type_t>{
        "DocumentSigned", ledger_event_type_t::document_signed},
    std::pair<std::string_view, ledger_event_type_t>{
        "DocumentCompleted", ledger_event_type_t::document_completed},
    std::pair<std::string_view, ledger_event_type_t>{
        "DocumentRevoked", ledger_event_type_t::document_revoked},
};

template <>
inline std::optional<ledger_event_type_t> try_from_string<ledger_event_type_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("unknown");
}

}  // namespace notary::schema
