#pragma once

#include <notary/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Capability enum gating role administration (admin) and item moderation
// (curator).
namespace notary::schema {

enum class role_id_t : uint8_t { admin = 0, curator = 1 };

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"curator", role_id_t::curator},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

inline constexpr bool is_known_role(const role_id_t value) {
  return to_string(value, kRoleIdMappings).has_value();
}

}  // namespace notary::schema
