#pragma once

#include <cstdint>

// Schema type: query error code.
// Read-path failure taxonomy: stable numeric codes for query diagnostics.
namespace notary::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace notary::schema
