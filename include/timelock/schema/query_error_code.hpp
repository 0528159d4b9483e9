#pragma once

#include <cstdint>

// Schema type: query error code.
// Read path failure taxonomy with stable numeric codes.
namespace timelock::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace timelock::schema
