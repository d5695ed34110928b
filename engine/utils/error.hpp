#pragma once

#include <cstdint>
#include <string>

namespace vecschema {

using ErrorCode = int32_t;

constexpr ErrorCode SUCCESS = 0;
constexpr ErrorCode CATALOG_ERROR_CODE_BASE = 50000;

constexpr ErrorCode ToCatalogErrorCode(const int32_t error_code) {
  return CATALOG_ERROR_CODE_BASE + error_code;
}

// catalog error code
constexpr ErrorCode UNEXPECTED_ERROR = ToCatalogErrorCode(1);
// Malformed or unrecognized role / metadata token on a field declaration.
constexpr ErrorCode SCHEMA_ERROR = ToCatalogErrorCode(2);
// Aggregate invariant of a collection definition is violated.
constexpr ErrorCode VALIDATION_ERROR = ToCatalogErrorCode(3);
// Row / container conversion failed.
constexpr ErrorCode SERIALIZATION_ERROR = ToCatalogErrorCode(4);
constexpr ErrorCode DEFINITION_ALREADY_EXISTS = ToCatalogErrorCode(5);

}  // namespace vecschema
