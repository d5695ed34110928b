#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "catalog/meta_types.hpp"
#include "utils/json.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

// Produces a fresh default value each time a record is constructed with the
// field omitted.
using DefaultFactory = std::function<Json()>;

struct FieldDefinition {
  FieldRole role_ = FieldRole::DATA;
  std::string property_name_;  // member name on the record type, empty for tabular definitions
  std::string storage_name_;   // name in the backing store, falls back to property_name_
  FieldType value_type_ = FieldType::UNKNOWN;

  // Only vector fields have dimensions_, index_kind_ and distance_function_.
  size_t dimensions_ = DEFAULT_VECTOR_DIMENSION;
  std::string index_kind_;
  std::string distance_function_;

  // Only data fields have these flags.
  bool is_full_text_indexed_ = false;
  bool is_filterable_ = false;

  DefaultFactory default_factory_;

  const std::string& StorageName() const {
    return storage_name_.empty() ? property_name_ : storage_name_;
  }

  bool HasDefault() const {
    return static_cast<bool>(default_factory_);
  }
};

FieldDefinition MakeKeyField(const std::string& storage_name, FieldType value_type = FieldType::UNKNOWN);

FieldDefinition MakeDataField(const std::string& storage_name,
                              FieldType value_type = FieldType::UNKNOWN,
                              bool is_full_text_indexed = false,
                              bool is_filterable = false);

FieldDefinition MakeVectorField(const std::string& storage_name,
                                size_t dimensions,
                                FieldType value_type = FieldType::VECTOR_FLOAT,
                                const std::string& index_kind = "",
                                const std::string& distance_function = "");

// Wraps a constant into a factory that hands out a copy per call.
DefaultFactory MakeDefaultValue(const Json& value);

Status ParseFieldRole(const std::string& token, FieldRole& role);

// For vector fields the element tokens "float" and "double" name a dense
// vector of that element type.
Status ParseFieldType(const std::string& token, FieldRole role, FieldType& type);

std::string FieldRoleToString(FieldRole role);

std::string FieldTypeToString(FieldType type);

bool IsIntegerType(FieldType type);

// Dense, sparse and vector-or-text types.
bool IsVectorType(FieldType type);

// VECTOR_FLOAT -> VECTOR_FLOAT_OR_STRING, VECTOR_DOUBLE -> VECTOR_DOUBLE_OR_STRING,
// anything else unchanged.
constexpr FieldType WithSourceText(FieldType type) {
  return type == FieldType::VECTOR_FLOAT    ? FieldType::VECTOR_FLOAT_OR_STRING
         : type == FieldType::VECTOR_DOUBLE ? FieldType::VECTOR_DOUBLE_OR_STRING
                                            : type;
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
