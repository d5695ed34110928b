#include "catalog/field_definition.hpp"

#include "utils/common_util.hpp"

namespace vecschema {
namespace engine {
namespace meta {

FieldDefinition MakeKeyField(const std::string& storage_name, FieldType value_type) {
  FieldDefinition field;
  field.role_ = FieldRole::KEY;
  field.storage_name_ = storage_name;
  field.value_type_ = value_type;
  return field;
}

FieldDefinition MakeDataField(const std::string& storage_name,
                              FieldType value_type,
                              bool is_full_text_indexed,
                              bool is_filterable) {
  FieldDefinition field;
  field.role_ = FieldRole::DATA;
  field.storage_name_ = storage_name;
  field.value_type_ = value_type;
  field.is_full_text_indexed_ = is_full_text_indexed;
  field.is_filterable_ = is_filterable;
  return field;
}

FieldDefinition MakeVectorField(const std::string& storage_name,
                                size_t dimensions,
                                FieldType value_type,
                                const std::string& index_kind,
                                const std::string& distance_function) {
  FieldDefinition field;
  field.role_ = FieldRole::VECTOR;
  field.storage_name_ = storage_name;
  field.value_type_ = value_type;
  field.dimensions_ = dimensions;
  field.index_kind_ = index_kind;
  field.distance_function_ = distance_function;
  return field;
}

DefaultFactory MakeDefaultValue(const Json& value) {
  return [value]() { return value; };
}

Status ParseFieldRole(const std::string& token, FieldRole& role) {
  auto it = fieldRoleMap.find(utils::CommonUtil::ToLowerCase(token));
  if (it == fieldRoleMap.end()) {
    return Status::SchemaError("Unrecognized field role: '" + token + "', expected key, data or vector.");
  }
  role = it->second;
  return Status::OK();
}

Status ParseFieldType(const std::string& token, FieldRole role, FieldType& type) {
  auto lower = utils::CommonUtil::ToLowerCase(token);
  if (role == FieldRole::VECTOR) {
    if (lower == "float") {
      type = FieldType::VECTOR_FLOAT;
      return Status::OK();
    }
    if (lower == "double") {
      type = FieldType::VECTOR_DOUBLE;
      return Status::OK();
    }
  }
  auto it = fieldTypeMap.find(lower);
  if (it == fieldTypeMap.end()) {
    return Status::SchemaError("Unrecognized field type: '" + token + "'.");
  }
  type = it->second;
  return Status::OK();
}

std::string FieldRoleToString(FieldRole role) {
  switch (role) {
    case FieldRole::KEY:
      return "key";
    case FieldRole::DATA:
      return "data";
    case FieldRole::VECTOR:
      return "vector";
  }
  return "unknown";
}

std::string FieldTypeToString(FieldType type) {
  switch (type) {
    case FieldType::INT1:
      return "TINYINT";
    case FieldType::INT2:
      return "SMALLINT";
    case FieldType::INT4:
      return "INT";
    case FieldType::INT8:
      return "BIGINT";
    case FieldType::FLOAT:
      return "FLOAT";
    case FieldType::DOUBLE:
      return "DOUBLE";
    case FieldType::STRING:
      return "STRING";
    case FieldType::BOOL:
      return "BOOL";
    case FieldType::JSON:
      return "JSON";
    case FieldType::VECTOR_FLOAT:
      return "VECTOR_FLOAT";
    case FieldType::VECTOR_DOUBLE:
      return "VECTOR_DOUBLE";
    case FieldType::VECTOR_FLOAT_OR_STRING:
      return "VECTOR_FLOAT_OR_STRING";
    case FieldType::VECTOR_DOUBLE_OR_STRING:
      return "VECTOR_DOUBLE_OR_STRING";
    case FieldType::SPARSE_VECTOR_FLOAT:
      return "SPARSE_VECTOR_FLOAT";
    case FieldType::SPARSE_VECTOR_DOUBLE:
      return "SPARSE_VECTOR_DOUBLE";
    case FieldType::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

bool IsIntegerType(FieldType type) {
  return type == FieldType::INT1 ||
         type == FieldType::INT2 ||
         type == FieldType::INT4 ||
         type == FieldType::INT8;
}

bool IsVectorType(FieldType type) {
  return type == FieldType::VECTOR_FLOAT ||
         type == FieldType::VECTOR_DOUBLE ||
         type == FieldType::VECTOR_FLOAT_OR_STRING ||
         type == FieldType::VECTOR_DOUBLE_OR_STRING ||
         type == FieldType::SPARSE_VECTOR_FLOAT ||
         type == FieldType::SPARSE_VECTOR_DOUBLE;
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
