#include "catalog/schema_extractor.hpp"

#include <cstdint>
#include <utility>

#include "utils/common_util.hpp"
#include "utils/status_utils.hpp"

namespace vecschema {
namespace engine {
namespace meta {

namespace {

constexpr const char* NAME = "name";
constexpr const char* TYPE = "type";
constexpr const char* DIMENSIONS = "dimensions";
constexpr const char* INDEX_KIND = "indexKind";
constexpr const char* DISTANCE_FUNCTION = "distanceFunction";
constexpr const char* IS_FULL_TEXT_INDEXED = "isFullTextIndexed";
constexpr const char* IS_FILTERABLE = "isFilterable";

Status RequireRole(const FieldDescriptor& descriptor, FieldRole role, FieldRole expected, const std::string& key) {
  if (role != expected) {
    return Status::SchemaError("Field '" + descriptor.name_ + "': metadata key '" + key + "' is not valid for a " +
                               FieldRoleToString(role) + " field.");
  }
  return Status::OK();
}

Status ParseFlag(const FieldDescriptor& descriptor, const std::string& key, const std::string& value, bool& flag) {
  if (!utils::CommonUtil::ParseBool(value, flag)) {
    return Status::SchemaError("Field '" + descriptor.name_ + "': " + key + " must be a boolean, got '" + value + "'.");
  }
  return Status::OK();
}

}  // namespace

Status SchemaExtractor::ExtractField(const FieldDescriptor& descriptor, FieldDefinition& response) {
  if (!descriptor.annotation_.has_value()) {
    return Status::SchemaError("Field '" + descriptor.name_ + "' has no annotation.");
  }
  const auto& annotation = *descriptor.annotation_;

  FieldDefinition field;
  auto status = ParseFieldRole(annotation.role_token_, field.role_);
  if (!status.ok()) {
    return Status::SchemaError("Field '" + descriptor.name_ + "': " + status.message());
  }
  field.property_name_ = descriptor.name_;
  field.default_factory_ = descriptor.default_factory_;

  bool explicit_type = false;
  for (const auto& [key, value] : annotation.metadata_) {
    if (key == NAME) {
      if (value.empty()) {
        return Status::SchemaError("Field '" + descriptor.name_ + "': name must not be empty.");
      }
      field.storage_name_ = value;
    } else if (key == TYPE) {
      status = ParseFieldType(value, field.role_, field.value_type_);
      if (!status.ok()) {
        return Status::SchemaError("Field '" + descriptor.name_ + "': " + status.message());
      }
      explicit_type = true;
    } else if (key == DIMENSIONS) {
      RETURN_IF_ERROR(RequireRole(descriptor, field.role_, FieldRole::VECTOR, key));
      int64_t dimensions = 0;
      if (!utils::CommonUtil::ParseInt(value, dimensions) || dimensions <= 0) {
        return Status::SchemaError("Field '" + descriptor.name_ + "': dimensions must be a positive integer, got '" +
                                   value + "'.");
      }
      field.dimensions_ = static_cast<size_t>(dimensions);
    } else if (key == INDEX_KIND) {
      RETURN_IF_ERROR(RequireRole(descriptor, field.role_, FieldRole::VECTOR, key));
      field.index_kind_ = value;
    } else if (key == DISTANCE_FUNCTION) {
      RETURN_IF_ERROR(RequireRole(descriptor, field.role_, FieldRole::VECTOR, key));
      field.distance_function_ = value;
    } else if (key == IS_FULL_TEXT_INDEXED) {
      RETURN_IF_ERROR(RequireRole(descriptor, field.role_, FieldRole::DATA, key));
      RETURN_IF_ERROR(ParseFlag(descriptor, key, value, field.is_full_text_indexed_));
    } else if (key == IS_FILTERABLE) {
      RETURN_IF_ERROR(RequireRole(descriptor, field.role_, FieldRole::DATA, key));
      RETURN_IF_ERROR(ParseFlag(descriptor, key, value, field.is_filterable_));
    } else {
      return Status::SchemaError("Field '" + descriptor.name_ + "': unrecognized metadata key '" + key + "'.");
    }
  }

  if (!explicit_type) {
    field.value_type_ = descriptor.declared_type_;
  } else if (descriptor.declared_type_ == FieldType::VECTOR_FLOAT_OR_STRING ||
             descriptor.declared_type_ == FieldType::VECTOR_DOUBLE_OR_STRING) {
    // The member can still carry the source text.
    field.value_type_ = WithSourceText(field.value_type_);
  }

  response = std::move(field);
  return Status::OK();
}

Status SchemaExtractor::ExtractFields(const std::vector<FieldDescriptor>& descriptors,
                                      std::vector<FieldDefinition>& response) {
  std::vector<FieldDefinition> fields;
  for (const auto& descriptor : descriptors) {
    if (!descriptor.annotation_.has_value()) {
      continue;
    }
    FieldDefinition field;
    RETURN_IF_ERROR(ExtractField(descriptor, field));
    fields.push_back(std::move(field));
  }
  response = std::move(fields);
  return Status::OK();
}

Status SchemaExtractor::Extract(const std::string& type_name,
                                const std::vector<FieldDescriptor>& descriptors,
                                const ValidationOptions& options,
                                CollectionDefinitionPtr& response) {
  std::vector<FieldDefinition> fields;
  RETURN_IF_ERROR(ExtractFields(descriptors, fields));
  return CollectionDefinitionBuilder(options).SetName(type_name).SetFields(fields).Build(response);
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
