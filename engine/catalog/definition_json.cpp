#include "catalog/definition_json.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

#include "utils/status_utils.hpp"

namespace vecschema {
namespace engine {
namespace meta {

namespace {

constexpr const char* NAME = "name";
constexpr const char* CONTAINER_MODE = "containerMode";
constexpr const char* FIELDS = "fields";
constexpr const char* ROLE = "role";
constexpr const char* PROPERTY_NAME = "propertyName";
constexpr const char* STORAGE_NAME = "storageName";
constexpr const char* TYPE = "type";
constexpr const char* DIMENSIONS = "dimensions";
constexpr const char* INDEX_KIND = "indexKind";
constexpr const char* DISTANCE_FUNCTION = "distanceFunction";
constexpr const char* IS_FULL_TEXT_INDEXED = "isFullTextIndexed";
constexpr const char* IS_FILTERABLE = "isFilterable";

Status CheckString(const Json& json, const char* key, const std::string& context) {
  if (json.HasMember(key) && !json.Get(key).IsString()) {
    return Status::SchemaError(context + ": " + key + " must be a string.");
  }
  return Status::OK();
}

Status CheckBool(const Json& json, const char* key, const std::string& context) {
  if (json.HasMember(key) && !json.Get(key).IsBool()) {
    return Status::SchemaError(context + ": " + key + " must be a boolean.");
  }
  return Status::OK();
}

}  // namespace

void DumpFieldDefinitionToJson(const FieldDefinition& field, Json& json) {
  json = Json::MakeObject();
  json.SetString(ROLE, FieldRoleToString(field.role_));
  if (!field.property_name_.empty()) {
    json.SetString(PROPERTY_NAME, field.property_name_);
  }
  json.SetString(STORAGE_NAME, field.StorageName());
  if (field.value_type_ != FieldType::UNKNOWN) {
    json.SetString(TYPE, FieldTypeToString(field.value_type_));
  }
  // Only vector fields have dimensions, index kind and distance function.
  if (field.role_ == FieldRole::VECTOR) {
    json.SetInt(DIMENSIONS, static_cast<int64_t>(field.dimensions_));
    if (!field.index_kind_.empty()) {
      json.SetString(INDEX_KIND, field.index_kind_);
    }
    if (!field.distance_function_.empty()) {
      json.SetString(DISTANCE_FUNCTION, field.distance_function_);
    }
  }
  // Only data fields have the indexing flags.
  if (field.role_ == FieldRole::DATA) {
    json.SetBool(IS_FULL_TEXT_INDEXED, field.is_full_text_indexed_);
    json.SetBool(IS_FILTERABLE, field.is_filterable_);
  }
}

void DumpCollectionDefinitionToJson(const CollectionDefinition& definition, Json& json) {
  json = Json::MakeObject();
  json.SetString(NAME, definition.Name());
  json.SetBool(CONTAINER_MODE, definition.ContainerMode());

  std::vector<Json> empty_array;
  json.SetArray(FIELDS, empty_array);
  for (const auto& field : definition.Fields()) {
    Json field_json;
    DumpFieldDefinitionToJson(field, field_json);
    json.AddObjectToArray(FIELDS, field_json);
  }
}

Status LoadFieldDefinitionFromJson(const Json& json, FieldDefinition& field) {
  if (!json.IsObject()) {
    return Status::SchemaError("Field definition must be an object.");
  }
  if (!json.Get(ROLE).IsString()) {
    return Status::SchemaError("Field definition needs a role.");
  }

  FieldDefinition result;
  RETURN_IF_ERROR(ParseFieldRole(json.GetString(ROLE), result.role_));
  std::string context = "Field '" + (json.HasMember(STORAGE_NAME) ? json.GetString(STORAGE_NAME)
                                                                   : json.GetString(PROPERTY_NAME)) + "'";

  for (const char* key : {PROPERTY_NAME, STORAGE_NAME, TYPE, INDEX_KIND, DISTANCE_FUNCTION}) {
    RETURN_IF_ERROR(CheckString(json, key, context));
  }
  for (const char* key : {IS_FULL_TEXT_INDEXED, IS_FILTERABLE}) {
    RETURN_IF_ERROR(CheckBool(json, key, context));
  }

  result.property_name_ = json.GetString(PROPERTY_NAME);
  result.storage_name_ = json.GetString(STORAGE_NAME);
  if (json.HasMember(TYPE)) {
    RETURN_IF_ERROR(ParseFieldType(json.GetString(TYPE), result.role_, result.value_type_));
  }

  if (result.role_ == FieldRole::VECTOR) {
    if (json.HasMember(DIMENSIONS)) {
      auto dimensions = json.Get(DIMENSIONS);
      if (!dimensions.IsInteger() || dimensions.GetInt() <= 0) {
        return Status::SchemaError(context + ": dimensions must be a positive integer.");
      }
      result.dimensions_ = static_cast<size_t>(dimensions.GetInt());
    }
    result.index_kind_ = json.GetString(INDEX_KIND);
    result.distance_function_ = json.GetString(DISTANCE_FUNCTION);
  }
  if (result.role_ == FieldRole::DATA) {
    result.is_full_text_indexed_ = json.GetBool(IS_FULL_TEXT_INDEXED);
    result.is_filterable_ = json.GetBool(IS_FILTERABLE);
  }

  field = std::move(result);
  return Status::OK();
}

Status LoadCollectionDefinitionFromJson(const Json& json,
                                        const ValidationOptions& options,
                                        CollectionDefinitionPtr& response) {
  if (!json.IsObject() || !json.Get(FIELDS).IsArray()) {
    return Status::SchemaError("Collection definition document needs a fields array.");
  }
  RETURN_IF_ERROR(CheckString(json, NAME, "Collection definition"));
  RETURN_IF_ERROR(CheckBool(json, CONTAINER_MODE, "Collection definition"));

  std::vector<FieldDefinition> fields;
  size_t fields_size = json.GetArraySize(FIELDS);
  for (size_t i = 0; i < fields_size; ++i) {
    FieldDefinition field;
    RETURN_IF_ERROR(LoadFieldDefinitionFromJson(json.GetArrayElement(FIELDS, i), field));
    fields.push_back(std::move(field));
  }

  return CollectionDefinitionBuilder(options)
      .SetName(json.GetString(NAME))
      .SetContainerMode(json.GetBool(CONTAINER_MODE))
      .SetFields(fields)
      .Build(response);
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
