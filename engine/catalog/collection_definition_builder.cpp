#include "catalog/collection_definition_builder.hpp"

#include <unordered_set>
#include <utility>

#include "utils/common_util.hpp"

namespace vecschema {
namespace engine {
namespace meta {

namespace {

bool IsValidKeyType(FieldType type) {
  return IsIntegerType(type) || type == FieldType::STRING || type == FieldType::UNKNOWN;
}

// A vector field holds the embedding, the text it will be computed from, or both.
bool IsValidVectorFieldType(FieldType type) {
  return IsVectorType(type) || type == FieldType::STRING || type == FieldType::UNKNOWN;
}

}  // namespace

Status ValidateFields(const std::vector<FieldDefinition>& fields,
                      const ValidationOptions& options,
                      size_t& key_index) {
  std::unordered_set<std::string> seen_storage_names;
  std::unordered_set<std::string> seen_property_names;

  bool has_key_field = false;
  bool has_vector_field = false;

  for (size_t i = 0; i < fields.size(); i++) {
    const auto& field = fields[i];
    const auto& name = field.StorageName();

    // 1. Every field needs a name.
    if (name.empty()) {
      return Status::ValidationError("Field at position " + std::to_string(i) + " has no name.");
    }

    if (options.strict_storage_names_ && !utils::CommonUtil::IsValidName(name)) {
      return Status::ValidationError("Invalid storage name '" + name +
                                     "': it should start with a letter or '_' and can contain only letters, digits, and underscores.");
    }

    // 2. Storage names and property names are unique.
    if (!seen_storage_names.insert(name).second) {
      return Status::ValidationError("Collection definition has a duplicate storage name '" + name + "'.");
    }
    if (!field.property_name_.empty() && !seen_property_names.insert(field.property_name_).second) {
      return Status::ValidationError("Collection definition has a duplicate property name '" + field.property_name_ + "'.");
    }

    switch (field.role_) {
      case FieldRole::KEY:
        // 3. Exactly one key field of integer or string type.
        if (has_key_field) {
          return Status::ValidationError("Collection definition has multiple key fields: '" +
                                         fields[key_index].StorageName() + "' and '" + name + "'.");
        }
        if (!IsValidKeyType(field.value_type_)) {
          return Status::ValidationError("Key field '" + name + "' must be an integer or string type, got " +
                                         FieldTypeToString(field.value_type_) + ".");
        }
        has_key_field = true;
        key_index = i;
        break;
      case FieldRole::VECTOR:
        // 4. Vector fields must declare a positive dimension; it is never guessed.
        if (field.dimensions_ == 0) {
          return Status::ValidationError("Vector field '" + name + "' missing dimensions.");
        }
        if (!IsValidVectorFieldType(field.value_type_)) {
          return Status::ValidationError("Vector field '" + name + "' must hold a vector or text value type, got " +
                                         FieldTypeToString(field.value_type_) + ".");
        }
        has_vector_field = true;
        break;
      case FieldRole::DATA:
        break;
    }
  }

  if (!has_key_field) {
    return Status::ValidationError("Collection definition has no key field.");
  }

  if (options.require_vector_field_ && !has_vector_field) {
    return Status::ValidationError("Collection definition needs at least one vector field.");
  }

  return Status::OK();
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::SetName(const std::string& name) {
  name_ = name;
  return *this;
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::AddField(const FieldDefinition& field) {
  fields_.push_back(field);
  return *this;
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::SetFields(const std::vector<FieldDefinition>& fields) {
  fields_ = fields;
  return *this;
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::SetContainerMode(bool container_mode) {
  container_mode_ = container_mode;
  return *this;
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::SetContainerHooks(ToContainerHook to_container,
                                                                            FromContainerHook from_container) {
  to_container_ = std::move(to_container);
  from_container_ = std::move(from_container);
  return *this;
}

CollectionDefinitionBuilder& CollectionDefinitionBuilder::SetValidationOptions(const ValidationOptions& options) {
  options_ = options;
  return *this;
}

Status CollectionDefinitionBuilder::Build(CollectionDefinitionPtr& response) const {
  std::vector<FieldDefinition> fields(fields_);
  for (auto& field : fields) {
    if (field.storage_name_.empty()) {
      field.storage_name_ = field.property_name_;
    }
  }

  size_t key_index = 0;
  auto status = ValidateFields(fields, options_, key_index);
  if (status.ok() && static_cast<bool>(to_container_) != static_cast<bool>(from_container_)) {
    status = Status::ValidationError("Container hooks must be set together: toContainer and fromContainer.");
  }
  if (status.ok() && to_container_ && !container_mode_) {
    status = Status::ValidationError("Container hooks require container mode.");
  }
  if (!status.ok()) {
    logger_.Debug("Rejected collection definition '" + name_ + "': " + status.message());
    return status;
  }

  response = CollectionDefinitionPtr(new CollectionDefinition(
      name_, std::move(fields), key_index, container_mode_, to_container_, from_container_));
  return Status::OK();
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
