#include "catalog/collection_definition.hpp"

#include <utility>

#include "catalog/container_adapter.hpp"

namespace vecschema {
namespace engine {
namespace meta {

CollectionDefinition::CollectionDefinition(std::string name,
                                           std::vector<FieldDefinition> fields,
                                           size_t key_index,
                                           bool container_mode,
                                           ToContainerHook to_container,
                                           FromContainerHook from_container)
    : name_(std::move(name)),
      fields_(std::move(fields)),
      key_index_(key_index),
      container_mode_(container_mode),
      to_container_(std::move(to_container)),
      from_container_(std::move(from_container)) {}

std::vector<const FieldDefinition*> CollectionDefinition::DataFields() const {
  std::vector<const FieldDefinition*> result;
  for (const auto& field : fields_) {
    if (field.role_ == FieldRole::DATA) {
      result.push_back(&field);
    }
  }
  return result;
}

std::vector<const FieldDefinition*> CollectionDefinition::VectorFields() const {
  std::vector<const FieldDefinition*> result;
  for (const auto& field : fields_) {
    if (field.role_ == FieldRole::VECTOR) {
      result.push_back(&field);
    }
  }
  return result;
}

const FieldDefinition* CollectionDefinition::GetField(const std::string& name) const {
  for (const auto& field : fields_) {
    if (field.storage_name_ == name) {
      return &field;
    }
  }
  for (const auto& field : fields_) {
    if (!field.property_name_.empty() && field.property_name_ == name) {
      return &field;
    }
  }
  return nullptr;
}

std::vector<std::string> CollectionDefinition::StorageNames(bool include_vectors) const {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto& field : fields_) {
    if (!include_vectors && field.role_ == FieldRole::VECTOR) {
      continue;
    }
    names.push_back(field.storage_name_);
  }
  return names;
}

std::vector<std::string> CollectionDefinition::PropertyNames() const {
  std::vector<std::string> names;
  for (const auto& field : fields_) {
    if (!field.property_name_.empty()) {
      names.push_back(field.property_name_);
    }
  }
  return names;
}

Status CollectionDefinition::ToContainer(const std::vector<Json>& rows, Container& container) const {
  return ContainerAdapter(*this).ToContainer(rows, container);
}

Status CollectionDefinition::FromContainer(const Container& container,
                                           std::vector<Json>& rows,
                                           int64_t expected_rows) const {
  return ContainerAdapter(*this).FromContainer(container, rows, expected_rows);
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
