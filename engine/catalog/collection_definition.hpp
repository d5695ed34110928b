#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "catalog/field_definition.hpp"
#include "utils/json.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

// Opaque bulk value (a table, a column batch, ...) owned by the application.
using Container = std::any;

// Rows are JSON objects keyed by storage name.
using ToContainerHook = std::function<Container(const std::vector<Json>& rows)>;
using FromContainerHook = std::function<std::vector<Json>(const Container& container)>;

class CollectionDefinition;

using CollectionDefinitionPtr = std::shared_ptr<const CollectionDefinition>;

/**
 * @brief Validated, immutable schema of a collection.
 *
 * Instances only come out of CollectionDefinitionBuilder::Build (directly or
 * through SchemaExtractor), so every instance satisfies the aggregate
 * invariants: exactly one key field, unique storage names, dimensions on every
 * vector field, and container hooks set as a pair.
 */
class CollectionDefinition {
 public:
  const std::string& Name() const { return name_; }

  // In backend declaration order.
  const std::vector<FieldDefinition>& Fields() const { return fields_; }

  const FieldDefinition& KeyField() const { return fields_[key_index_]; }

  const std::string& KeyName() const { return fields_[key_index_].storage_name_; }

  std::vector<const FieldDefinition*> DataFields() const;

  std::vector<const FieldDefinition*> VectorFields() const;

  // Looks up by storage name first, then by property name. nullptr if absent.
  const FieldDefinition* GetField(const std::string& name) const;

  std::vector<std::string> StorageNames(bool include_vectors = true) const;

  // Only fields bound to a record member.
  std::vector<std::string> PropertyNames() const;

  bool ContainerMode() const { return container_mode_; }

  bool HasContainerHooks() const { return static_cast<bool>(to_container_); }

  const ToContainerHook& GetToContainerHook() const { return to_container_; }

  const FromContainerHook& GetFromContainerHook() const { return from_container_; }

  // See ContainerAdapter.
  Status ToContainer(const std::vector<Json>& rows, Container& container) const;

  Status FromContainer(const Container& container, std::vector<Json>& rows, int64_t expected_rows = -1) const;

 private:
  friend class CollectionDefinitionBuilder;

  CollectionDefinition(std::string name,
                       std::vector<FieldDefinition> fields,
                       size_t key_index,
                       bool container_mode,
                       ToContainerHook to_container,
                       FromContainerHook from_container);

  std::string name_;
  std::vector<FieldDefinition> fields_;
  size_t key_index_ = 0;
  bool container_mode_ = false;
  ToContainerHook to_container_;
  FromContainerHook from_container_;
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
