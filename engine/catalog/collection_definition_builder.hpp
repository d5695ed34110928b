#pragma once

#include <string>
#include <vector>

#include "catalog/collection_definition.hpp"
#include "catalog/field_definition.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

struct ValidationOptions {
  // Reject definitions without any vector field.
  bool require_vector_field_ = true;
  // Storage names must start with a letter or '_' and contain only letters, digits and '_'.
  bool strict_storage_names_ = false;
};

// Checks the aggregate invariants of an ordered field list. Storage names are
// expected to be resolved already (see CollectionDefinitionBuilder::Build).
// On success key_index receives the position of the key field.
Status ValidateFields(const std::vector<FieldDefinition>& fields,
                      const ValidationOptions& options,
                      size_t& key_index);

/**
 * @brief Manual construction path for collection definitions.
 *
 * Used for record shapes that do not describe themselves, such as generic
 * tables whose rows share one definition. SchemaExtractor funnels through the
 * same Build(), so both paths apply identical validation.
 */
class CollectionDefinitionBuilder {
 public:
  CollectionDefinitionBuilder() = default;
  explicit CollectionDefinitionBuilder(const ValidationOptions& options) : options_(options) {}

  CollectionDefinitionBuilder& SetName(const std::string& name);

  CollectionDefinitionBuilder& AddField(const FieldDefinition& field);

  CollectionDefinitionBuilder& SetFields(const std::vector<FieldDefinition>& fields);

  CollectionDefinitionBuilder& SetContainerMode(bool container_mode);

  CollectionDefinitionBuilder& SetContainerHooks(ToContainerHook to_container, FromContainerHook from_container);

  CollectionDefinitionBuilder& SetValidationOptions(const ValidationOptions& options);

  Status Build(CollectionDefinitionPtr& response) const;

 private:
  std::string name_;
  std::vector<FieldDefinition> fields_;
  bool container_mode_ = false;
  ToContainerHook to_container_;
  FromContainerHook from_container_;
  ValidationOptions options_;
  Logger logger_{"catalog"};
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
