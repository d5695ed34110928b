#pragma once

#include <string>
#include <vector>

#include "catalog/collection_definition.hpp"
#include "catalog/collection_definition_builder.hpp"
#include "catalog/field_definition.hpp"
#include "catalog/record_descriptor.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

/**
 * @brief Derives a collection definition from a record type's field listing.
 *
 * Members without an annotation are skipped. Annotation tokens that cannot be
 * parsed fail with SCHEMA_ERROR; the assembled field list then goes through
 * CollectionDefinitionBuilder, whose invariant checks fail with
 * VALIDATION_ERROR. Extraction is pure, so DefinitionRegistry caches it.
 */
class SchemaExtractor {
 public:
  static Status ExtractFields(const std::vector<FieldDescriptor>& descriptors, std::vector<FieldDefinition>& response);

  static Status ExtractField(const FieldDescriptor& descriptor, FieldDefinition& response);

  static Status Extract(const std::string& type_name,
                        const std::vector<FieldDescriptor>& descriptors,
                        const ValidationOptions& options,
                        CollectionDefinitionPtr& response);

  template <typename Record>
  static Status Extract(const ValidationOptions& options, CollectionDefinitionPtr& response) {
    auto descriptor = Record::DescribeFields();
    return Extract(descriptor.TypeName(), descriptor.Fields(), options, response);
  }
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
