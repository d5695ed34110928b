#pragma once

#include <vector>

#include "catalog/collection_definition.hpp"
#include "catalog/collection_definition_builder.hpp"
#include "catalog/field_definition.hpp"
#include "utils/json.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

// Schema document for storage clients:
//   {"name": ..., "containerMode": ..., "fields": [{"role", "propertyName",
//    "storageName", "type", "dimensions", "indexKind", "distanceFunction",
//    "isFullTextIndexed", "isFilterable"}, ...]}
// Vector attributes appear only on vector fields, data flags only on data fields.
void DumpFieldDefinitionToJson(const FieldDefinition& field, Json& json);

void DumpCollectionDefinitionToJson(const CollectionDefinition& definition, Json& json);

Status LoadFieldDefinitionFromJson(const Json& json, FieldDefinition& field);

// Hooks cannot be expressed in JSON; a container-mode definition loaded here
// uses the default row listing.
Status LoadCollectionDefinitionFromJson(const Json& json,
                                        const ValidationOptions& options,
                                        CollectionDefinitionPtr& response);

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
