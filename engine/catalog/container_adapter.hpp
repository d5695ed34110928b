#pragma once

#include <cstdint>
#include <vector>

#include "catalog/collection_definition.hpp"
#include "logger/logger.hpp"
#include "utils/json.hpp"
#include "utils/status.hpp"

namespace vecschema {
namespace engine {
namespace meta {

/**
 * @brief Converts between row mappings and one bulk container value.
 *
 * Only valid for container-mode definitions. Rows are JSON objects keyed by
 * storage name; each row may only carry storage names of the definition and
 * must carry the key. Without hooks the container holds the row vector itself.
 *
 * Failures are SERIALIZATION_ERROR; when the offending row is known the
 * message starts with "Row <index>:".
 */
class ContainerAdapter {
 public:
  explicit ContainerAdapter(const CollectionDefinition& definition) : definition_(definition) {}

  Status ToContainer(const std::vector<Json>& rows, Container& container) const;

  // When expected_rows >= 0 the number of rows coming back must match it.
  Status FromContainer(const Container& container, std::vector<Json>& rows, int64_t expected_rows = -1) const;

  Status ValidateRow(const Json& row, size_t row_index) const;

 private:
  Status CheckContainerMode() const;

  const CollectionDefinition& definition_;
  Logger logger_{"container"};
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
