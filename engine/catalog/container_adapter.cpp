#include "catalog/container_adapter.hpp"

#include <any>
#include <exception>
#include <string>
#include <utility>

#include "utils/status_utils.hpp"

namespace vecschema {
namespace engine {
namespace meta {

namespace {

std::string RowPrefix(size_t row_index) {
  return "Row " + std::to_string(row_index) + ": ";
}

}  // namespace

Status ContainerAdapter::CheckContainerMode() const {
  if (!definition_.ContainerMode()) {
    return Status::SerializationError("Collection definition '" + definition_.Name() + "' is not in container mode.");
  }
  return Status::OK();
}

Status ContainerAdapter::ValidateRow(const Json& row, size_t row_index) const {
  if (!row.IsObject()) {
    return Status::SerializationError(RowPrefix(row_index) + "row is not an object.");
  }
  for (const auto& key : row.GetKeys()) {
    const auto* field = definition_.GetField(key);
    if (field == nullptr || field->storage_name_ != key) {
      return Status::SerializationError(RowPrefix(row_index) + "unknown field '" + key + "'.");
    }
  }
  if (!row.HasMember(definition_.KeyName())) {
    return Status::SerializationError(RowPrefix(row_index) + "missing key field '" + definition_.KeyName() + "'.");
  }
  return Status::OK();
}

Status ContainerAdapter::ToContainer(const std::vector<Json>& rows, Container& container) const {
  RETURN_IF_ERROR(CheckContainerMode());
  for (size_t i = 0; i < rows.size(); ++i) {
    RETURN_IF_ERROR(ValidateRow(rows[i], i));
  }

  if (!definition_.HasContainerHooks()) {
    container = rows;
    return Status::OK();
  }

  try {
    container = definition_.GetToContainerHook()(rows);
  } catch (const std::exception& e) {
    auto status = ExceptionToStatus(e, SERIALIZATION_ERROR, "toContainer hook failed");
    logger_.Error("Collection '" + definition_.Name() + "': " + status.message());
    return status;
  } catch (...) {
    auto status = Status::SerializationError("toContainer hook failed: unknown exception");
    logger_.Error("Collection '" + definition_.Name() + "': " + status.message());
    return status;
  }
  return Status::OK();
}

Status ContainerAdapter::FromContainer(const Container& container,
                                       std::vector<Json>& rows,
                                       int64_t expected_rows) const {
  RETURN_IF_ERROR(CheckContainerMode());

  std::vector<Json> result;
  if (!definition_.HasContainerHooks()) {
    const auto* listed = std::any_cast<std::vector<Json>>(&container);
    if (listed == nullptr) {
      return Status::SerializationError("Container does not hold a row list.");
    }
    result = *listed;
  } else {
    try {
      result = definition_.GetFromContainerHook()(container);
    } catch (const std::exception& e) {
      auto status = ExceptionToStatus(e, SERIALIZATION_ERROR, "fromContainer hook failed");
      logger_.Error("Collection '" + definition_.Name() + "': " + status.message());
      return status;
    } catch (...) {
      auto status = Status::SerializationError("fromContainer hook failed: unknown exception");
      logger_.Error("Collection '" + definition_.Name() + "': " + status.message());
      return status;
    }
  }

  if (expected_rows >= 0 && result.size() != static_cast<size_t>(expected_rows)) {
    return Status::SerializationError("Container produced " + std::to_string(result.size()) +
                                      " rows, expected " + std::to_string(expected_rows) + ".");
  }
  for (size_t i = 0; i < result.size(); ++i) {
    RETURN_IF_ERROR(ValidateRow(result[i], i));
  }

  rows = std::move(result);
  return Status::OK();
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
