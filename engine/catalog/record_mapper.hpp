#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "catalog/collection_definition.hpp"
#include "catalog/field_definition.hpp"
#include "catalog/record_descriptor.hpp"
#include "utils/json.hpp"
#include "utils/status.hpp"
#include "utils/status_utils.hpp"

namespace vecschema {
namespace engine {
namespace meta {

/**
 * @brief Moves values between typed records and row mappings.
 *
 * Rows are keyed by storage name and list the schema fields in definition
 * order; members without an annotation never appear in a row. When a row
 * omits a member, the record keeps its own initializer unless the field
 * declares a default factory, which then runs once for that record. The key
 * must be present unless its field has a default factory.
 */
template <typename Record>
class RecordMapper {
 public:
  explicit RecordMapper(CollectionDefinitionPtr definition)
      : RecordMapper(std::move(definition), Record::DescribeFields()) {}

  RecordMapper(CollectionDefinitionPtr definition, RecordDescriptor<Record> descriptor)
      : definition_(std::move(definition)), descriptor_(std::move(descriptor)) {
    Bind();
  }

  // Not OK when the definition does not match the record's descriptor.
  const Status& status() const { return status_; }

  Status SerializeRecord(const Record& record, Json& row) const {
    if (!status_.ok()) {
      return status_;
    }
    Json result = Json::MakeObject();
    for (const auto& binding : bindings_) {
      result.SetObject(binding.field_->storage_name_, descriptor_.Accessors()[binding.accessor_index_].read_(record));
    }
    row = std::move(result);
    return Status::OK();
  }

  Status Serialize(const std::vector<Record>& records, std::vector<Json>& rows) const {
    std::vector<Json> result;
    result.reserve(records.size());
    for (const auto& record : records) {
      Json row;
      RETURN_IF_ERROR(SerializeRecord(record, row));
      result.push_back(std::move(row));
    }
    rows = std::move(result);
    return Status::OK();
  }

  Status DeserializeRecord(const Json& row, size_t row_index, Record& record) const {
    if (!status_.ok()) {
      return status_;
    }
    const std::string prefix = "Row " + std::to_string(row_index) + ": ";
    if (!row.IsObject()) {
      return Status::SerializationError(prefix + "row is not an object.");
    }
    for (const auto& key : row.GetKeys()) {
      const auto* field = definition_->GetField(key);
      if (field == nullptr || field->storage_name_ != key) {
        return Status::SerializationError(prefix + "unknown field '" + key + "'.");
      }
    }

    Record result{};
    for (const auto& binding : bindings_) {
      const auto& field = *binding.field_;
      const auto& accessor = descriptor_.Accessors()[binding.accessor_index_];
      if (row.HasMember(field.storage_name_)) {
        if (!accessor.write_(row.Get(field.storage_name_), result)) {
          return Status::SerializationError(prefix + "value of field '" + field.storage_name_ +
                                            "' does not match type " + FieldTypeToString(field.value_type_) + ".");
        }
        continue;
      }
      if (field.HasDefault()) {
        Json value;
        try {
          value = field.default_factory_();
        } catch (const std::exception& e) {
          return ExceptionToStatus(e, SERIALIZATION_ERROR, prefix + "default factory of '" + field.storage_name_ + "' failed");
        } catch (...) {
          return Status::SerializationError(prefix + "default factory of '" + field.storage_name_ +
                                            "' failed: unknown exception");
        }
        if (!accessor.write_(value, result)) {
          return Status::SerializationError(prefix + "default value of field '" + field.storage_name_ +
                                            "' does not match type " + FieldTypeToString(field.value_type_) + ".");
        }
        continue;
      }
      // A key without a default factory must come from the row.
      if (field.role_ == FieldRole::KEY) {
        return Status::SerializationError(prefix + "missing key field '" + field.storage_name_ + "'.");
      }
    }
    record = std::move(result);
    return Status::OK();
  }

  Status Deserialize(const std::vector<Json>& rows, std::vector<Record>& records) const {
    std::vector<Record> result;
    result.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
      Record record{};
      RETURN_IF_ERROR(DeserializeRecord(rows[i], i, record));
      result.push_back(std::move(record));
    }
    records = std::move(result);
    return Status::OK();
  }

 private:
  struct Binding {
    const FieldDefinition* field_;
    size_t accessor_index_;
  };

  void Bind() {
    if (definition_ == nullptr) {
      status_ = Status(UNEXPECTED_ERROR, "Record mapper needs a collection definition.");
      return;
    }
    const auto& descriptors = descriptor_.Fields();
    for (const auto& field : definition_->Fields()) {
      size_t index = descriptors.size();
      for (size_t i = 0; i < descriptors.size(); ++i) {
        if (descriptors[i].annotation_.has_value() && descriptors[i].name_ == field.property_name_) {
          index = i;
          break;
        }
      }
      if (index == descriptors.size()) {
        status_ = Status::SerializationError("Field '" + field.storage_name_ + "' of collection definition '" +
                                             definition_->Name() + "' is not an annotated member of " +
                                             descriptor_.TypeName() + ".");
        return;
      }
      bindings_.push_back(Binding{&field, index});
    }
  }

  CollectionDefinitionPtr definition_;
  RecordDescriptor<Record> descriptor_;
  std::vector<Binding> bindings_;
  Status status_;
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
