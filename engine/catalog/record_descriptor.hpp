#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "catalog/field_definition.hpp"
#include "catalog/field_value_codec.hpp"
#include "catalog/meta_types.hpp"
#include "utils/json.hpp"

namespace vecschema {
namespace engine {
namespace meta {

/**
 * @brief Declarative schema metadata attached to one record member.
 *
 * The role token ("key", "data" or "vector") selects the field role. Metadata
 * keys: name, type, dimensions, indexKind, distanceFunction (vector only),
 * isFullTextIndexed, isFilterable (data only). Values are tokens and are
 * parsed by SchemaExtractor.
 */
struct FieldAnnotation {
  FieldAnnotation() = default;
  FieldAnnotation(std::string role_token, std::map<std::string, std::string> metadata = {})
      : role_token_(std::move(role_token)), metadata_(std::move(metadata)) {}

  std::string role_token_;
  std::map<std::string, std::string> metadata_;
};

// One declared member of a record type.
struct FieldDescriptor {
  std::string name_;
  FieldType declared_type_ = FieldType::UNKNOWN;
  std::optional<FieldAnnotation> annotation_;  // members without one are not part of the schema
  DefaultFactory default_factory_;
};

template <typename T>
struct NonDeduced {
  using type = T;
};

/**
 * @brief Field listing a record type publishes about itself.
 *
 * A record type opts in with
 *
 *   static RecordDescriptor<Article> DescribeFields() {
 *     return RecordDescriptor<Article>("Article")
 *         .Field("id", &Article::id, {"key"})
 *         .Field("content", &Article::content, {"data", {{"isFullTextIndexed", "true"}}})
 *         .Field("embedding", &Article::embedding,
 *                {"vector", {{"name", "vector"}, {"dimensions", "5"}}})
 *         .Field("scratch", &Article::scratch);
 *   }
 *
 * Besides the metadata, the descriptor keeps typed accessors so RecordMapper
 * can move values between members and row mappings.
 */
template <typename Record>
class RecordDescriptor {
 public:
  struct FieldAccessor {
    std::function<Json(const Record&)> read_;
    std::function<bool(const Json&, Record&)> write_;
  };

  explicit RecordDescriptor(std::string type_name) : type_name_(std::move(type_name)) {}

  // A member that is not part of the schema.
  template <typename T>
  RecordDescriptor& Field(const std::string& name, T Record::*) {
    FieldDescriptor descriptor;
    descriptor.name_ = name;
    descriptor.declared_type_ = DeclaredFieldType<T>();
    fields_.push_back(std::move(descriptor));
    accessors_.emplace_back();
    return *this;
  }

  template <typename T>
  RecordDescriptor& Field(const std::string& name, T Record::*member, FieldAnnotation annotation) {
    static_assert(HasFieldValueCodec<T>::value, "annotated record members need a FieldValueCodec");
    FieldDescriptor descriptor;
    descriptor.name_ = name;
    descriptor.declared_type_ = FieldValueCodec<T>::kType;
    descriptor.annotation_ = std::move(annotation);
    fields_.push_back(std::move(descriptor));

    FieldAccessor accessor;
    accessor.read_ = [member](const Record& record) { return FieldValueCodec<T>::ToJson(record.*member); };
    accessor.write_ = [member](const Json& json, Record& record) {
      return FieldValueCodec<T>::FromJson(json, record.*member);
    };
    accessors_.push_back(std::move(accessor));
    return *this;
  }

  // The factory runs once per record constructed with this member omitted.
  template <typename T>
  RecordDescriptor& Field(const std::string& name,
                          T Record::*member,
                          FieldAnnotation annotation,
                          typename NonDeduced<std::function<T()>>::type default_factory) {
    Field(name, member, std::move(annotation));
    fields_.back().default_factory_ = [default_factory]() { return FieldValueCodec<T>::ToJson(default_factory()); };
    return *this;
  }

  template <typename T>
  RecordDescriptor& FieldWithDefault(const std::string& name,
                                     T Record::*member,
                                     FieldAnnotation annotation,
                                     const typename NonDeduced<T>::type& default_value) {
    Field(name, member, std::move(annotation));
    fields_.back().default_factory_ = MakeDefaultValue(FieldValueCodec<T>::ToJson(default_value));
    return *this;
  }

  const std::string& TypeName() const { return type_name_; }

  const std::vector<FieldDescriptor>& Fields() const { return fields_; }

  // Index-aligned with Fields(); empty accessors for unannotated members.
  const std::vector<FieldAccessor>& Accessors() const { return accessors_; }

 private:
  std::string type_name_;
  std::vector<FieldDescriptor> fields_;
  std::vector<FieldAccessor> accessors_;
};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
