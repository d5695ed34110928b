#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "catalog/field_definition.hpp"
#include "catalog/meta_types.hpp"
#include "utils/json.hpp"

namespace vecschema {
namespace engine {
namespace meta {

/**
 * @brief Maps a record member type to its FieldType and its row (JSON) form.
 *
 * Specializations provide:
 *   static constexpr FieldType kType;
 *   static Json ToJson(const T& value);
 *   static bool FromJson(const Json& json, T& value);  // false on shape mismatch
 *
 * The primary template is empty: members of other types can still be listed
 * on a record descriptor, but only without an annotation.
 */
template <typename T, typename Enable = void>
struct FieldValueCodec {};

template <>
struct FieldValueCodec<std::string> {
  static constexpr FieldType kType = FieldType::STRING;

  static Json ToJson(const std::string& value) { return Json::MakeString(value); }

  static bool FromJson(const Json& json, std::string& value) {
    if (!json.IsString()) {
      return false;
    }
    value = json.GetString();
    return true;
  }
};

template <>
struct FieldValueCodec<bool> {
  static constexpr FieldType kType = FieldType::BOOL;

  static Json ToJson(bool value) { return Json::MakeBool(value); }

  static bool FromJson(const Json& json, bool& value) {
    if (!json.IsBool()) {
      return false;
    }
    value = json.GetBool();
    return true;
  }
};

template <typename T>
struct FieldValueCodec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
  static constexpr FieldType kType = sizeof(T) == 1   ? FieldType::INT1
                                     : sizeof(T) == 2 ? FieldType::INT2
                                     : sizeof(T) == 4 ? FieldType::INT4
                                                      : FieldType::INT8;

  static Json ToJson(T value) { return Json::MakeInt(static_cast<int64_t>(value)); }

  static bool FromJson(const Json& json, T& value) {
    if (!json.IsInteger()) {
      return false;
    }
    int64_t raw = json.GetInt();
    if constexpr (std::is_signed_v<T>) {
      if (raw < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
          raw > static_cast<int64_t>(std::numeric_limits<T>::max())) {
        return false;
      }
    } else {
      if (raw < 0 || static_cast<uint64_t>(raw) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return false;
      }
    }
    value = static_cast<T>(raw);
    return true;
  }
};

template <typename T>
struct FieldValueCodec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static constexpr FieldType kType = std::is_same_v<T, float> ? FieldType::FLOAT : FieldType::DOUBLE;

  static Json ToJson(T value) { return Json::MakeDouble(static_cast<double>(value)); }

  static bool FromJson(const Json& json, T& value) {
    if (!json.IsNumber()) {
      return false;
    }
    value = static_cast<T>(json.GetDouble());
    return true;
  }
};

template <>
struct FieldValueCodec<Json> {
  static constexpr FieldType kType = FieldType::JSON;

  static Json ToJson(const Json& value) { return value; }

  static bool FromJson(const Json& json, Json& value) {
    value = json;
    return true;
  }
};

template <typename E>
struct FieldValueCodec<std::vector<E>, std::enable_if_t<std::is_floating_point_v<E>>> {
  static constexpr FieldType kType = std::is_same_v<E, float> ? FieldType::VECTOR_FLOAT : FieldType::VECTOR_DOUBLE;

  static Json ToJson(const std::vector<E>& value) {
    Json json = Json::MakeArray();
    for (const auto& element : value) {
      json.AddDoubleToArray(static_cast<double>(element));
    }
    return json;
  }

  static bool FromJson(const Json& json, std::vector<E>& value) {
    if (!json.IsArray()) {
      return false;
    }
    std::vector<E> result;
    result.reserve(json.GetSize());
    for (size_t i = 0; i < json.GetSize(); ++i) {
      auto element = json.GetArrayElement(i);
      if (!element.IsNumber()) {
        return false;
      }
      result.push_back(static_cast<E>(element.GetDouble()));
    }
    value = std::move(result);
    return true;
  }
};

// An embedding or the source text it will be computed from later. Both
// alternatives are stored as is.
template <typename E>
struct VectorOrTextCodec {
  using Vector = std::vector<E>;

  static constexpr FieldType kType = WithSourceText(FieldValueCodec<Vector>::kType);

  template <typename V>
  static Json ToJson(const V& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
      return Json::MakeString(*text);
    }
    return FieldValueCodec<Vector>::ToJson(std::get<Vector>(value));
  }

  template <typename V>
  static bool FromJson(const Json& json, V& value) {
    if (json.IsString()) {
      value = json.GetString();
      return true;
    }
    Vector vector;
    if (!FieldValueCodec<Vector>::FromJson(json, vector)) {
      return false;
    }
    value = std::move(vector);
    return true;
  }
};

template <typename E>
struct FieldValueCodec<std::variant<std::vector<E>, std::string>, std::enable_if_t<std::is_floating_point_v<E>>>
    : VectorOrTextCodec<E> {};

template <typename E>
struct FieldValueCodec<std::variant<std::string, std::vector<E>>, std::enable_if_t<std::is_floating_point_v<E>>>
    : VectorOrTextCodec<E> {};

// Empty optionals are stored as null.
template <typename T>
struct FieldValueCodec<std::optional<T>, std::void_t<decltype(FieldValueCodec<T>::kType)>> {
  static constexpr FieldType kType = FieldValueCodec<T>::kType;

  static Json ToJson(const std::optional<T>& value) {
    if (!value.has_value()) {
      return Json::MakeNull();
    }
    return FieldValueCodec<T>::ToJson(*value);
  }

  static bool FromJson(const Json& json, std::optional<T>& value) {
    if (json.IsNull()) {
      value.reset();
      return true;
    }
    T inner{};
    if (!FieldValueCodec<T>::FromJson(json, inner)) {
      return false;
    }
    value = std::move(inner);
    return true;
  }
};

template <typename T, typename Enable = void>
struct HasFieldValueCodec : std::false_type {};

template <typename T>
struct HasFieldValueCodec<T, std::void_t<decltype(FieldValueCodec<T>::kType)>> : std::true_type {};

// Declared FieldType of a member type; UNKNOWN for types without a codec.
template <typename T>
constexpr FieldType DeclaredFieldType() {
  if constexpr (HasFieldValueCodec<T>::value) {
    return FieldValueCodec<T>::kType;
  } else {
    return FieldType::UNKNOWN;
  }
}

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
