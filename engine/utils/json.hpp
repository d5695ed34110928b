#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vecschema {

// Value wrapper used for row mappings, default values and schema documents.
// Getters are lenient: a missing key or a type mismatch yields the zero value,
// so callers check the shape with the Is*() predicates first.
class Json {
 public:
  Json();

  static Json MakeObject();
  static Json MakeArray();
  static Json MakeNull();
  static Json MakeString(const std::string& value);
  static Json MakeInt(int64_t value);
  static Json MakeDouble(double value);
  static Json MakeBool(bool value);

  bool LoadFromString(const std::string& json_string);
  std::string DumpToString() const;

  std::string GetString(const std::string& key) const;
  int64_t GetInt(const std::string& key) const;
  double GetDouble(const std::string& key) const;
  bool GetBool(const std::string& key) const;
  std::string GetString() const;
  int64_t GetInt() const;
  double GetDouble() const;
  bool GetBool() const;
  size_t GetSize() const;
  Json Get(const std::string& key) const;
  Json GetObject(const std::string& key) const;                      // Get nested object
  size_t GetArraySize(const std::string& key) const;
  Json GetArrayElement(const std::string& key, size_t index) const;  // Get specific element from array
  Json GetArrayElement(size_t index) const;
  bool HasMember(const std::string& key) const;
  std::vector<std::string> GetKeys() const;  // Member names of an object, in document order

  bool IsNull() const;
  bool IsObject() const;
  bool IsArray() const;
  bool IsString() const;
  bool IsNumber() const;
  bool IsInteger() const;
  bool IsBool() const;

  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int64_t value);
  void SetDouble(const std::string& key, double value);
  void SetBool(const std::string& key, bool value);
  void SetNull(const std::string& key);
  void SetObject(const std::string& key, const Json& object);
  void SetArray(const std::string& key, const std::vector<Json>& array);
  void AddStringToArray(const std::string& key, const std::string& value);
  void AddObjectToArray(const std::string& key, const Json& object);
  void AddStringToArray(const std::string& value);
  void AddIntToArray(int64_t value);
  void AddDoubleToArray(double value);
  void AddBoolToArray(bool value);
  void AddObjectToArray(const Json& object);

  bool operator==(const Json& other) const { return doc_ == other.doc_; }
  bool operator!=(const Json& other) const { return doc_ != other.doc_; }

 private:
  explicit Json(nlohmann::ordered_json doc);

  // ordered so dumped documents keep declaration order
  nlohmann::ordered_json doc_;
};

}  // namespace vecschema
