#include "utils/json.hpp"

#include <utility>

namespace vecschema {

Json::Json() : doc_(nlohmann::ordered_json()) {}

Json::Json(nlohmann::ordered_json doc) : doc_(std::move(doc)) {}

Json Json::MakeObject() {
  return Json(nlohmann::ordered_json::object());
}

Json Json::MakeArray() {
  return Json(nlohmann::ordered_json::array());
}

Json Json::MakeNull() {
  return Json(nlohmann::ordered_json());
}

Json Json::MakeString(const std::string& value) {
  return Json(nlohmann::ordered_json(value));
}

Json Json::MakeInt(int64_t value) {
  return Json(nlohmann::ordered_json(value));
}

Json Json::MakeDouble(double value) {
  return Json(nlohmann::ordered_json(value));
}

Json Json::MakeBool(bool value) {
  return Json(nlohmann::ordered_json(value));
}

bool Json::LoadFromString(const std::string& json_string) {
  try {
    doc_ = nlohmann::ordered_json::parse(json_string);
  } catch (const nlohmann::ordered_json::parse_error&) {
    return false;
  }
  return true;
}

std::string Json::DumpToString() const {
  return doc_.dump();
}

std::string Json::GetString(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_string()) {
    return doc_[key].get<std::string>();
  }
  return "";
}

int64_t Json::GetInt(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_number_integer()) {
    return doc_[key].get<int64_t>();
  }
  return 0;
}

double Json::GetDouble(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_number()) {
    return doc_[key].get<double>();
  }
  return 0.0;
}

bool Json::GetBool(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_boolean()) {
    return doc_[key].get<bool>();
  }
  return false;
}

std::string Json::GetString() const {
  return doc_.is_string() ? doc_.get<std::string>() : "";
}

int64_t Json::GetInt() const {
  return doc_.is_number_integer() ? doc_.get<int64_t>() : 0;
}

double Json::GetDouble() const {
  return doc_.is_number() ? doc_.get<double>() : 0.0;
}

bool Json::GetBool() const {
  return doc_.is_boolean() ? doc_.get<bool>() : false;
}

size_t Json::GetSize() const {
  if (doc_.is_array() || doc_.is_object()) {
    return doc_.size();
  }
  return 0;
}

Json Json::Get(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key)) {
    return Json(doc_[key]);
  }
  return Json();
}

Json Json::GetObject(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_object()) {
    return Json(doc_[key]);
  }
  return Json();
}

size_t Json::GetArraySize(const std::string& key) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_array()) {
    return doc_[key].size();
  }
  return 0;
}

Json Json::GetArrayElement(const std::string& key, size_t index) const {
  if (doc_.is_object() && doc_.contains(key) && doc_[key].is_array() && index < doc_[key].size()) {
    return Json(doc_[key][index]);
  }
  return Json();
}

Json Json::GetArrayElement(size_t index) const {
  if (doc_.is_array() && index < doc_.size()) {
    return Json(doc_[index]);
  }
  return Json();
}

bool Json::HasMember(const std::string& key) const {
  return doc_.is_object() && doc_.contains(key);
}

std::vector<std::string> Json::GetKeys() const {
  std::vector<std::string> keys;
  if (doc_.is_object()) {
    for (auto it = doc_.begin(); it != doc_.end(); ++it) {
      keys.push_back(it.key());
    }
  }
  return keys;
}

bool Json::IsNull() const {
  return doc_.is_null();
}

bool Json::IsObject() const {
  return doc_.is_object();
}

bool Json::IsArray() const {
  return doc_.is_array();
}

bool Json::IsString() const {
  return doc_.is_string();
}

bool Json::IsNumber() const {
  return doc_.is_number();
}

bool Json::IsInteger() const {
  return doc_.is_number_integer();
}

bool Json::IsBool() const {
  return doc_.is_boolean();
}

void Json::SetString(const std::string& key, const std::string& value) {
  doc_[key] = value;
}

void Json::SetInt(const std::string& key, int64_t value) {
  doc_[key] = value;
}

void Json::SetDouble(const std::string& key, double value) {
  doc_[key] = value;
}

void Json::SetBool(const std::string& key, bool value) {
  doc_[key] = value;
}

void Json::SetNull(const std::string& key) {
  doc_[key] = nullptr;
}

void Json::SetObject(const std::string& key, const Json& object) {
  doc_[key] = object.doc_;
}

void Json::SetArray(const std::string& key, const std::vector<Json>& array) {
  doc_[key] = nlohmann::ordered_json::array();
  for (const auto& item : array) {
    doc_[key].push_back(item.doc_);
  }
}

void Json::AddStringToArray(const std::string& key, const std::string& value) {
  doc_[key].push_back(value);
}

void Json::AddObjectToArray(const std::string& key, const Json& object) {
  doc_[key].push_back(object.doc_);
}

void Json::AddStringToArray(const std::string& value) {
  doc_.push_back(value);
}

void Json::AddIntToArray(int64_t value) {
  doc_.push_back(value);
}

void Json::AddDoubleToArray(double value) {
  doc_.push_back(value);
}

void Json::AddBoolToArray(bool value) {
  doc_.push_back(value);
}

void Json::AddObjectToArray(const Json& object) {
  doc_.push_back(object.doc_);
}

}  // namespace vecschema
