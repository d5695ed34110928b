#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace vecschema {
namespace engine {
namespace meta {

constexpr size_t DEFAULT_VECTOR_DIMENSION = 0;

enum class FieldRole {
  KEY = 1,
  DATA = 2,
  VECTOR = 3,
};

enum class FieldType {
  INT1 = 1,  // TINYINT
  INT2 = 2,  // SMALLINT
  INT4 = 3,  // INT
  INT8 = 4,  // BIGINT

  FLOAT = 10,
  DOUBLE = 11,

  STRING = 20,

  BOOL = 30,

  JSON = 31,

  VECTOR_FLOAT = 40,
  VECTOR_DOUBLE = 41,

  // Either an embedding or the source text it will be computed from.
  VECTOR_FLOAT_OR_STRING = 42,
  VECTOR_DOUBLE_OR_STRING = 43,

  SPARSE_VECTOR_FLOAT = 50,
  SPARSE_VECTOR_DOUBLE = 51,

  UNKNOWN = 999,
};

// Well-known index kinds. Any other token is passed to the backend as is.
namespace index_kind {
constexpr const char* HNSW = "hnsw";
constexpr const char* FLAT = "flat";
constexpr const char* IVF_FLAT = "ivf_flat";
constexpr const char* DISKANN = "diskann";
}  // namespace index_kind

// Well-known distance functions. Any other token is passed to the backend as is.
namespace distance_function {
constexpr const char* COSINE_SIMILARITY = "cosine_similarity";
constexpr const char* COSINE_DISTANCE = "cosine_distance";
constexpr const char* DOT_PROD = "dot_prod";
constexpr const char* EUCLIDEAN_DISTANCE = "euclidean_distance";
constexpr const char* EUCLIDEAN_SQUARED_DISTANCE = "euclidean_squared_distance";
constexpr const char* MANHATTAN = "manhattan";
constexpr const char* HAMMING = "hamming";
}  // namespace distance_function

// Role tokens are matched case-insensitively, so keys are lower case.
static const std::unordered_map<std::string, FieldRole> fieldRoleMap = {
    {"key", FieldRole::KEY},
    {"data", FieldRole::DATA},
    {"vector", FieldRole::VECTOR}};

// Type tokens are matched case-insensitively, so keys are lower case.
static const std::unordered_map<std::string, FieldType> fieldTypeMap = {
    {"tinyint", FieldType::INT1},
    {"smallint", FieldType::INT2},
    {"int", FieldType::INT4},
    {"bigint", FieldType::INT8},
    {"long", FieldType::INT8},
    {"float", FieldType::FLOAT},
    {"double", FieldType::DOUBLE},
    {"string", FieldType::STRING},
    {"str", FieldType::STRING},
    {"text", FieldType::STRING},
    {"bool", FieldType::BOOL},
    {"boolean", FieldType::BOOL},
    {"json", FieldType::JSON},
    {"vector_float", FieldType::VECTOR_FLOAT},
    {"vector_double", FieldType::VECTOR_DOUBLE},
    {"vector_float_or_string", FieldType::VECTOR_FLOAT_OR_STRING},
    {"vector_double_or_string", FieldType::VECTOR_DOUBLE_OR_STRING},
    {"sparse_vector_float", FieldType::SPARSE_VECTOR_FLOAT},
    {"sparse_vector_double", FieldType::SPARSE_VECTOR_DOUBLE}};

}  // namespace meta
}  // namespace engine
}  // namespace vecschema
