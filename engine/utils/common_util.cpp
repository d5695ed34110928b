#include "utils/common_util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>

namespace vecschema {
namespace utils {

bool CommonUtil::IsValidName(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  unsigned char first = static_cast<unsigned char>(name[0]);
  if (!std::isalpha(first) && first != '_') {
    return false;
  }
  return std::all_of(name.begin() + 1, name.end(), [](char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || uc == '_';
  });
}

std::string CommonUtil::ToLowerCase(const std::string& str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool CommonUtil::ParseBool(const std::string& str, bool& value) {
  auto lower = ToLowerCase(str);
  if (lower == "true" || lower == "1" || lower == "yes") {
    value = true;
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no") {
    value = false;
    return true;
  }
  return false;
}

bool CommonUtil::ParseInt(const std::string& str, int64_t& value) {
  // strtoll would also skip leading whitespace and accept '+'.
  if (str.empty() || (!std::isdigit(static_cast<unsigned char>(str[0])) && str[0] != '-')) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  long long parsed = std::strtoll(str.c_str(), &end, 10);
  if (errno == ERANGE || end == str.c_str() || *end != '\0') {
    return false;
  }
  value = static_cast<int64_t>(parsed);
  return true;
}

}  // namespace utils
}  // namespace vecschema
