#pragma once

#include <cstdint>
#include <string>

namespace vecschema {
namespace utils {

class CommonUtil {
 public:
  // A name must start with a letter or '_' and contain only letters, digits and '_'.
  static bool IsValidName(const std::string& name);

  static std::string ToLowerCase(const std::string& str);

  // Accepts true/false, 1/0, yes/no (case-insensitive).
  static bool ParseBool(const std::string& str, bool& value);

  // Accepts a plain base-10 integer that fits into int64_t, with an optional
  // leading '-' and no surrounding whitespace.
  static bool ParseInt(const std::string& str, int64_t& value);
};

}  // namespace utils
}  // namespace vecschema
