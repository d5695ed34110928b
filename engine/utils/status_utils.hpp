#pragma once

#include <exception>
#include <string>
#include <utility>

#include "utils/status.hpp"

namespace vecschema {

// Convert an exception escaping user code (hooks, factories) to Status.
inline Status ExceptionToStatus(const std::exception& e, StatusCode code, const std::string& operation = "") {
  std::string msg = operation.empty() ? e.what() : (operation + ": " + e.what());
  return Status(code, msg);
}

}  // namespace vecschema

// RETURN_IF_ERROR(status_expr);
#define RETURN_IF_ERROR(expr)                     \
    do {                                          \
        auto _status = (expr);                    \
        if (!_status.ok()) {                      \
            return _status;                       \
        }                                         \
    } while (0)
