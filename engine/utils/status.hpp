#pragma once

#include <memory>
#include <string>

#include "utils/error.hpp"

namespace vecschema {

using StatusCode = ErrorCode;

class Status {
 public:
  Status(StatusCode code, const std::string& msg);
  Status();
  ~Status();

  Status(const Status& s);

  Status& operator=(const Status& s);

  Status(Status&& s) noexcept;

  Status& operator=(Status&& s) noexcept;

  static Status OK() { return Status(); }

  static Status SchemaError(const std::string& msg) { return Status(SCHEMA_ERROR, msg); }
  static Status ValidationError(const std::string& msg) { return Status(VALIDATION_ERROR, msg); }
  static Status SerializationError(const std::string& msg) { return Status(SERIALIZATION_ERROR, msg); }

  bool ok() const { return code() == SUCCESS; }

  StatusCode code() const {
    return (state_ == nullptr) ? SUCCESS : state_->code_;
  }

  std::string message() const;

  std::string ToString() const;

 private:
  struct State {
    StatusCode code_;
    std::string message_;
  };

  // nullptr means OK, so the success path never allocates.
  std::unique_ptr<State> state_;
};

}  // namespace vecschema
