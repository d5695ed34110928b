#include "utils/status.hpp"

namespace vecschema {

Status::Status(StatusCode code, const std::string& msg) {
  if (code != SUCCESS) {
    state_ = std::make_unique<State>(State{code, msg});
  }
}

Status::Status() = default;

Status::~Status() = default;

Status::Status(const Status& s) {
  if (s.state_ != nullptr) {
    state_ = std::make_unique<State>(*s.state_);
  }
}

Status&
Status::operator=(const Status& s) {
  if (this != &s) {
    state_ = (s.state_ == nullptr) ? nullptr : std::make_unique<State>(*s.state_);
  }
  return *this;
}

Status::Status(Status&& s) noexcept = default;

Status&
Status::operator=(Status&& s) noexcept = default;

std::string
Status::message() const {
  if (state_ == nullptr) {
    return "OK";
  }
  return state_->message_;
}

std::string
Status::ToString() const {
  if (state_ == nullptr) {
    return "OK";
  }

  std::string result;
  switch (code()) {
    case UNEXPECTED_ERROR:
      result = "Unexpected Error: ";
      break;
    case SCHEMA_ERROR:
      result = "Schema Error: ";
      break;
    case VALIDATION_ERROR:
      result = "Validation Error: ";
      break;
    case SERIALIZATION_ERROR:
      result = "Serialization Error: ";
      break;
    case DEFINITION_ALREADY_EXISTS:
      result = "Already Exists: ";
      break;
    default:
      result = "Error code(" + std::to_string(code()) + "): ";
      break;
  }

  result += message();
  return result;
}

}  // namespace vecschema
