#include "utils/status.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils/status_utils.hpp"

using namespace vecschema;

class StatusTest : public ::testing::Test {
 protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(StatusTest, DefaultConstructor) {
  Status status;

  // Default should be OK
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(status.code(), SUCCESS);
  EXPECT_EQ(status.message(), "OK");
  EXPECT_EQ(status.ToString(), "OK");
}

TEST_F(StatusTest, SuccessCodeIsOk) {
  Status status(SUCCESS, "ignored");
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(status.message(), "OK");
}

TEST_F(StatusTest, ConvenienceConstructors) {
  auto schema = Status::SchemaError("bad token");
  EXPECT_FALSE(schema.ok());
  EXPECT_EQ(schema.code(), SCHEMA_ERROR);
  EXPECT_EQ(schema.message(), "bad token");

  auto validation = Status::ValidationError("no key");
  EXPECT_EQ(validation.code(), VALIDATION_ERROR);
  EXPECT_EQ(validation.message(), "no key");

  auto serialization = Status::SerializationError("bad row");
  EXPECT_EQ(serialization.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(serialization.message(), "bad row");
}

TEST_F(StatusTest, ErrorCodesAreDistinct) {
  EXPECT_NE(SCHEMA_ERROR, VALIDATION_ERROR);
  EXPECT_NE(VALIDATION_ERROR, SERIALIZATION_ERROR);
  EXPECT_NE(SERIALIZATION_ERROR, DEFINITION_ALREADY_EXISTS);
  EXPECT_NE(UNEXPECTED_ERROR, SCHEMA_ERROR);
  EXPECT_EQ(SCHEMA_ERROR, CATALOG_ERROR_CODE_BASE + 2);
}

TEST_F(StatusTest, ToStringCarriesCategory) {
  EXPECT_EQ(Status::SchemaError("x").ToString(), "Schema Error: x");
  EXPECT_EQ(Status::ValidationError("x").ToString(), "Validation Error: x");
  EXPECT_EQ(Status::SerializationError("x").ToString(), "Serialization Error: x");
  EXPECT_EQ(Status(DEFINITION_ALREADY_EXISTS, "x").ToString(), "Already Exists: x");
  EXPECT_EQ(Status(UNEXPECTED_ERROR, "x").ToString(), "Unexpected Error: x");
  EXPECT_EQ(Status(42, "x").ToString(), "Error code(42): x");
}

TEST_F(StatusTest, CopyAndAssignment) {
  Status original = Status::ValidationError("Original message");
  Status copy(original);
  EXPECT_EQ(copy.code(), VALIDATION_ERROR);
  EXPECT_EQ(copy.message(), "Original message");

  Status assigned;
  assigned = original;
  EXPECT_EQ(assigned.code(), VALIDATION_ERROR);
  EXPECT_EQ(assigned.message(), "Original message");

  // Copies are independent
  original = Status::OK();
  EXPECT_FALSE(copy.ok());
  EXPECT_TRUE(original.ok());
}

TEST_F(StatusTest, MoveSemantics) {
  Status original = Status::SchemaError("Move me");
  Status moved(std::move(original));
  EXPECT_EQ(moved.code(), SCHEMA_ERROR);
  EXPECT_EQ(moved.message(), "Move me");

  Status target;
  target = std::move(moved);
  EXPECT_EQ(target.code(), SCHEMA_ERROR);
}

TEST_F(StatusTest, ExceptionToStatus) {
  std::runtime_error error("boom");
  auto status = ExceptionToStatus(error, SERIALIZATION_ERROR, "hook");
  EXPECT_EQ(status.code(), SERIALIZATION_ERROR);
  EXPECT_EQ(status.message(), "hook: boom");

  auto plain = ExceptionToStatus(error, UNEXPECTED_ERROR);
  EXPECT_EQ(plain.message(), "boom");
}

namespace {

Status FailWhen(bool fail) {
  return fail ? Status::ValidationError("failed") : Status::OK();
}

Status Chain(bool fail, int& reached) {
  RETURN_IF_ERROR(FailWhen(fail));
  reached++;
  return Status::OK();
}

}  // namespace

TEST_F(StatusTest, ReturnIfErrorMacro) {
  int reached = 0;
  EXPECT_TRUE(Chain(false, reached).ok());
  EXPECT_EQ(reached, 1);

  auto status = Chain(true, reached);
  EXPECT_EQ(status.code(), VALIDATION_ERROR);
  EXPECT_EQ(reached, 1);
}
