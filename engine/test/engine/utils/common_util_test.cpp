#include "utils/common_util.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

using namespace vecschema::utils;

class CommonUtilTest : public ::testing::Test {
 protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(CommonUtilTest, ParseIntAcceptsPlainIntegers) {
  int64_t value = 0;
  EXPECT_TRUE(CommonUtil::ParseInt("42", value));
  EXPECT_EQ(value, 42);
  EXPECT_TRUE(CommonUtil::ParseInt("-3", value));
  EXPECT_EQ(value, -3);
  EXPECT_TRUE(CommonUtil::ParseInt("0", value));
  EXPECT_EQ(value, 0);
}

TEST_F(CommonUtilTest, ParseIntRejectsDecoratedInput) {
  for (const std::string input : {"", " 5", "\t5", "+5", "5 ", "4x", "-", "99999999999999999999"}) {
    int64_t value = 17;
    EXPECT_FALSE(CommonUtil::ParseInt(input, value)) << "'" << input << "'";
    // Left untouched on failure
    EXPECT_EQ(value, 17);
  }
}

TEST_F(CommonUtilTest, ParseBoolTokens) {
  bool value = false;
  EXPECT_TRUE(CommonUtil::ParseBool("TRUE", value));
  EXPECT_TRUE(value);
  EXPECT_TRUE(CommonUtil::ParseBool("no", value));
  EXPECT_FALSE(value);
  EXPECT_FALSE(CommonUtil::ParseBool("maybe", value));
}

TEST_F(CommonUtilTest, IsValidName) {
  EXPECT_TRUE(CommonUtil::IsValidName("_vector1"));
  EXPECT_FALSE(CommonUtil::IsValidName("1vector"));
  EXPECT_FALSE(CommonUtil::IsValidName("my-vector"));
  EXPECT_FALSE(CommonUtil::IsValidName(""));
}
