/**
 * @file FieldValidator_uTest.cpp
 * @brief Unit tests for netstate::validator field checks.
 */

#include "src/validator/inc/FieldValidator.hpp"

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>

using netstate::validator::validateInteger;
using netstate::validator::validatePattern;
using netstate::validator::validateString;
using netstate::validator::ValidationError;
using netstate::validator::ValidationResult;

namespace {

constexpr std::array<std::string_view, 2> COLORS{"red", "blue"};

} // namespace

/* ----------------------------- validateInteger ----------------------------- */

/** @test Absent integers are never rejected. */
TEST(ValidateIntegerTest, AbsentIsValid) {
  EXPECT_FALSE(validateInteger(std::nullopt, "speed", 0).has_value());
}

/** @test Minimum is inclusive. */
TEST(ValidateIntegerTest, MinimumInclusive) {
  EXPECT_FALSE(validateInteger(0, "speed", 0).has_value());
  EXPECT_FALSE(validateInteger(100000, "speed", 0).has_value());
}

/** @test Values below the minimum name the field. */
TEST(ValidateIntegerTest, BelowMinimumFails) {
  const ValidationResult RESULT = validateInteger(-1, "speed", 0);
  ASSERT_TRUE(RESULT.has_value());
  EXPECT_EQ(RESULT->field, "speed");
  EXPECT_EQ(RESULT->reason, "-1 is less than minimum 0");
}

/** @test Maximum is inclusive and values above it are rejected. */
TEST(ValidateIntegerTest, AboveMaximumFails) {
  EXPECT_FALSE(validateInteger(64, "total-vfs", 0, 64).has_value());

  const ValidationResult RESULT = validateInteger(65, "total-vfs", 0, 64);
  ASSERT_TRUE(RESULT.has_value());
  EXPECT_EQ(RESULT->field, "total-vfs");
  EXPECT_EQ(RESULT->reason, "65 is greater than maximum 64");
}

/* ----------------------------- validateString ----------------------------- */

/** @test Listed values pass, others fail with the choices in the reason. */
TEST(ValidateStringTest, AllowedValues) {
  EXPECT_FALSE(validateString(std::string("red"), "color", COLORS).has_value());
  EXPECT_FALSE(validateString(std::nullopt, "color", COLORS).has_value());

  const ValidationResult RESULT = validateString(std::string("green"), "color", COLORS);
  ASSERT_TRUE(RESULT.has_value());
  EXPECT_EQ(RESULT->field, "color");
  EXPECT_EQ(RESULT->reason, "'green' is not one of [red, blue]");
}

/** @test Comparison is case-sensitive. */
TEST(ValidateStringTest, CaseSensitive) {
  EXPECT_TRUE(validateString(std::string("RED"), "color", COLORS).has_value());
}

/* ----------------------------- validatePattern ----------------------------- */

/** @test Pattern must match the whole value. */
TEST(ValidatePatternTest, WholeMatch) {
  EXPECT_FALSE(validatePattern(std::string("abc"), "f", "^[a-c]+$").has_value());
  EXPECT_TRUE(validatePattern(std::string("abcd"), "f", "^[a-c]+$").has_value());
  EXPECT_FALSE(validatePattern(std::nullopt, "f", "^[a-c]+$").has_value());
}

/* ----------------------------- ValidationError ----------------------------- */

/** @test toString joins field and reason. */
TEST(ValidationErrorTest, ToString) {
  const ValidationError ERR{"duplex", "bad"};
  EXPECT_EQ(ERR.toString(), "duplex: bad");
}
