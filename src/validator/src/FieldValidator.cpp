/**
 * @file FieldValidator.cpp
 * @brief Implementation of primitive field checks.
 */

#include "src/validator/inc/FieldValidator.hpp"

#include <fmt/core.h>

namespace netstate {

namespace validator {

/* ----------------------------- ValidationError Methods ----------------------------- */

std::string ValidationError::toString() const { return fmt::format("{}: {}", field, reason); }

/* ----------------------------- API ----------------------------- */

ValidationResult validateInteger(std::optional<std::int64_t> value, std::string_view field,
                                 std::int64_t minimum, std::int64_t maximum) {
  if (!value) {
    return std::nullopt;
  }
  if (*value < minimum) {
    return ValidationError{std::string(field),
                           fmt::format("{} is less than minimum {}", *value, minimum)};
  }
  if (*value > maximum) {
    return ValidationError{std::string(field),
                           fmt::format("{} is greater than maximum {}", *value, maximum)};
  }
  return std::nullopt;
}

ValidationResult validateString(const std::optional<std::string>& value, std::string_view field,
                                std::span<const std::string_view> allowed) {
  if (!value) {
    return std::nullopt;
  }

  std::string choices;
  for (const std::string_view CHOICE : allowed) {
    if (*value == CHOICE) {
      return std::nullopt;
    }
    if (!choices.empty()) {
      choices += ", ";
    }
    choices += CHOICE;
  }

  return ValidationError{std::string(field),
                         fmt::format("'{}' is not one of [{}]", *value, choices)};
}

ValidationResult validatePattern(const std::optional<std::string>& value, std::string_view field,
                                 std::string_view pattern) {
  if (!value) {
    return std::nullopt;
  }

  const std::regex RE{std::string(pattern)};
  if (std::regex_match(*value, RE)) {
    return std::nullopt;
  }

  return ValidationError{std::string(field),
                         fmt::format("'{}' does not match pattern {}", *value, pattern)};
}

} // namespace validator

} // namespace netstate
