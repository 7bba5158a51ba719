#ifndef NETSTATE_VALIDATOR_FIELD_VALIDATOR_HPP
#define NETSTATE_VALIDATOR_FIELD_VALIDATOR_HPP
/**
 * @file FieldValidator.hpp
 * @brief Primitive field checks shared by every interface type.
 *
 * Each check accepts an optional value. An absent value is always valid, so
 * callers can run a check on every schema field without testing presence.
 * A failing check returns the ValidationError naming the field.
 */

#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>

namespace netstate {

namespace validator {

/* ----------------------------- ValidationError ----------------------------- */

/**
 * @brief A single rejected field.
 */
struct ValidationError {
  std::string field;  ///< Document key of the rejected field (e.g. "duplex")
  std::string reason; ///< Why the value was rejected

  /// @brief "<field>: <reason>".
  [[nodiscard]] std::string toString() const;

  bool operator==(const ValidationError&) const = default;
};

/// Outcome of a check: std::nullopt on success, the first error otherwise.
using ValidationResult = std::optional<ValidationError>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check an integer against an inclusive range.
 * @param value Value to check (absent is valid).
 * @param field Field name reported on failure.
 * @param minimum Smallest accepted value.
 * @param maximum Largest accepted value.
 */
[[nodiscard]] ValidationResult
validateInteger(std::optional<std::int64_t> value, std::string_view field, std::int64_t minimum,
                std::int64_t maximum = std::numeric_limits<std::int64_t>::max());

/**
 * @brief Check a string against a closed set of accepted values.
 * @param value Value to check (absent is valid).
 * @param field Field name reported on failure.
 * @param allowed Accepted values, compared case-sensitively.
 */
[[nodiscard]] ValidationResult validateString(const std::optional<std::string>& value,
                                              std::string_view field,
                                              std::span<const std::string_view> allowed);

/**
 * @brief Check a string against a regular expression (whole-string match).
 * @param value Value to check (absent is valid).
 * @param field Field name reported on failure.
 * @param pattern ECMAScript pattern text.
 */
[[nodiscard]] ValidationResult validatePattern(const std::optional<std::string>& value,
                                               std::string_view field, std::string_view pattern);

} // namespace validator

} // namespace netstate

#endif // NETSTATE_VALIDATOR_FIELD_VALIDATOR_HPP
