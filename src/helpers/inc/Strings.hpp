#ifndef NETSTATE_HELPERS_STRINGS_HPP
#define NETSTATE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for interface names and document values.
 *
 * Small value-returning helpers used by the naming and normalization code.
 *
 * @note Allocates: every function returns std::string or a container of them.
 */

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace netstate {
namespace helpers {
namespace strings {

/* ----------------------------- Case ----------------------------- */

/**
 * @brief Upper-case an ASCII string.
 * @param str Input string.
 * @return Copy with every ASCII letter upper-cased.
 */
[[nodiscard]] inline std::string toUpper(std::string_view str) {
  std::string out(str);
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split a string on every occurrence of a separator.
 * @param str String to split.
 * @param sep Non-empty separator.
 * @return Parts between separators, scanning left to right without overlap.
 *
 * A leading or trailing separator yields an empty part, so the result always
 * holds (occurrences + 1) parts. An empty separator returns the input whole.
 */
[[nodiscard]] inline std::vector<std::string> splitOn(std::string_view str, std::string_view sep) {
  std::vector<std::string> parts;
  if (sep.empty()) {
    parts.emplace_back(str);
    return parts;
  }

  std::size_t start = 0;
  std::size_t pos = str.find(sep, start);
  while (pos != std::string_view::npos) {
    parts.emplace_back(str.substr(start, pos - start));
    start = pos + sep.size();
    pos = str.find(sep, start);
  }
  parts.emplace_back(str.substr(start));
  return parts;
}

/**
 * @brief Join strings with a separator.
 * @param parts Strings to join.
 * @param sep Separator placed between consecutive parts.
 */
[[nodiscard]] inline std::string join(const std::vector<std::string>& parts,
                                      std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace netstate

#endif // NETSTATE_HELPERS_STRINGS_HPP
