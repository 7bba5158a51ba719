#ifndef NETSTATE_HELPERS_FORMAT_HPP
#define NETSTATE_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief JSON text helpers for the tools' --json output.
 *
 * Tools print JSON by hand with fmt::print; these helpers quote the strings
 * that come from user documents.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace netstate {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Quote @p str as a JSON string literal.
 * @param str Raw text.
 * @return Text wrapped in double quotes with JSON escapes applied.
 */
[[nodiscard]] inline std::string jsonString(std::string_view str) {
  std::string out;
  out.reserve(str.size() + 2);
  out.push_back('"');
  for (const char C : str) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(C)));
      } else {
        out.push_back(C);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

/**
 * @brief Format a list of strings as a one-line JSON array.
 * @return e.g. ["eth0v2", "eth0v3"], or [] when empty.
 */
[[nodiscard]] inline std::string jsonStringArray(const std::vector<std::string>& items) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += jsonString(items[i]);
  }
  out += "]";
  return out;
}

} // namespace format
} // namespace helpers
} // namespace netstate

#endif // NETSTATE_HELPERS_FORMAT_HPP
