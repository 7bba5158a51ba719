#ifndef NETSTATE_HELPERS_ARGS_HPP
#define NETSTATE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the netstate tools.
 *
 * Every flag has a fixed arity: a flag declared with nargs = 1 consumes exactly
 * the next token as its value. Tokens that are not a declared flag or a flag
 * value are rejected.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace netstate {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--desired"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to flag definition, ordered by key for stable help output.
using ArgMap = std::map<std::uint8_t, ArgDef>;

/**
 * @brief Flags seen on the command line and their values.
 */
class ParsedArgs {
public:
  /// @brief True if the flag for @p key was given.
  [[nodiscard]] bool has(std::uint8_t key) const noexcept { return values_.count(key) != 0; }

  /// @brief First value of the flag for @p key, or @p fallback when absent.
  [[nodiscard]] std::string_view value(std::uint8_t key,
                                       std::string_view fallback = {}) const noexcept {
    const auto IT = values_.find(key);
    if (IT == values_.end() || IT->second.empty()) {
      return fallback;
    }
    return IT->second.front();
  }

  /// @brief Record the values of one flag occurrence (later occurrences win).
  void set(std::uint8_t key, std::vector<std::string_view> vals) {
    values_[key] = std::move(vals);
  }

private:
  std::unordered_map<std::uint8_t, std::vector<std::string_view>> values_;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse argv according to a flag map.
 * @param argc  Argument count from main().
 * @param argv  Argument vector from main(); argv[0] is skipped.
 * @param map   Accepted flags.
 * @param out   Parsed flags.
 * @param error Set to a one-line message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(int argc, char* argv[], const ArgMap& map, ParsedArgs& out,
                                    std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view TOK = argv[i];
    const auto IT = byFlag.find(TOK);
    if (IT == byFlag.end()) {
      error = fmt::format("Unknown argument '{}'", TOK);
      return false;
    }

    const ArgDef& DEF = map.at(IT->second);
    if (i + static_cast<int>(DEF.nargs) >= argc) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    std::vector<std::string_view> vals;
    vals.reserve(DEF.nargs);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      vals.emplace_back(argv[i + 1 + k]);
    }
    out.set(IT->second, std::move(vals));
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && !out.has(KEY)) {
      error = fmt::format("Missing required argument '{}'", DEF.flag);
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage text generated from the flag map.
 * @param progName    Program name (typically argv[0]).
 * @param description One-line tool description.
 * @param map         Flags to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::size_t width = 16;
  for (const auto& [KEY, DEF] : map) {
    width = std::max(width, DEF.flag.size() + (DEF.nargs > 0 ? 8U : 0U));
  }

  for (const auto& [KEY, DEF] : map) {
    std::string flagStr(DEF.flag);
    if (DEF.nargs > 0) {
      flagStr.append(" <value>");
    }
    fmt::print("  {:<{}}  {}{}\n", flagStr, width, DEF.desc, DEF.required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace netstate

#endif // NETSTATE_HELPERS_ARGS_HPP
