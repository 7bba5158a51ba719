/**
 * @file iface-verify.cpp
 * @brief Check that current interface state satisfies a desired state document.
 *
 * Every desired interface, and every VF its total-vfs generates, is compared
 * against the current document. Fields the desired document leaves unset are
 * not checked. Exits 0 only when every interface passes.
 */

#include "src/state/inc/StateDocument.hpp"
#include "src/state/inc/StateVerify.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace state = netstate::state;

using netstate::helpers::format::jsonString;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DESIRED = 1,
  ARG_CURRENT = 2,
  ARG_JSON = 3,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Verify current interface state against a desired state document.";

/// Build argument definitions.
netstate::helpers::args::ArgMap buildArgMap() {
  netstate::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DESIRED] = {"--desired", 1, true, "Desired state YAML file"};
  map[ARG_CURRENT] = {"--current", 1, true, "Current state YAML file"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const state::VerifyReport& report) {
  fmt::print("=== Interface Verification ===\n");
  for (const state::VerifyResult& result : report.results) {
    fmt::print("  {}\n", result.toString());
  }
  if (report.passed()) {
    fmt::print("\nPASSED ({} interfaces)\n", report.results.size());
  } else {
    fmt::print("\nFAILED ({} of {} interfaces)\n", report.failureCount(), report.results.size());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const state::VerifyReport& report) {
  fmt::print("{{\n");
  fmt::print("  \"passed\": {},\n", report.passed());
  fmt::print("  \"failures\": {},\n", report.failureCount());
  fmt::print("  \"results\": [\n");
  for (std::size_t i = 0; i < report.results.size(); ++i) {
    const state::VerifyResult& result = report.results[i];
    fmt::print("    {{\n");
    fmt::print("      \"interface\": {},\n", jsonString(result.iface));
    fmt::print("      \"generatedVf\": {},\n", result.generatedVf);
    if (result.error) {
      fmt::print("      \"passed\": false,\n");
      fmt::print("      \"field\": {},\n", jsonString(result.error->field));
      fmt::print("      \"reason\": {}\n", jsonString(result.error->reason));
    } else {
      fmt::print("      \"passed\": true\n");
    }
    fmt::print("    }}{}\n", (i + 1 < report.results.size()) ? "," : "");
  }
  fmt::print("  ]\n");
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const netstate::helpers::args::ArgMap ARG_MAP = buildArgMap();
  netstate::helpers::args::ParsedArgs pargs;

  std::string error;
  const bool PARSED = netstate::helpers::args::parseArgs(argc, argv, ARG_MAP, pargs, error);
  if (pargs.has(ARG_HELP)) {
    netstate::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }
  if (!PARSED) {
    fmt::print(stderr, "Error: {}\n\n", error);
    netstate::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  state::StateDocument desired;
  if (!state::loadStateFile(std::string(pargs.value(ARG_DESIRED)), desired, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  state::StateDocument current;
  if (!state::loadStateFile(std::string(pargs.value(ARG_CURRENT)), current, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  const state::VerifyReport REPORT = state::verifyState(desired, current);

  if (pargs.has(ARG_JSON)) {
    printJson(REPORT);
  } else {
    printHuman(REPORT);
  }

  return REPORT.passed() ? 0 : 1;
}
