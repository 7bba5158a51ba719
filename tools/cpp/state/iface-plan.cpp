/**
 * @file iface-plan.cpp
 * @brief Reconcile a desired Ethernet/SR-IOV state document against current state.
 *
 * Merges, canonicalizes and validates every desired interface, then prints
 * which interfaces would be added, changed or deleted and which SR-IOV VFs
 * appear or disappear. Nothing is applied.
 */

#include "src/state/inc/StateDocument.hpp"
#include "src/state/inc/StatePlan.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace state = netstate::state;

using netstate::helpers::format::jsonString;
using netstate::helpers::format::jsonStringArray;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DESIRED = 1,
  ARG_CURRENT = 2,
  ARG_JSON = 3,
  ARG_VERBOSE = 4,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Plan the interface and SR-IOV VF changes needed to reach a desired state.";

/// Build argument definitions.
netstate::helpers::args::ArgMap buildArgMap() {
  netstate::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DESIRED] = {"--desired", 1, true, "Desired state YAML file"};
  map[ARG_CURRENT] = {"--current", 1, false, "Current state YAML file (default: none)"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Trace steps to stderr and show the merged desired state"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const state::StatePlan& plan, bool verbose) {
  fmt::print("=== Interface Plan ===\n");
  fmt::print("{}", plan.toString());

  if (verbose && !plan.merged.empty()) {
    fmt::print("\n=== Merged State ===\n");
    for (const auto& iface : plan.merged) {
      fmt::print("{}", iface.toString());
    }
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const state::StatePlan& plan) {
  fmt::print("{{\n");
  fmt::print("  \"valid\": {},\n", plan.isValid());

  if (!plan.isValid()) {
    fmt::print("  \"error\": {{\n");
    fmt::print("    \"interface\": {},\n", jsonString(plan.failedIface));
    fmt::print("    \"field\": {},\n", jsonString(plan.error->field));
    fmt::print("    \"reason\": {}\n", jsonString(plan.error->reason));
    fmt::print("  }}\n");
    fmt::print("}}\n");
    return;
  }

  fmt::print("  \"add\": {},\n", jsonStringArray(plan.addIfaces));
  fmt::print("  \"change\": {},\n", jsonStringArray(plan.changeIfaces));
  fmt::print("  \"delete\": {},\n", jsonStringArray(plan.deleteIfaces));

  fmt::print("  \"sriov\": [\n");
  for (std::size_t i = 0; i < plan.sriov.size(); ++i) {
    const state::SriovPlan& pf = plan.sriov[i];
    fmt::print("    {{\n");
    fmt::print("      \"pf\": {},\n", jsonString(pf.pfName));
    fmt::print("      \"oldTotalVfs\": {},\n", pf.oldTotalVfs);
    fmt::print("      \"newTotalVfs\": {},\n", pf.newTotalVfs);
    fmt::print("      \"trimmedDescriptors\": {},\n", pf.trimmedDescriptors);
    fmt::print("      \"vfsCoverAll\": {},\n", pf.vfsCoverAll);
    fmt::print("      \"newVfs\": {},\n", jsonStringArray(pf.newVfs));
    fmt::print("      \"existingVfs\": {},\n", jsonStringArray(pf.existingVfs));
    fmt::print("      \"deletedVfs\": {}\n", jsonStringArray(pf.deletedVfs));
    fmt::print("    }}{}\n", (i + 1 < plan.sriov.size()) ? "," : "");
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

  const bool JSON_OUTPUT = pargs.has(ARG_JSON);
  const bool VERBOSE = pargs.has(ARG_VERBOSE);

  const std::string DESIRED_PATH(pargs.value(ARG_DESIRED));
  state::StateDocument desired;
  if (!state::loadStateFile(DESIRED_PATH, desired, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  if (VERBOSE) {
    fmt::print(stderr, "loaded {} desired interface(s) from {}\n", desired.interfaces.size(),
               DESIRED_PATH);
  }

  state::StateDocument current;
  if (pargs.has(ARG_CURRENT)) {
    const std::string CURRENT_PATH(pargs.value(ARG_CURRENT));
    if (!state::loadStateFile(CURRENT_PATH, current, error)) {
      fmt::print(stderr, "Error: {}\n", error);
      return 1;
    }
    if (VERBOSE) {
      fmt::print(stderr, "loaded {} current interface(s) from {}\n", current.interfaces.size(),
                 CURRENT_PATH);
    }
  } else if (VERBOSE) {
    fmt::print(stderr, "no current state given, planning from scratch\n");
  }

  const state::StatePlan PLAN = state::planState(desired, current);
  if (VERBOSE) {
    fmt::print(stderr, "planned {} interface(s), {} sr-iov pf(s)\n", PLAN.merged.size(),
               PLAN.sriov.size());
  }

  if (JSON_OUTPUT) {
    printJson(PLAN);
    return PLAN.isValid() ? 0 : 1;
  }

  // The JSON document carries the error itself; human mode reports it once.
  if (!PLAN.isValid()) {
    fmt::print(stderr, "Error: {}: {}\n", PLAN.failedIface, PLAN.error->toString());
    return 1;
  }

  printHuman(PLAN, VERBOSE);
  return 0;
}
