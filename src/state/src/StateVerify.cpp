/**
 * @file StateVerify.cpp
 * @brief Implementation of document-level verification.
 */

#include "src/state/inc/StateVerify.hpp"
#include "src/iface/inc/IfaceVerify.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace netstate {

namespace state {

using iface::EthernetIface;
using validator::ValidationError;

namespace {

VerifyResult verifyOne(const EthernetIface& want, const StateDocument& current) {
  VerifyResult result{want.name(), want.isGeneratedVf(), std::nullopt};
  const EthernetIface* have = current.find(want.name());

  if (want.base().isAbsent()) {
    // Physical ports cannot be removed, only brought down.
    if (have != nullptr && have->base().isUp()) {
      result.error = ValidationError{iface::KEY_STATE, "desired absent, current up"};
    }
    return result;
  }

  if (have == nullptr) {
    result.error = ValidationError{iface::KEY_NAME, "interface not found in current state"};
    return result;
  }

  result.error = iface::verifyIface(want, *have);
  return result;
}

} // namespace

/* ----------------------------- VerifyResult Methods ----------------------------- */

std::string VerifyResult::toString() const {
  const char* SUFFIX = generatedVf ? " (generated vf)" : "";
  if (error) {
    return fmt::format("{}{}: FAIL {}", iface, SUFFIX, error->toString());
  }
  return fmt::format("{}{}: OK", iface, SUFFIX);
}

/* ----------------------------- VerifyReport Methods ----------------------------- */

bool VerifyReport::passed() const noexcept { return failureCount() == 0; }

std::size_t VerifyReport::failureCount() const noexcept {
  return static_cast<std::size_t>(std::count_if(
      results.begin(), results.end(), [](const VerifyResult& r) { return !r.passed(); }));
}

/* ----------------------------- API ----------------------------- */

VerifyReport verifyState(const StateDocument& desired, const StateDocument& current) {
  VerifyReport report{};

  for (const EthernetIface& declared : desired.interfaces) {
    EthernetIface want = declared;
    want.trimVfDescriptors();
    report.results.push_back(verifyOne(want, current));

    if (want.base().isAbsent()) {
      continue;
    }
    for (const EthernetIface& vf : want.generateVfs()) {
      report.results.push_back(verifyOne(vf, current));
    }
  }

  return report;
}

} // namespace state

} // namespace netstate
