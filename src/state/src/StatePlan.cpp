/**
 * @file StatePlan.cpp
 * @brief Implementation of desired-vs-current reconciliation.
 */

#include "src/state/inc/StatePlan.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <optional>
#include <utility>

#include <fmt/core.h>

namespace netstate {

namespace state {

using helpers::strings::join;
using iface::EthernetIface;

namespace {

inline std::string listOrDash(const std::vector<std::string>& names) {
  return names.empty() ? std::string("-") : join(names, ", ");
}

} // namespace

/* ----------------------------- SriovPlan Methods ----------------------------- */

std::string SriovPlan::toString() const {
  std::string out = fmt::format("{}: total-vfs {} -> {}", pfName, oldTotalVfs, newTotalVfs);
  if (trimmedDescriptors > 0) {
    out += fmt::format(", {} vf descriptor(s) trimmed", trimmedDescriptors);
  }
  if (!vfsCoverAll) {
    out += ", vf list partial";
  }
  out += "\n";
  out += fmt::format("  new vfs:      {}\n", listOrDash(newVfs));
  out += fmt::format("  existing vfs: {}\n", listOrDash(existingVfs));
  out += fmt::format("  deleted vfs:  {}\n", listOrDash(deletedVfs));
  return out;
}

/* ----------------------------- StatePlan Methods ----------------------------- */

std::string StatePlan::toString() const {
  if (error) {
    return fmt::format("Invalid {}: {}\n", failedIface, error->toString());
  }
  std::string out;
  out += fmt::format("add:    {}\n", listOrDash(addIfaces));
  out += fmt::format("change: {}\n", listOrDash(changeIfaces));
  out += fmt::format("delete: {}\n", listOrDash(deleteIfaces));
  for (const SriovPlan& pf : sriov) {
    out += pf.toString();
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

SriovPlan planSriov(EthernetIface& pf, const EthernetIface* currentPf,
                    const StateDocument& current) {
  SriovPlan plan{};
  plan.pfName = pf.name();
  plan.newTotalVfs = pf.sriovTotalVfs();
  plan.oldTotalVfs = (currentPf != nullptr) ? currentPf->sriovTotalVfs() : 0;
  plan.vfsCoverAll = pf.totalVfsMatchesVfList(plan.newTotalVfs);
  plan.trimmedDescriptors = pf.trimVfDescriptors();

  for (const EthernetIface& vf : pf.generateVfs()) {
    if (current.find(vf.name()) != nullptr) {
      plan.existingVfs.push_back(vf.name());
    } else {
      plan.newVfs.push_back(vf.name());
    }
  }

  plan.deletedVfs = pf.deletedVfInterfaceNames(plan.oldTotalVfs);
  return plan;
}

StatePlan planState(const StateDocument& desired, const StateDocument& current) {
  StatePlan plan{};

  for (const EthernetIface& want : desired.interfaces) {
    const EthernetIface* have = current.find(want.name());

    if (want.base().isAbsent()) {
      if (have != nullptr && !have->base().isAbsent()) {
        plan.deleteIfaces.push_back(want.name());
      }
      continue;
    }

    EthernetIface target = (have != nullptr) ? *have : want;
    if (have != nullptr) {
      target.merge(want);
    }

    validator::ValidationResult result = target.preEditValidationAndCleanup();
    if (result) {
      plan.error = std::move(result);
      plan.failedIface = want.name();
      return plan;
    }

    // Descriptors beyond total-vfs are trimmed before the change check.
    std::optional<SriovPlan> pfPlan;
    if (target.isSriov()) {
      pfPlan = planSriov(target, have, current);
    }

    if (have == nullptr) {
      plan.addIfaces.push_back(target.name());
    } else if (target.stateForVerify() != have->stateForVerify()) {
      plan.changeIfaces.push_back(target.name());
    }

    if (pfPlan) {
      for (const std::string& name : pfPlan->deletedVfs) {
        plan.deleteIfaces.push_back(name);
      }
      plan.sriov.push_back(std::move(*pfPlan));
    }

    plan.merged.push_back(std::move(target));
  }

  return plan;
}

} // namespace state

} // namespace netstate
