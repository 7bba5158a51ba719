/**
 * @file EthernetIface.cpp
 * @brief Implementation of the Ethernet interface entity.
 */

#include "src/iface/inc/EthernetIface.hpp"
#include "src/iface/inc/EthernetValidation.hpp"
#include "src/iface/inc/SriovNaming.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace netstate {

namespace iface {

/* ----------------------------- IfaceSnapshot Methods ----------------------------- */

std::string IfaceSnapshot::toString() const {
  std::string out = base.toString() + "\n";
  if (ethernet) {
    out += ethernet->toString();
  }
  return out;
}

/* ----------------------------- EthernetIface ----------------------------- */

EthernetIface::EthernetIface(BaseIface base, std::optional<EthernetConfig> ethernet)
    : base_(std::move(base)), ethernet_(std::move(ethernet)) {}

std::optional<bool> EthernetIface::autoNegotiation() const {
  return ethernet_ ? ethernet_->autoNegotiation : std::nullopt;
}

std::optional<std::int64_t> EthernetIface::speed() const {
  return ethernet_ ? ethernet_->speed : std::nullopt;
}

std::optional<std::string> EthernetIface::duplex() const {
  return ethernet_ ? ethernet_->duplex : std::nullopt;
}

bool EthernetIface::isSriov() const noexcept {
  return ethernet_ && ethernet_->sriov && (ethernet_->sriov->totalVfs || ethernet_->sriov->vfs);
}

std::int64_t EthernetIface::sriovTotalVfs() const noexcept {
  return isSriov() ? ethernet_->sriov->declaredTotalVfs() : 0;
}

const std::vector<VfDescriptor>& EthernetIface::sriovVfs() const noexcept {
  static const std::vector<VfDescriptor> EMPTY{};
  if (!isSriov() || !ethernet_->sriov->vfs) {
    return EMPTY;
  }
  return *ethernet_->sriov->vfs;
}

void EthernetIface::merge(const EthernetIface& other) {
  base_.merge(other.base_);

  if (other.ethernet_) {
    if (ethernet_) {
      ethernet_->merge(*other.ethernet_);
    } else {
      ethernet_ = other.ethernet_;
    }
  }

  if (ethernet_) {
    canonicalize(*ethernet_);
  }
}

validator::ValidationResult EthernetIface::preEditValidationAndCleanup() {
  if (ethernet_) {
    if (auto err = validateEthernet(*ethernet_)) {
      return err;
    }
    canonicalize(*ethernet_);
  }
  return base_.preEditValidationAndCleanup();
}

IfaceSnapshot EthernetIface::stateForVerify() const {
  IfaceSnapshot snap{base_.stateForVerify(), ethernet_};
  if (snap.ethernet) {
    normalizeVfMacs(*snap.ethernet);
    canonicalize(*snap.ethernet);
  }
  if (isGeneratedVf()) {
    snap.base.state.reset();
  }
  return snap;
}

std::vector<EthernetIface> EthernetIface::generateVfs() const {
  // Current state is never validated; clamp to what hardware can expose.
  const std::int64_t TOTAL = std::min(sriovTotalVfs(), SRIOV_MAX_TOTAL_VFS);
  std::vector<EthernetIface> vfs;
  if (TOTAL <= 0) {
    return vfs;
  }

  vfs.reserve(static_cast<std::size_t>(TOTAL));
  for (std::int64_t i = 0; i < TOTAL; ++i) {
    EthernetIface vf{BaseIface{vfName(name(), i), InterfaceType::ETHERNET, InterfaceState::DOWN},
                     std::nullopt};
    vf.origin_ = IfaceOrigin::GENERATED_VF;
    vfs.push_back(std::move(vf));
  }
  return vfs;
}

std::size_t EthernetIface::trimVfDescriptors() {
  return ethernet_ ? iface::trimVfDescriptors(*ethernet_) : 0;
}

std::vector<std::string> EthernetIface::deletedVfInterfaceNames(std::int64_t oldTotalVfs) const {
  return deletedVfNames(name(), oldTotalVfs, sriovTotalVfs());
}

bool EthernetIface::totalVfsMatchesVfList(std::int64_t totalVfs) const noexcept {
  return totalVfsMatchesList(totalVfs, sriovVfs());
}

std::string EthernetIface::toString() const {
  std::string out = base_.toString();
  if (isGeneratedVf()) {
    out += " (generated vf)";
  }
  out += "\n";
  if (ethernet_) {
    out += ethernet_->toString();
  }
  return out;
}

} // namespace iface

} // namespace netstate
