/**
 * @file EthernetConfig.cpp
 * @brief Implementation of Ethernet config merge and canonicalization.
 */

#include "src/iface/inc/EthernetConfig.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace netstate {

namespace iface {

using netstate::helpers::strings::toUpper;

namespace {

/* ----------------------------- Helpers ----------------------------- */

template <typename T> inline void overlay(std::optional<T>& dst, const std::optional<T>& src) {
  if (src) {
    dst = src;
  }
}

inline const char* onOff(bool value) noexcept { return value ? "on" : "off"; }

} // namespace

/* ----------------------------- VfDescriptor Methods ----------------------------- */

std::string VfDescriptor::toString() const {
  std::string out = fmt::format("vf {}", id);
  if (macAddress) {
    out += fmt::format(" mac={}", *macAddress);
  }
  if (spoofCheck) {
    out += fmt::format(" spoof-check={}", onOff(*spoofCheck));
  }
  if (trust) {
    out += fmt::format(" trust={}", onOff(*trust));
  }
  if (maxTxRate) {
    out += fmt::format(" max-tx={}", *maxTxRate);
  }
  if (minTxRate) {
    out += fmt::format(" min-tx={}", *minTxRate);
  }
  return out;
}

/* ----------------------------- EthernetConfig Methods ----------------------------- */

void EthernetConfig::merge(const EthernetConfig& other) {
  overlay(autoNegotiation, other.autoNegotiation);
  overlay(speed, other.speed);
  overlay(duplex, other.duplex);

  if (!other.sriov) {
    return;
  }
  if (!sriov) {
    sriov = other.sriov;
    return;
  }
  overlay(sriov->totalVfs, other.sriov->totalVfs);
  overlay(sriov->vfs, other.sriov->vfs);
}

std::string EthernetConfig::toString() const {
  std::string out;
  if (autoNegotiation) {
    out += fmt::format("  auto-negotiation: {}\n", onOff(*autoNegotiation));
  }
  if (speed) {
    out += fmt::format("  speed: {} Mbps\n", *speed);
  }
  if (duplex) {
    out += fmt::format("  duplex: {}\n", *duplex);
  }
  if (sriov) {
    out += fmt::format("  sr-iov: total-vfs={} vfs={}\n", sriov->declaredTotalVfs(),
                       sriov->vfCount());
    if (sriov->vfs) {
      for (const VfDescriptor& VF : *sriov->vfs) {
        out += "    " + VF.toString() + "\n";
      }
    }
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

void canonicalize(EthernetConfig& config) {
  if (config.autoNegotiation.value_or(false)) {
    config.speed.reset();
    config.duplex.reset();
  }
}

void normalizeVfMacs(EthernetConfig& config) {
  if (!config.sriov || !config.sriov->vfs) {
    return;
  }
  for (VfDescriptor& vf : *config.sriov->vfs) {
    if (vf.macAddress && !vf.macAddress->empty()) {
      vf.macAddress = toUpper(*vf.macAddress);
    }
  }
}

std::size_t trimVfDescriptors(EthernetConfig& config) {
  if (!config.sriov || !config.sriov->vfs) {
    return 0;
  }

  const std::int64_t TOTAL = config.sriov->declaredTotalVfs();
  const std::size_t KEEP = (TOTAL > 0) ? static_cast<std::size_t>(TOTAL) : 0;

  std::vector<VfDescriptor>& vfs = *config.sriov->vfs;
  std::size_t removed = 0;
  while (vfs.size() > KEEP) {
    vfs.pop_back();
    ++removed;
  }
  return removed;
}

bool totalVfsMatchesList(std::int64_t totalVfs, const std::vector<VfDescriptor>& vfs) noexcept {
  return totalVfs >= 0 && static_cast<std::size_t>(totalVfs) == vfs.size();
}

} // namespace iface

} // namespace netstate
