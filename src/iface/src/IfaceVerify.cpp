/**
 * @file IfaceVerify.cpp
 * @brief Implementation of desired vs. current interface verification.
 */

#include "src/iface/inc/IfaceVerify.hpp"

#include <string>

#include <fmt/core.h>

namespace netstate {

namespace iface {

using validator::ValidationError;
using validator::ValidationResult;

namespace {

/* ----------------------------- Comparison Helpers ----------------------------- */

template <typename T> std::string show(const std::optional<T>& value) {
  return value ? fmt::format("{}", *value) : std::string("<unset>");
}

template <typename T>
ValidationResult compareField(const std::optional<T>& desired, const std::optional<T>& current,
                              const std::string& field) {
  if (!desired || desired == current) {
    return std::nullopt;
  }
  return ValidationError{field,
                         fmt::format("desired {}, current {}", show(desired), show(current))};
}

const VfDescriptor* findVf(const SriovConfig& sriov, std::int64_t id) noexcept {
  if (!sriov.vfs) {
    return nullptr;
  }
  for (const VfDescriptor& vf : *sriov.vfs) {
    if (vf.id == id) {
      return &vf;
    }
  }
  return nullptr;
}

ValidationResult compareVf(const VfDescriptor& desired, const VfDescriptor& current) {
  const std::string PREFIX = fmt::format("{}.{}.{}.", KEY_SRIOV, KEY_VFS, desired.id);

  if (auto err = compareField(desired.macAddress, current.macAddress, PREFIX + KEY_VF_MAC_ADDRESS)) {
    return err;
  }
  if (auto err = compareField(desired.spoofCheck, current.spoofCheck, PREFIX + KEY_VF_SPOOF_CHECK)) {
    return err;
  }
  if (auto err = compareField(desired.trust, current.trust, PREFIX + KEY_VF_TRUST)) {
    return err;
  }
  if (auto err = compareField(desired.maxTxRate, current.maxTxRate, PREFIX + KEY_VF_MAX_TX_RATE)) {
    return err;
  }
  return compareField(desired.minTxRate, current.minTxRate, PREFIX + KEY_VF_MIN_TX_RATE);
}

ValidationResult compareSriov(const SriovConfig& desired, const SriovConfig& current) {
  if (auto err = compareField(desired.totalVfs, std::optional<std::int64_t>(current.declaredTotalVfs()),
                              fmt::format("{}.{}", KEY_SRIOV, KEY_TOTAL_VFS))) {
    return err;
  }
  if (!desired.vfs) {
    return std::nullopt;
  }

  for (const VfDescriptor& VF : *desired.vfs) {
    const VfDescriptor* cur = findVf(current, VF.id);
    if (cur == nullptr) {
      return ValidationError{fmt::format("{}.{}.{}", KEY_SRIOV, KEY_VFS, VF.id),
                             "desired vf not found in current state"};
    }
    if (auto err = compareVf(VF, *cur)) {
      return err;
    }
  }
  return std::nullopt;
}

ValidationResult compareEthernet(const EthernetConfig& desired, const EthernetConfig& current) {
  if (auto err = compareField(desired.autoNegotiation, current.autoNegotiation,
                              KEY_AUTO_NEGOTIATION)) {
    return err;
  }
  if (auto err = compareField(desired.speed, current.speed, KEY_SPEED)) {
    return err;
  }
  if (auto err = compareField(desired.duplex, current.duplex, KEY_DUPLEX)) {
    return err;
  }
  if (!desired.sriov) {
    return std::nullopt;
  }
  return compareSriov(*desired.sriov, current.sriov.value_or(SriovConfig{}));
}

} // namespace

/* ----------------------------- API ----------------------------- */

ValidationResult verifySnapshot(const IfaceSnapshot& desired, const IfaceSnapshot& current) {
  if (desired.base.type != InterfaceType::UNKNOWN && desired.base.type != current.base.type) {
    return ValidationError{KEY_TYPE, fmt::format("desired {}, current {}",
                                                 toString(desired.base.type),
                                                 toString(current.base.type))};
  }
  if (desired.base.state && desired.base.state != current.base.state) {
    return ValidationError{KEY_STATE,
                           fmt::format("desired {}, current {}", toString(*desired.base.state),
                                       current.base.state ? toString(*current.base.state)
                                                          : "<unset>")};
  }
  if (!desired.ethernet) {
    return std::nullopt;
  }
  return compareEthernet(*desired.ethernet, current.ethernet.value_or(EthernetConfig{}));
}

ValidationResult verifyIface(const EthernetIface& desired, const EthernetIface& current) {
  return verifySnapshot(desired.stateForVerify(), current.stateForVerify());
}

} // namespace iface

} // namespace netstate
