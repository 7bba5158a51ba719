/**
 * @file EthernetValidation.cpp
 * @brief Implementation of Ethernet and SR-IOV field checks.
 */

#include "src/iface/inc/EthernetValidation.hpp"

namespace netstate {

namespace iface {

using validator::validateInteger;
using validator::validatePattern;
using validator::validateString;
using validator::ValidationResult;

namespace {

ValidationResult validateVf(const VfDescriptor& vf) {
  if (auto err = validateInteger(vf.id, KEY_VF_ID, 0)) {
    return err;
  }
  if (auto err = validatePattern(vf.macAddress, KEY_VF_MAC_ADDRESS, VF_MAC_ADDRESS_PATTERN)) {
    return err;
  }
  if (auto err = validateInteger(vf.maxTxRate, KEY_VF_MAX_TX_RATE, 0)) {
    return err;
  }
  return validateInteger(vf.minTxRate, KEY_VF_MIN_TX_RATE, 0);
}

} // namespace

ValidationResult validateEthernet(const EthernetConfig& config) {
  if (auto err = validateString(config.duplex, KEY_DUPLEX, DUPLEX_VALID_VALUES)) {
    return err;
  }
  if (auto err = validateInteger(config.speed, KEY_SPEED, 0)) {
    return err;
  }
  if (!config.sriov) {
    return std::nullopt;
  }

  if (auto err =
          validateInteger(config.sriov->totalVfs, KEY_TOTAL_VFS, 0, SRIOV_MAX_TOTAL_VFS)) {
    return err;
  }
  if (config.sriov->vfs) {
    for (const VfDescriptor& VF : *config.sriov->vfs) {
      if (auto err = validateVf(VF)) {
        return err;
      }
    }
  }
  return std::nullopt;
}

} // namespace iface

} // namespace netstate
