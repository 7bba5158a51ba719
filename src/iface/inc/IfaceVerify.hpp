#ifndef NETSTATE_IFACE_IFACE_VERIFY_HPP
#define NETSTATE_IFACE_IFACE_VERIFY_HPP
/**
 * @file IfaceVerify.hpp
 * @brief Post-apply comparison of desired against observed interface state.
 *
 * Only fields present in the desired snapshot are compared. A field the
 * desired state leaves unset (or that stateForVerify() masked) never fails
 * verification, whatever the current value.
 */

#include "src/iface/inc/EthernetIface.hpp"
#include "src/validator/inc/FieldValidator.hpp"

namespace netstate {

namespace iface {

/**
 * @brief Compare two verification snapshots.
 * @param desired Snapshot of the desired interface.
 * @param current Snapshot of the observed interface.
 * @return First mismatching field as ValidationError{field, "desired X, current Y"}.
 *
 * VF descriptors are matched by id; every field the desired descriptor sets
 * must equal the current descriptor's value.
 */
[[nodiscard]] validator::ValidationResult verifySnapshot(const IfaceSnapshot& desired,
                                                         const IfaceSnapshot& current);

/**
 * @brief Verify an interface: snapshots both sides and compares them.
 */
[[nodiscard]] validator::ValidationResult verifyIface(const EthernetIface& desired,
                                                      const EthernetIface& current);

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_IFACE_VERIFY_HPP
