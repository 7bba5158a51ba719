#ifndef NETSTATE_IFACE_SRIOV_NAMING_HPP
#define NETSTATE_IFACE_SRIOV_NAMING_HPP
/**
 * @file SriovNaming.hpp
 * @brief Kernel interface names of SR-IOV virtual functions.
 *
 * Per systemd.net-naming-scheme(7) a VF is named "<pf>v<index>". Broadcom
 * bnxt_en PFs are an exception: the PF carries an "np<port>" suffix ("n" for
 * multi-port PCI device, "p<port>" from phys_port_name) that its VFs do not.
 *
 *   PF ens2f0np0 -> VFs ens2f0v0, ens2f0v1, ...
 *   PF eth0      -> VFs eth0v0, eth0v1, ...
 *
 * @note The "np" test is a plain substring split, so any PF name containing
 *       "np" exactly once is treated as a multi-port name.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace netstate {

namespace iface {

/// Marker separating the PF base name from its bnxt phys_port_name suffix.
inline constexpr std::string_view MULTIPORT_PATTERN = "np";

/**
 * @brief Base name VF names are derived from.
 * @param pfName Physical function interface name.
 * @return Part before "np" when the name splits into exactly two parts on it,
 *         otherwise @p pfName unchanged.
 */
[[nodiscard]] std::string vfNameBase(std::string_view pfName);

/**
 * @brief Interface name of VF @p index on PF @p pfName.
 */
[[nodiscard]] std::string vfName(std::string_view pfName, std::int64_t index);

/**
 * @brief VF interface names removed when the VF count shrinks.
 * @param pfName PF interface name.
 * @param oldTotalVfs VF count before the change.
 * @param newTotalVfs VF count after the change.
 * @return Names for indices [newTotalVfs, oldTotalVfs) in ascending order;
 *         empty when the count does not decrease. oldTotalVfs is clamped to
 *         SRIOV_MAX_TOTAL_VFS.
 */
[[nodiscard]] std::vector<std::string> deletedVfNames(std::string_view pfName,
                                                      std::int64_t oldTotalVfs,
                                                      std::int64_t newTotalVfs);

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_SRIOV_NAMING_HPP
