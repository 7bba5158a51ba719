#ifndef NETSTATE_IFACE_ETHERNET_CONFIG_HPP
#define NETSTATE_IFACE_ETHERNET_CONFIG_HPP
/**
 * @file EthernetConfig.hpp
 * @brief Ethernet link settings and SR-IOV virtual-function declarations.
 *
 * Every document field is an explicit std::optional so "unset" stays distinct
 * from false/zero through merge and verification. Validation lives in
 * EthernetValidation.hpp; the transformations here assume validated input and
 * never fail.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstate {

namespace iface {

/* ----------------------------- Document Keys ----------------------------- */

inline constexpr const char* KEY_ETHERNET = "ethernet";
inline constexpr const char* KEY_AUTO_NEGOTIATION = "auto-negotiation";
inline constexpr const char* KEY_SPEED = "speed";
inline constexpr const char* KEY_DUPLEX = "duplex";
inline constexpr const char* KEY_SRIOV = "sr-iov";
inline constexpr const char* KEY_TOTAL_VFS = "total-vfs";
inline constexpr const char* KEY_VFS = "vfs";
inline constexpr const char* KEY_VF_ID = "id";
inline constexpr const char* KEY_VF_MAC_ADDRESS = "mac-address";
inline constexpr const char* KEY_VF_SPOOF_CHECK = "spoof-check";
inline constexpr const char* KEY_VF_TRUST = "trust";
inline constexpr const char* KEY_VF_MAX_TX_RATE = "max-tx-rate";
inline constexpr const char* KEY_VF_MIN_TX_RATE = "min-tx-rate";

/// PCI SR-IOV capability TotalVFs is a 16-bit field.
inline constexpr std::int64_t SRIOV_MAX_TOTAL_VFS = 65535;

/* ----------------------------- VfDescriptor ----------------------------- */

/**
 * @brief Per-VF settings declared under sr-iov.vfs.
 */
struct VfDescriptor {
  std::int64_t id{0};                    ///< VF index on the PF
  std::optional<std::string> macAddress; ///< Colon-separated hex octets
  std::optional<bool> spoofCheck;        ///< MAC anti-spoof filtering
  std::optional<bool> trust;             ///< Trusted VF (may change MAC, promisc)
  std::optional<std::int64_t> maxTxRate; ///< Mbps, 0 disables the limit
  std::optional<std::int64_t> minTxRate; ///< Mbps, 0 disables the guarantee

  /// @brief "vf <id>" followed by every set field.
  [[nodiscard]] std::string toString() const;

  bool operator==(const VfDescriptor&) const = default;
};

/* ----------------------------- SriovConfig ----------------------------- */

/**
 * @brief SR-IOV subtree of a physical function.
 */
struct SriovConfig {
  std::optional<std::int64_t> totalVfs;          ///< Declared VF count
  std::optional<std::vector<VfDescriptor>> vfs;  ///< Per-VF settings, in declaration order

  /// @brief Declared VF count, 0 when unset.
  [[nodiscard]] std::int64_t declaredTotalVfs() const noexcept { return totalVfs.value_or(0); }

  /// @brief Number of VF descriptors, 0 when the list is unset.
  [[nodiscard]] std::size_t vfCount() const noexcept { return vfs ? vfs->size() : 0; }

  bool operator==(const SriovConfig&) const = default;
};

/* ----------------------------- EthernetConfig ----------------------------- */

/**
 * @brief The "ethernet" subtree of an interface.
 */
struct EthernetConfig {
  std::optional<bool> autoNegotiation;
  std::optional<std::int64_t> speed; ///< Mbps
  std::optional<std::string> duplex; ///< "full" or "half" once validated
  std::optional<SriovConfig> sriov;

  /**
   * @brief Overlay the fields @p other sets onto this config.
   *
   * Scalars are replaced when set in @p other. Inside sr-iov, total-vfs is
   * replaced when set and a set vfs list replaces the current list whole.
   */
  void merge(const EthernetConfig& other);

  /// @brief Multi-line dump of every set field.
  [[nodiscard]] std::string toString() const;

  bool operator==(const EthernetConfig&) const = default;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Drop speed and duplex when auto-negotiation is enabled.
 * @param config Config to canonicalize in place.
 *
 * Idempotent. Speed and duplex are kept when auto-negotiation is false or unset.
 */
void canonicalize(EthernetConfig& config);

/**
 * @brief Upper-case every declared VF MAC address.
 * @param config Config to normalize in place.
 */
void normalizeVfMacs(EthernetConfig& config);

/**
 * @brief Drop trailing VF descriptors beyond the declared VF count.
 * @param config Config to reconcile in place.
 * @return Number of descriptors removed.
 *
 * Descriptors are removed from the end one at a time, so the retained
 * lowest-indexed entries keep their order and content.
 */
std::size_t trimVfDescriptors(EthernetConfig& config);

/**
 * @brief Check whether a VF descriptor list covers exactly the declared count.
 * @param totalVfs Declared VF count.
 * @param vfs Declared descriptors.
 */
[[nodiscard]] bool totalVfsMatchesList(std::int64_t totalVfs,
                                       const std::vector<VfDescriptor>& vfs) noexcept;

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_ETHERNET_CONFIG_HPP
