#ifndef NETSTATE_IFACE_ETHERNET_VALIDATION_HPP
#define NETSTATE_IFACE_ETHERNET_VALIDATION_HPP
/**
 * @file EthernetValidation.hpp
 * @brief Field checks for the ethernet and sr-iov subtrees.
 */

#include "src/iface/inc/EthernetConfig.hpp"
#include "src/validator/inc/FieldValidator.hpp"

#include <array>
#include <string_view>

namespace netstate {

namespace iface {

/* ----------------------------- Constants ----------------------------- */

/// Accepted duplex values.
inline constexpr std::array<std::string_view, 2> DUPLEX_VALID_VALUES{"full", "half"};

/// VF MAC address: 4 to 32 colon-separated hex octets.
inline constexpr std::string_view VF_MAC_ADDRESS_PATTERN = "^([a-fA-F0-9]{2}:){3,31}[a-fA-F0-9]{2}$";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Validate every Ethernet and SR-IOV field, stopping at the first failure.
 * @param config Config to check (not modified).
 * @return std::nullopt when valid, otherwise the first rejected field.
 *
 * Order: duplex, speed, sr-iov total-vfs, then per VF in declaration order:
 * id, mac-address, max-tx-rate, min-tx-rate. Boolean fields are typed and
 * were checked when the document was loaded.
 */
[[nodiscard]] validator::ValidationResult validateEthernet(const EthernetConfig& config);

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_ETHERNET_VALIDATION_HPP
