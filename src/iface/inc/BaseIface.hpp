#ifndef NETSTATE_IFACE_BASE_IFACE_HPP
#define NETSTATE_IFACE_BASE_IFACE_HPP
/**
 * @file BaseIface.hpp
 * @brief Interface identity and administrative state shared by every interface type.
 *
 * BaseIface carries the fields every interface in a state document has. Typed
 * interfaces (EthernetIface) hold a BaseIface and forward the generic parts of
 * merge, validation and verification to it.
 */

#include "src/validator/inc/FieldValidator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netstate {

namespace iface {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Interface kind as named in the document "type" key.
 */
enum class InterfaceType : std::uint8_t {
  UNKNOWN = 0, ///< Type omitted in the document
  ETHERNET,    ///< Physical or SR-IOV virtual Ethernet device
};

/**
 * @brief Convert InterfaceType to its document spelling.
 * @return Static string ("unknown", "ethernet").
 */
[[nodiscard]] const char* toString(InterfaceType type) noexcept;

/**
 * @brief Parse an InterfaceType from its document spelling.
 * @return Parsed type, or std::nullopt for an unrecognized name.
 */
[[nodiscard]] std::optional<InterfaceType> parseInterfaceType(std::string_view name) noexcept;

/**
 * @brief Administrative state requested for an interface.
 */
enum class InterfaceState : std::uint8_t {
  UP = 0, ///< Configured and brought up
  DOWN,   ///< Configured but kept down
  ABSENT, ///< Removed (virtual) or deconfigured (physical)
};

/**
 * @brief Convert InterfaceState to its document spelling.
 * @return Static string ("up", "down", "absent").
 */
[[nodiscard]] const char* toString(InterfaceState state) noexcept;

/**
 * @brief Parse an InterfaceState from its document spelling.
 * @return Parsed state, or std::nullopt for an unrecognized name.
 */
[[nodiscard]] std::optional<InterfaceState> parseInterfaceState(std::string_view name) noexcept;

/* ----------------------------- BaseIface ----------------------------- */

/// Document key of the interface name.
inline constexpr const char* KEY_NAME = "name";

/// Document key of the interface type.
inline constexpr const char* KEY_TYPE = "type";

/// Document key of the administrative state.
inline constexpr const char* KEY_STATE = "state";

/**
 * @brief Name, type and state of one interface.
 */
struct BaseIface {
  std::string name{};                  ///< Kernel interface name, unique per document
  InterfaceType type{InterfaceType::UNKNOWN};
  std::optional<InterfaceState> state; ///< Absent when the document leaves it unset

  /// @brief Overlay the fields @p other sets. The name is identity and is kept.
  void merge(const BaseIface& other);

  /// @brief Reject entities that cannot be applied (empty name).
  [[nodiscard]] validator::ValidationResult preEditValidationAndCleanup() const;

  /// @brief Comparable copy used by post-apply verification.
  [[nodiscard]] BaseIface stateForVerify() const;

  [[nodiscard]] bool isAbsent() const noexcept;
  [[nodiscard]] bool isUp() const noexcept;

  /// @brief "name [type] state".
  [[nodiscard]] std::string toString() const;

  bool operator==(const BaseIface&) const = default;
};

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_BASE_IFACE_HPP
