#ifndef NETSTATE_IFACE_ETHERNET_IFACE_HPP
#define NETSTATE_IFACE_ETHERNET_IFACE_HPP
/**
 * @file EthernetIface.hpp
 * @brief Ethernet interface entity with SR-IOV VF lifecycle helpers.
 *
 * EthernetIface composes the generic BaseIface with the Ethernet subtree.
 * Merge, pre-edit validation and verification run the Ethernet-specific step
 * and delegate the generic part to BaseIface.
 *
 * VF entities synthesized by generateVfs() carry IfaceOrigin::GENERATED_VF.
 * The origin lives beside the entity data, so it is never part of a loaded or
 * emitted document and never reaches a verification snapshot.
 */

#include "src/iface/inc/BaseIface.hpp"
#include "src/iface/inc/EthernetConfig.hpp"
#include "src/validator/inc/FieldValidator.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstate {

namespace iface {

/* ----------------------------- IfaceOrigin ----------------------------- */

/**
 * @brief Where an interface entity came from.
 */
enum class IfaceOrigin : std::uint8_t {
  DECLARED = 0, ///< Loaded from a state document
  GENERATED_VF, ///< Synthesized from a PF's total-vfs
};

/* ----------------------------- IfaceSnapshot ----------------------------- */

/**
 * @brief Comparable state of one interface after verification filtering.
 *
 * Unset fields are not compared.
 */
struct IfaceSnapshot {
  BaseIface base{};
  std::optional<EthernetConfig> ethernet;

  [[nodiscard]] std::string toString() const;

  bool operator==(const IfaceSnapshot&) const = default;
};

/* ----------------------------- EthernetIface ----------------------------- */

class EthernetIface {
public:
  EthernetIface() = default;
  EthernetIface(BaseIface base, std::optional<EthernetConfig> ethernet);

  /* ----------------------------- Accessors ----------------------------- */

  [[nodiscard]] const std::string& name() const noexcept { return base_.name; }
  [[nodiscard]] const BaseIface& base() const noexcept { return base_; }
  [[nodiscard]] BaseIface& base() noexcept { return base_; }
  [[nodiscard]] const std::optional<EthernetConfig>& ethernet() const noexcept { return ethernet_; }
  [[nodiscard]] std::optional<EthernetConfig>& ethernet() noexcept { return ethernet_; }
  [[nodiscard]] IfaceOrigin origin() const noexcept { return origin_; }

  /// @brief True for entities produced by generateVfs().
  [[nodiscard]] bool isGeneratedVf() const noexcept { return origin_ == IfaceOrigin::GENERATED_VF; }

  [[nodiscard]] std::optional<bool> autoNegotiation() const;
  [[nodiscard]] std::optional<std::int64_t> speed() const;
  [[nodiscard]] std::optional<std::string> duplex() const;

  /// @brief True when sr-iov sets total-vfs or vfs; an empty subtree does not count.
  [[nodiscard]] bool isSriov() const noexcept;

  /// @brief Declared VF count, 0 without an sr-iov subtree.
  [[nodiscard]] std::int64_t sriovTotalVfs() const noexcept;

  /// @brief Declared VF descriptors, empty when unset.
  [[nodiscard]] const std::vector<VfDescriptor>& sriovVfs() const noexcept;

  /* ----------------------------- Entity Contract ----------------------------- */

  /**
   * @brief Overlay @p other (desired) onto this entity (current), then canonicalize.
   *
   * The origin is not merged.
   */
  void merge(const EthernetIface& other);

  /**
   * @brief Validate before any apply action and canonicalize the subtree.
   * @return First rejected field; Ethernet fields are checked before the base.
   */
  [[nodiscard]] validator::ValidationResult preEditValidationAndCleanup();

  /**
   * @brief Snapshot for post-apply verification.
   *
   * VF MACs are upper-cased and the subtree canonicalized. Generated VFs lose
   * their administrative state: while the PF's VF count changes the kernel
   * state of a VF cannot be predicted.
   */
  [[nodiscard]] IfaceSnapshot stateForVerify() const;

  /* ----------------------------- SR-IOV ----------------------------- */

  /**
   * @brief Synthesize the VF entities for the declared VF count.
   * @return One down, generated Ethernet entity per index in [0, total-vfs).
   * @note Results are transient; do not store them back into a document.
   */
  [[nodiscard]] std::vector<EthernetIface> generateVfs() const;

  /// @brief Drop VF descriptors beyond total-vfs. Returns the number removed.
  std::size_t trimVfDescriptors();

  /// @brief VF interface names to delete when total-vfs shrank from @p oldTotalVfs.
  [[nodiscard]] std::vector<std::string> deletedVfInterfaceNames(std::int64_t oldTotalVfs) const;

  /// @brief True when the descriptor list length equals @p totalVfs.
  [[nodiscard]] bool totalVfsMatchesVfList(std::int64_t totalVfs) const noexcept;

  /// @brief Multi-line dump.
  [[nodiscard]] std::string toString() const;

private:
  BaseIface base_{};
  std::optional<EthernetConfig> ethernet_;
  IfaceOrigin origin_{IfaceOrigin::DECLARED};
};

} // namespace iface

} // namespace netstate

#endif // NETSTATE_IFACE_ETHERNET_IFACE_HPP
