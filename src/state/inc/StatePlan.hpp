#ifndef NETSTATE_STATE_STATE_PLAN_HPP
#define NETSTATE_STATE_STATE_PLAN_HPP
/**
 * @file StatePlan.hpp
 * @brief Desired-vs-current reconciliation plan for Ethernet interfaces.
 *
 * planState() merges every desired interface onto its current counterpart,
 * validates and canonicalizes the result, then works out the SR-IOV VF
 * changes for each PF. Nothing is applied; the plan only describes what an
 * apply step would do.
 */

#include "src/iface/inc/EthernetIface.hpp"
#include "src/state/inc/StateDocument.hpp"
#include "src/validator/inc/FieldValidator.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstate {

namespace state {

/* ----------------------------- SriovPlan ----------------------------- */

/**
 * @brief SR-IOV changes for one physical function.
 */
struct SriovPlan {
  std::string pfName;
  std::int64_t oldTotalVfs{0};          ///< Count in current state, 0 when unknown
  std::int64_t newTotalVfs{0};          ///< Count after merge
  std::size_t trimmedDescriptors{0};    ///< VF descriptors dropped beyond newTotalVfs
  bool vfsCoverAll{false};              ///< Descriptor list covers every declared VF
  std::vector<std::string> newVfs;      ///< VFs that appear with this change
  std::vector<std::string> existingVfs; ///< VFs already present in current state
  std::vector<std::string> deletedVfs;  ///< VFs removed by a shrinking count

  /// @brief Multi-line human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- StatePlan ----------------------------- */

/**
 * @brief Result of reconciling a desired document against a current one.
 *
 * On a validation failure the plan holds the first error and the name of
 * the interface that produced it; the lists hold whatever was planned
 * before the failure.
 */
struct StatePlan {
  std::vector<std::string> addIfaces;        ///< Desired, not in current state
  std::vector<std::string> changeIfaces;     ///< In current state, merged state differs
  std::vector<std::string> deleteIfaces;     ///< Marked absent, or VFs removed by a shrink
  std::vector<iface::EthernetIface> merged;  ///< Merged, validated desired interfaces
  std::vector<SriovPlan> sriov;              ///< One entry per SR-IOV PF

  std::optional<validator::ValidationError> error;
  std::string failedIface;

  [[nodiscard]] bool isValid() const noexcept { return !error.has_value(); }

  /// @brief Multi-line human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Work out the VF changes for one merged, validated PF.
 * @param pf Desired PF after merge. Its VF descriptor list is trimmed in place.
 * @param currentPf Current state of the PF, nullptr when it has none.
 * @param current Current document, used to tell new VFs from existing ones.
 * @return Plan for @p pf. The coverage flag reflects the list before trimming.
 */
[[nodiscard]] SriovPlan planSriov(iface::EthernetIface& pf, const iface::EthernetIface* currentPf,
                                  const StateDocument& current);

/**
 * @brief Reconcile @p desired against @p current.
 * @param desired Desired document.
 * @param current Current document, may be empty.
 * @return Plan built in desired document order, stopping at the first
 *         validation failure.
 */
[[nodiscard]] StatePlan planState(const StateDocument& desired, const StateDocument& current);

} // namespace state

} // namespace netstate

#endif // NETSTATE_STATE_STATE_PLAN_HPP
