#ifndef NETSTATE_STATE_STATE_VERIFY_HPP
#define NETSTATE_STATE_STATE_VERIFY_HPP
/**
 * @file StateVerify.hpp
 * @brief Document-level verification of desired against current state.
 */

#include "src/state/inc/StateDocument.hpp"
#include "src/validator/inc/FieldValidator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace netstate {

namespace state {

/* ----------------------------- VerifyResult ----------------------------- */

/**
 * @brief Verification outcome for one interface.
 */
struct VerifyResult {
  std::string iface;
  bool generatedVf{false}; ///< Interface synthesized from a PF's total-vfs
  std::optional<validator::ValidationError> error;

  [[nodiscard]] bool passed() const noexcept { return !error.has_value(); }

  /// @brief "<iface>: OK" or "<iface>: FAIL <field>: <reason>".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Results for every interface of a desired document.
 */
struct VerifyReport {
  std::vector<VerifyResult> results;

  [[nodiscard]] bool passed() const noexcept;
  [[nodiscard]] std::size_t failureCount() const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Verify every desired interface against the current document.
 * @param desired Desired document.
 * @param current Observed document.
 * @return One result per desired interface in document order, each SR-IOV
 *         PF followed by one result per VF it generates.
 *
 * Absent interfaces pass unless the current document reports them up.
 * Present interfaces must exist in current state and match every field
 * they set. Desired VF descriptors beyond total-vfs are
 * trimmed before comparison.
 */
[[nodiscard]] VerifyReport verifyState(const StateDocument& desired, const StateDocument& current);

} // namespace state

} // namespace netstate

#endif // NETSTATE_STATE_STATE_VERIFY_HPP
