#ifndef NETSTATE_STATE_STATE_DOCUMENT_HPP
#define NETSTATE_STATE_STATE_DOCUMENT_HPP
/**
 * @file StateDocument.hpp
 * @brief YAML network state documents.
 *
 * Document shape:
 * @code
 * interfaces:
 *   - name: eth1
 *     type: ethernet
 *     state: up
 *     ethernet:
 *       auto-negotiation: false
 *       speed: 10000
 *       duplex: full
 *       sr-iov:
 *         total-vfs: 2
 *         vfs:
 *           - id: 0
 *             mac-address: 00:11:22:33:44:55
 *             spoof-check: true
 *             trust: false
 *             max-tx-rate: 1000
 *             min-tx-rate: 0
 * @endcode
 *
 * Loading checks scalar types only (a speed must be an integer, trust a
 * boolean). Range, enum and pattern checks run later in
 * EthernetIface::preEditValidationAndCleanup().
 */

#include "src/iface/inc/EthernetIface.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace netstate {

namespace state {

/// Top-level document key listing interfaces.
inline constexpr const char* KEY_INTERFACES = "interfaces";

/* ----------------------------- StateDocument ----------------------------- */

/**
 * @brief Interfaces of one desired or current state document, in document order.
 */
struct StateDocument {
  std::vector<iface::EthernetIface> interfaces;

  /// @brief Find an interface by name, nullptr when absent.
  [[nodiscard]] const iface::EthernetIface* find(std::string_view name) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return interfaces.empty(); }

  /// @brief Dump of every interface.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse a state document from YAML text.
 * @param yamlText Document text.
 * @param doc Output document (replaced on success).
 * @param error Set to "<path>: <problem>" on failure.
 * @return true on success.
 *
 * An empty document or a document without "interfaces" yields no interfaces.
 */
[[nodiscard]] bool loadStateDocument(std::string_view yamlText, StateDocument& doc,
                                     std::string& error);

/**
 * @brief Parse a state document from a YAML file.
 * @param path File to read.
 * @param doc Output document (replaced on success).
 * @param error Set on read or parse failure.
 * @return true on success.
 */
[[nodiscard]] bool loadStateFile(const std::string& path, StateDocument& doc, std::string& error);

} // namespace state

} // namespace netstate

#endif // NETSTATE_STATE_STATE_DOCUMENT_HPP
