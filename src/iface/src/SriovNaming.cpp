/**
 * @file SriovNaming.cpp
 * @brief Implementation of SR-IOV VF name derivation.
 */

#include "src/iface/inc/SriovNaming.hpp"
#include "src/iface/inc/EthernetConfig.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace netstate {

namespace iface {

using netstate::helpers::strings::splitOn;

std::string vfNameBase(std::string_view pfName) {
  const std::vector<std::string> PARTS = splitOn(pfName, MULTIPORT_PATTERN);
  if (PARTS.size() == 2) {
    return PARTS.front();
  }
  return std::string(pfName);
}

std::string vfName(std::string_view pfName, std::int64_t index) {
  return fmt::format("{}v{}", vfNameBase(pfName), index);
}

std::vector<std::string> deletedVfNames(std::string_view pfName, std::int64_t oldTotalVfs,
                                        std::int64_t newTotalVfs) {
  std::vector<std::string> names;
  const std::int64_t FIRST = (newTotalVfs > 0) ? newTotalVfs : 0;
  const std::int64_t LAST = std::min(oldTotalVfs, SRIOV_MAX_TOTAL_VFS);
  if (FIRST >= LAST) {
    return names;
  }

  const std::string BASE = vfNameBase(pfName);
  names.reserve(static_cast<std::size_t>(LAST - FIRST));
  for (std::int64_t i = FIRST; i < LAST; ++i) {
    names.push_back(fmt::format("{}v{}", BASE, i));
  }
  return names;
}

} // namespace iface

} // namespace netstate
