/**
 * @file StateDocument.cpp
 * @brief YAML loading of network state documents.
 */

#include "src/state/inc/StateDocument.hpp"

#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace netstate {

namespace state {

using iface::BaseIface;
using iface::EthernetConfig;
using iface::EthernetIface;
using iface::InterfaceState;
using iface::InterfaceType;
using iface::SriovConfig;
using iface::VfDescriptor;

namespace {

/* ----------------------------- Node Helpers ----------------------------- */

const char* nodeKind(const YAML::Node& node) noexcept {
  if (!node || node.IsNull()) {
    return "null";
  }
  if (node.IsScalar()) {
    return "scalar";
  }
  if (node.IsSequence()) {
    return "sequence";
  }
  if (node.IsMap()) {
    return "map";
  }
  return "unknown";
}

inline std::string childPath(const std::string& parent, const char* key) {
  return parent.empty() ? std::string(key) : fmt::format("{}.{}", parent, key);
}

inline bool typeError(const std::string& path, const char* expected, const YAML::Node& node,
                      std::string& error) {
  error = fmt::format("{}: expected {}, got {}", path, expected, nodeKind(node));
  return false;
}

/// True for a missing key or an explicit null value; both mean "unset".
inline bool isUnset(const YAML::Node& node) noexcept { return !node || node.IsNull(); }

/* ----------------------------- Scalar Readers ----------------------------- */

template <typename T>
bool readScalar(const YAML::Node& parent, const char* key, const std::string& parentPath,
                const char* expected, std::optional<T>& out, std::string& error) {
  const YAML::Node NODE = parent[key];
  if (isUnset(NODE)) {
    return true;
  }
  const std::string PATH = childPath(parentPath, key);
  if (!NODE.IsScalar()) {
    return typeError(PATH, expected, NODE, error);
  }
  try {
    out = NODE.as<T>();
  } catch (const YAML::BadConversion&) {
    error = fmt::format("{}: expected {}, got '{}'", PATH, expected, NODE.Scalar());
    return false;
  }
  return true;
}

inline bool readBool(const YAML::Node& parent, const char* key, const std::string& parentPath,
                     std::optional<bool>& out, std::string& error) {
  return readScalar(parent, key, parentPath, "boolean", out, error);
}

inline bool readInt(const YAML::Node& parent, const char* key, const std::string& parentPath,
                    std::optional<std::int64_t>& out, std::string& error) {
  return readScalar(parent, key, parentPath, "integer", out, error);
}

inline bool readString(const YAML::Node& parent, const char* key, const std::string& parentPath,
                       std::optional<std::string>& out, std::string& error) {
  return readScalar(parent, key, parentPath, "string", out, error);
}

/* ----------------------------- Subtree Readers ----------------------------- */

bool readVf(const YAML::Node& node, const std::string& path, VfDescriptor& vf,
            std::string& error) {
  if (!node.IsMap()) {
    return typeError(path, "map", node, error);
  }

  std::optional<std::int64_t> id;
  if (!readInt(node, iface::KEY_VF_ID, path, id, error)) {
    return false;
  }
  if (!id) {
    error = fmt::format("{}: required", childPath(path, iface::KEY_VF_ID));
    return false;
  }
  vf.id = *id;

  return readString(node, iface::KEY_VF_MAC_ADDRESS, path, vf.macAddress, error) &&
         readBool(node, iface::KEY_VF_SPOOF_CHECK, path, vf.spoofCheck, error) &&
         readBool(node, iface::KEY_VF_TRUST, path, vf.trust, error) &&
         readInt(node, iface::KEY_VF_MAX_TX_RATE, path, vf.maxTxRate, error) &&
         readInt(node, iface::KEY_VF_MIN_TX_RATE, path, vf.minTxRate, error);
}

bool readSriov(const YAML::Node& node, const std::string& path, SriovConfig& sriov,
               std::string& error) {
  if (!node.IsMap()) {
    return typeError(path, "map", node, error);
  }
  if (!readInt(node, iface::KEY_TOTAL_VFS, path, sriov.totalVfs, error)) {
    return false;
  }

  const YAML::Node VFS = node[iface::KEY_VFS];
  if (isUnset(VFS)) {
    return true;
  }
  const std::string VFS_PATH = childPath(path, iface::KEY_VFS);
  if (!VFS.IsSequence()) {
    return typeError(VFS_PATH, "sequence", VFS, error);
  }

  std::vector<VfDescriptor> vfs;
  vfs.reserve(VFS.size());
  for (std::size_t i = 0; i < VFS.size(); ++i) {
    VfDescriptor vf{};
    if (!readVf(VFS[i], fmt::format("{}[{}]", VFS_PATH, i), vf, error)) {
      return false;
    }
    vfs.push_back(std::move(vf));
  }
  sriov.vfs = std::move(vfs);
  return true;
}

bool readEthernet(const YAML::Node& node, const std::string& path, EthernetConfig& cfg,
                  std::string& error) {
  if (!node.IsMap()) {
    return typeError(path, "map", node, error);
  }
  if (!readBool(node, iface::KEY_AUTO_NEGOTIATION, path, cfg.autoNegotiation, error) ||
      !readInt(node, iface::KEY_SPEED, path, cfg.speed, error) ||
      !readString(node, iface::KEY_DUPLEX, path, cfg.duplex, error)) {
    return false;
  }

  const YAML::Node SRIOV = node[iface::KEY_SRIOV];
  if (isUnset(SRIOV)) {
    return true;
  }
  SriovConfig sriov{};
  if (!readSriov(SRIOV, childPath(path, iface::KEY_SRIOV), sriov, error)) {
    return false;
  }
  cfg.sriov = std::move(sriov);
  return true;
}

bool readIface(const YAML::Node& node, const std::string& path, EthernetIface& out,
               std::string& error) {
  if (!node.IsMap()) {
    return typeError(path, "map", node, error);
  }

  BaseIface base{};

  std::optional<std::string> name;
  if (!readString(node, iface::KEY_NAME, path, name, error)) {
    return false;
  }
  if (!name) {
    error = fmt::format("{}: required", childPath(path, iface::KEY_NAME));
    return false;
  }
  base.name = std::move(*name);

  std::optional<std::string> typeName;
  if (!readString(node, iface::KEY_TYPE, path, typeName, error)) {
    return false;
  }
  if (typeName) {
    const std::optional<InterfaceType> TYPE = iface::parseInterfaceType(*typeName);
    if (!TYPE) {
      error = fmt::format("{}: unsupported interface type '{}'", childPath(path, iface::KEY_TYPE),
                          *typeName);
      return false;
    }
    base.type = *TYPE;
  }

  std::optional<std::string> stateName;
  if (!readString(node, iface::KEY_STATE, path, stateName, error)) {
    return false;
  }
  if (stateName) {
    const std::optional<InterfaceState> STATE = iface::parseInterfaceState(*stateName);
    if (!STATE) {
      error = fmt::format("{}: unknown interface state '{}'", childPath(path, iface::KEY_STATE),
                          *stateName);
      return false;
    }
    base.state = *STATE;
  }

  std::optional<EthernetConfig> ethernet;
  const YAML::Node ETHERNET = node[iface::KEY_ETHERNET];
  if (!isUnset(ETHERNET)) {
    EthernetConfig cfg{};
    if (!readEthernet(ETHERNET, childPath(path, iface::KEY_ETHERNET), cfg, error)) {
      return false;
    }
    ethernet = std::move(cfg);
  }

  out = EthernetIface{std::move(base), std::move(ethernet)};
  return true;
}

bool readDocument(const YAML::Node& root, StateDocument& doc, std::string& error) {
  StateDocument parsed{};
  if (isUnset(root)) {
    doc = std::move(parsed);
    return true;
  }
  if (!root.IsMap()) {
    return typeError("<root>", "map", root, error);
  }

  const YAML::Node LIST = root[KEY_INTERFACES];
  if (!isUnset(LIST)) {
    if (!LIST.IsSequence()) {
      return typeError(KEY_INTERFACES, "sequence", LIST, error);
    }

    std::set<std::string> seen;
    parsed.interfaces.reserve(LIST.size());
    for (std::size_t i = 0; i < LIST.size(); ++i) {
      const std::string PATH = fmt::format("{}[{}]", KEY_INTERFACES, i);
      EthernetIface entry{};
      if (!readIface(LIST[i], PATH, entry, error)) {
        return false;
      }
      if (!seen.insert(entry.name()).second) {
        error = fmt::format("{}: duplicate interface '{}'", childPath(PATH, iface::KEY_NAME),
                            entry.name());
        return false;
      }
      parsed.interfaces.push_back(std::move(entry));
    }
  }

  doc = std::move(parsed);
  return true;
}

} // namespace

/* ----------------------------- StateDocument Methods ----------------------------- */

const EthernetIface* StateDocument::find(std::string_view name) const noexcept {
  for (const EthernetIface& entry : interfaces) {
    if (entry.name() == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::string StateDocument::toString() const {
  std::string out;
  for (const EthernetIface& entry : interfaces) {
    out += entry.toString();
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

bool loadStateDocument(std::string_view yamlText, StateDocument& doc, std::string& error) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yamlText));
  } catch (const YAML::Exception& e) {
    error = fmt::format("YAML parse error: {}", e.what());
    return false;
  }
  return readDocument(root, doc, error);
}

bool loadStateFile(const std::string& path, StateDocument& doc, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = fmt::format("cannot open '{}'", path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();

  if (!loadStateDocument(buf.str(), doc, error)) {
    error = fmt::format("{}: {}", path, error);
    return false;
  }
  return true;
}

} // namespace state

} // namespace netstate
