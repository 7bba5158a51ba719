/**
 * @file BaseIface.cpp
 * @brief Implementation of the generic interface entity.
 */

#include "src/iface/inc/BaseIface.hpp"

#include <fmt/core.h>

namespace netstate {

namespace iface {

/* ----------------------------- Enum Conversion ----------------------------- */

const char* toString(InterfaceType type) noexcept {
  switch (type) {
  case InterfaceType::UNKNOWN:
    return "unknown";
  case InterfaceType::ETHERNET:
    return "ethernet";
  }
  return "unknown";
}

std::optional<InterfaceType> parseInterfaceType(std::string_view name) noexcept {
  if (name == "ethernet") {
    return InterfaceType::ETHERNET;
  }
  if (name == "unknown") {
    return InterfaceType::UNKNOWN;
  }
  return std::nullopt;
}

const char* toString(InterfaceState state) noexcept {
  switch (state) {
  case InterfaceState::UP:
    return "up";
  case InterfaceState::DOWN:
    return "down";
  case InterfaceState::ABSENT:
    return "absent";
  }
  return "unknown";
}

std::optional<InterfaceState> parseInterfaceState(std::string_view name) noexcept {
  if (name == "up") {
    return InterfaceState::UP;
  }
  if (name == "down") {
    return InterfaceState::DOWN;
  }
  if (name == "absent") {
    return InterfaceState::ABSENT;
  }
  return std::nullopt;
}

/* ----------------------------- BaseIface Methods ----------------------------- */

void BaseIface::merge(const BaseIface& other) {
  if (other.type != InterfaceType::UNKNOWN) {
    type = other.type;
  }
  if (other.state) {
    state = other.state;
  }
}

validator::ValidationResult BaseIface::preEditValidationAndCleanup() const {
  if (name.empty()) {
    return validator::ValidationError{KEY_NAME, "interface name must not be empty"};
  }
  return std::nullopt;
}

BaseIface BaseIface::stateForVerify() const { return *this; }

bool BaseIface::isAbsent() const noexcept { return state == InterfaceState::ABSENT; }

bool BaseIface::isUp() const noexcept { return state == InterfaceState::UP; }

std::string BaseIface::toString() const {
  return fmt::format("{} [{}] {}", name, iface::toString(type),
                     state ? iface::toString(*state) : "-");
}

} // namespace iface

} // namespace netstate
