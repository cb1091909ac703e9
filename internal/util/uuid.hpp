#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace fleet::util {

/*
  UUID helpers

  Node ids and configure keys are RFC4122 version 4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewUuidString() {
  return ToString(GenerateUUID());
}

} // namespace fleet::util
