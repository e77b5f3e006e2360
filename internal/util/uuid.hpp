#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace sessionkeeper::util {

/*
  UUID helpers

  Session ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateSessionId();

} // namespace sessionkeeper::util
