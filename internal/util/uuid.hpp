#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace slotkeeper::util {

/*
  UUID helpers

  Queued messages and bookings are keyed by the canonical text form of a
  random RFC4122 v4 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace slotkeeper::util
