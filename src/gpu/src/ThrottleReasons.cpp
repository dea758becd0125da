/**
 * @file ThrottleReasons.cpp
 * @brief Throttle reason bitmask decode.
 */

#include "src/gpu/inc/ThrottleReasons.hpp"

#include <string> // std::string

#include "src/sensor/inc/SensorNames.hpp"

namespace gpuprobe {

namespace gpu {

namespace {

std::string flag(bool active) {
  return std::string(active ? sensor::ACTIVE : sensor::INACTIVE);
}

} // namespace

sensor::SensorMap decodeThrottleReasons(std::uint64_t bitmask) {
  sensor::SensorMap reasons;
  for (const auto& BIT : THROTTLE_REASON_BITS) {
    reasons.set(BIT.name, flag((bitmask & BIT.mask) != 0));
  }
  reasons.set(sensor::REASON_UNKNOWN, flag((bitmask & ~knownThrottleReasonMask()) != 0));
  return reasons;
}

} // namespace gpu

} // namespace gpuprobe
