#ifndef GPUPROBE_GPU_THROTTLE_REASONS_HPP
#define GPUPROBE_GPU_THROTTLE_REASONS_HPP
/**
 * @file ThrottleReasons.hpp
 * @brief Decode of the NVML clocks throttle (event) reason bitmask.
 *
 * Bit values match nvmlClocksThrottleReason* in nvml.h. They are repeated here
 * so decoding does not require the NVML header.
 */

#include <array>       // std::array
#include <cstdint>     // std::uint64_t
#include <string_view> // std::string_view

#include "src/sensor/inc/SensorValue.hpp"

namespace gpuprobe {

namespace gpu {

/* ----------------------------- Reason Table ----------------------------- */

/**
 * @brief One named throttle reason bit.
 */
struct ThrottleReasonBit {
  std::uint64_t mask;    ///< Bit in the NVML reason mask
  std::string_view name; ///< Snapshot key
};

/// Known reasons, in report order.
inline constexpr std::array<ThrottleReasonBit, 9> THROTTLE_REASON_BITS{{
    {0x0000000000000001ULL, "gpuIdle"},
    {0x0000000000000002ULL, "applicationsClocksSetting"},
    {0x0000000000000004ULL, "swPowerCap"},
    {0x0000000000000008ULL, "hwSlowdown"},
    {0x0000000000000010ULL, "syncBoost"},
    {0x0000000000000020ULL, "swThermalSlowdown"},
    {0x0000000000000040ULL, "hwThermalSlowdown"},
    {0x0000000000000080ULL, "hwPowerBrakeSlowdown"},
    {0x0000000000000100ULL, "displayClockSetting"},
}};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Expand a reason bitmask into "active"/"inactive" flags.
 *
 * Every known reason gets an entry, followed by "unknown", which is active
 * when any bit outside the known table is set.
 *
 * @param bitmask Value from nvmlDeviceGetCurrentClocksEventReasons.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] sensor::SensorMap decodeThrottleReasons(std::uint64_t bitmask);

/// @brief Union of all known reason bits.
[[nodiscard]] constexpr std::uint64_t knownThrottleReasonMask() noexcept {
  std::uint64_t mask = 0;
  for (const auto& BIT : THROTTLE_REASON_BITS) {
    mask |= BIT.mask;
  }
  return mask;
}

} // namespace gpu

} // namespace gpuprobe

#endif // GPUPROBE_GPU_THROTTLE_REASONS_HPP
