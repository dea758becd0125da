#ifndef GPUPROBE_GPU_DEVICE_COLLECTOR_HPP
#define GPUPROBE_GPU_DEVICE_COLLECTOR_HPP
/**
 * @file DeviceCollector.hpp
 * @brief Device selection and snapshot harvest via NVML.
 *
 * A failed attribute query never aborts collection: NVML_ERROR_NOT_SUPPORTED
 * is recorded as unavailable, any other error as its nvmlErrorString text.
 * Only session, device-count, and handle failures are fatal.
 */

#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/gpu/inc/NvmlSession.hpp"
#include "src/sensor/inc/SensorValue.hpp"

namespace gpuprobe {

namespace gpu {

/* ----------------------------- DeviceSelector ----------------------------- */

/**
 * @brief Exactly one of: device index or PCI bus id.
 */
struct DeviceSelector {
  std::optional<unsigned int> index; ///< NVML device index
  std::string busId;                 ///< PCI bus id ("0000:03:00.0"), used when index is empty

  /// @brief "index 0" or "bus id 0000:03:00.0".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Build a selector from the raw CLI values.
 * @param busId   Bus id value, if given.
 * @param index   Index value, if given (non-negative integer text).
 * @param out     Selector on success.
 * @param error   Set on failure (none or both given, malformed index).
 * @return true on success.
 */
[[nodiscard]] bool makeDeviceSelector(std::optional<std::string_view> busId,
                                      std::optional<std::string_view> index, DeviceSelector& out,
                                      std::string& error) noexcept;

/* ----------------------------- SystemInfo ----------------------------- */

/**
 * @brief Host-wide NVML information.
 */
struct SystemInfo {
  std::string driverVersion;   ///< Kernel driver version
  std::string nvmlVersion;     ///< NVML library version
  unsigned int deviceCount{0}; ///< Visible devices
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Query driver/library versions and device count.
 * @return Populated info; fields left empty/zero on failure or invalid session.
 */
[[nodiscard]] SystemInfo collectSystemInfo(const NvmlSession& session) noexcept;

/**
 * @brief Harvest every supported attribute of the selected device.
 *
 * @param session  Valid NVML session.
 * @param selector Device to query.
 * @param snapshot Output; replaced on success.
 * @param error    Set on fatal failure.
 * @return false if the session is invalid, no device is present, or the
 *         selector does not match a device.
 */
[[nodiscard]] bool collectDeviceSnapshot(const NvmlSession& session,
                                         const DeviceSelector& selector,
                                         sensor::SensorMap& snapshot,
                                         std::string& error) noexcept;

} // namespace gpu

} // namespace gpuprobe

#endif // GPUPROBE_GPU_DEVICE_COLLECTOR_HPP
