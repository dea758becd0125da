#ifndef GPUPROBE_SENSOR_NAMES_HPP
#define GPUPROBE_SENSOR_NAMES_HPP
/**
 * @file SensorNames.hpp
 * @brief Snapshot key names shared by collector, thresholds, and evaluators.
 */

#include <array>       // std::array
#include <string_view> // std::string_view

namespace gpuprobe {

namespace sensor {

/* ----------------------------- Identity (excluded) ----------------------------- */

inline constexpr std::string_view DEVICE_INDEX = "deviceIndex";
inline constexpr std::string_view PRODUCT_NAME = "productName";
inline constexpr std::string_view PCI_BUS_ID = "pciBusId";

/* ----------------------------- Continuous ----------------------------- */

inline constexpr std::string_view GPU_TEMPERATURE = "GPUTemperature";
inline constexpr std::string_view USED_MEMORY = "usedMemory"; ///< Percent
inline constexpr std::string_view MEMORY_TOTAL = "memoryTotal";
inline constexpr std::string_view MEMORY_USED = "memoryUsed";
inline constexpr std::string_view FAN_SPEED = "fanSpeed";
inline constexpr std::string_view PWR_USAGE = "PWRUsage";

inline constexpr std::string_view CLOCKS = "clocks";
inline constexpr std::string_view GRAPHICS_CLOCK = "graphicsClock";
inline constexpr std::string_view SM_CLOCK = "smClock";
inline constexpr std::string_view MEM_CLOCK = "memClock";
inline constexpr std::string_view VIDEO_CLOCK = "videoClock";

/// Aggregate single-bit ECC counters, in threshold-slot order.
inline constexpr std::string_view ECC_MEM_AGG_SGL = "ECCMemAggSgl";
inline constexpr std::string_view ECC_L1_AGG_SGL = "ECCL1AggSgl";
inline constexpr std::string_view ECC_L2_AGG_SGL = "ECCL2AggSgl";
inline constexpr std::string_view ECC_REG_AGG_SGL = "ECCRegAggSgl";
inline constexpr std::string_view ECC_TEX_AGG_SGL = "ECCTexAggSgl";

/* ----------------------------- Discrete ----------------------------- */

inline constexpr std::string_view ECC_ERRORS = "eccErrors";
inline constexpr std::string_view ECC_MEM_AGG_DBL = "ECCMemAggDbl";
inline constexpr std::string_view ECC_L1_AGG_DBL = "ECCL1AggDbl";
inline constexpr std::string_view ECC_L2_AGG_DBL = "ECCL2AggDbl";
inline constexpr std::string_view ECC_REG_AGG_DBL = "ECCRegAggDbl";
inline constexpr std::string_view ECC_TEX_AGG_DBL = "ECCTexAggDbl";

/// Double-bit family: names with this prefix and suffix.
inline constexpr std::string_view ECC_PREFIX = "ECC";
inline constexpr std::string_view DOUBLE_BIT_SUFFIX = "Dbl";

inline constexpr std::string_view PERSISTENCE_MODE = "persistenceMode";
inline constexpr std::string_view INFOROM_VALID = "inforomValid";
inline constexpr std::string_view POWER_MANAGEMENT = "powerManagement";
inline constexpr std::string_view COMPUTE_MODE = "computeMode";
inline constexpr std::string_view THROTTLE_REASONS = "clocksThrottleReasons";

inline constexpr std::string_view PCIE_LINK = "pcieLink";
inline constexpr std::string_view PCIE_LINK_GEN = "PCIeLinkGen";
inline constexpr std::string_view PCIE_LINK_WIDTH = "PCIeLinkWidth";
inline constexpr std::string_view PCIE_LINK_GEN_MAX = "PCIeLinkGenMax";
inline constexpr std::string_view PCIE_LINK_WIDTH_MAX = "PCIeLinkWidthMax";

/* ----------------------------- Discrete values ----------------------------- */

inline constexpr std::string_view ENABLED = "enabled";
inline constexpr std::string_view DISABLED = "disabled";
inline constexpr std::string_view VALID = "valid";
inline constexpr std::string_view INVALID = "invalid";
inline constexpr std::string_view ACTIVE = "active";
inline constexpr std::string_view INACTIVE = "inactive";

/// Throttle reasons that indicate a hardware problem.
inline constexpr std::string_view REASON_HW_SLOWDOWN = "hwSlowdown";
inline constexpr std::string_view REASON_UNKNOWN = "unknown";

/* ----------------------------- Exclusion Set ----------------------------- */

/// Keys never displayed nor compared against thresholds.
inline constexpr std::array<std::string_view, 3> EXCLUDED_KEYS = {DEVICE_INDEX, PRODUCT_NAME,
                                                                  PCI_BUS_ID};

} // namespace sensor

} // namespace gpuprobe

#endif // GPUPROBE_SENSOR_NAMES_HPP
