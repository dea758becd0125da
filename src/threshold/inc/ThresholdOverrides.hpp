#ifndef GPUPROBE_THRESHOLD_OVERRIDES_HPP
#define GPUPROBE_THRESHOLD_OVERRIDES_HPP
/**
 * @file ThresholdOverrides.hpp
 * @brief Threshold overrides from positional CLI lists and YAML config files.
 *
 * Positional lists address fixed slots; the placeholder "d" keeps the default.
 * Config files address sensors by name and are applied after CLI lists, so a
 * sensor named in both takes the config value.
 *
 * Config file format:
 * @code
 *   GPUTemperature: [80, 95]   # range: [warning, critical]
 *   PCIeLinkGen: 3             # equality: expected value (or [3])
 *   PCIeLinkWidth: [8, 16]     # equality: critical element is the expected value
 * @endcode
 */

#include <array>       // std::array
#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/sensor/inc/SensorNames.hpp"
#include "src/threshold/inc/ThresholdTable.hpp"

namespace gpuprobe {

namespace threshold {

/* ----------------------------- Slots ----------------------------- */

/**
 * @brief Which positional list is being applied.
 */
enum class ListKind : std::uint8_t {
  Warning = 0, ///< -w: 9 slots
  Critical = 1 ///< -c: 11 slots (adds PCIe link generation and width)
};

/// Placeholder that keeps a slot's default.
inline constexpr std::string_view KEEP_DEFAULT = "d";

/// Warning list slot order.
inline constexpr std::array<std::string_view, 9> WARNING_SLOTS = {
    sensor::GPU_TEMPERATURE, sensor::USED_MEMORY,     sensor::FAN_SPEED,
    sensor::ECC_MEM_AGG_SGL, sensor::ECC_L1_AGG_SGL,  sensor::ECC_L2_AGG_SGL,
    sensor::ECC_REG_AGG_SGL, sensor::ECC_TEX_AGG_SGL, sensor::PWR_USAGE};

/// Critical list slot order.
inline constexpr std::array<std::string_view, 11> CRITICAL_SLOTS = {
    sensor::GPU_TEMPERATURE, sensor::USED_MEMORY,     sensor::FAN_SPEED,
    sensor::ECC_MEM_AGG_SGL, sensor::ECC_L1_AGG_SGL,  sensor::ECC_L2_AGG_SGL,
    sensor::ECC_REG_AGG_SGL, sensor::ECC_TEX_AGG_SGL, sensor::PWR_USAGE,
    sensor::PCIE_LINK_GEN,   sensor::PCIE_LINK_WIDTH};

/// @brief "warning" / "critical".
[[nodiscard]] const char* toString(ListKind kind) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Apply a comma-separated positional threshold list.
 *
 * Each field is "d" (keep) or a number. Shorter lists leave trailing slots
 * untouched. Longer lists, empty fields, and non-numeric fields are rejected
 * and leave the table unchanged.
 *
 * @param list  List text, e.g. "90,d,85".
 * @param kind  Warning or critical slot layout.
 * @param table Table to update.
 * @param error Set on failure.
 * @return true on success.
 */
[[nodiscard]] bool applyThresholdList(std::string_view list, ListKind kind, ThresholdTable& table,
                                      std::string& error) noexcept;

/**
 * @brief Apply YAML threshold overrides from text.
 *
 * Sensors holding an equality threshold take a scalar, a one-element list,
 * or [warning, critical] whose critical element becomes the expected value.
 * All other sensors take [warning, critical]; unknown names are added as
 * range thresholds. An empty document applies nothing.
 *
 * @param yamlText Document text.
 * @param table    Table to update (unchanged on failure).
 * @param error    Set on failure.
 * @return true on success.
 */
[[nodiscard]] bool applyThresholdConfig(const std::string& yamlText, ThresholdTable& table,
                                        std::string& error) noexcept;

/**
 * @brief Load a YAML threshold file and apply it to the table.
 * @param path  File path.
 * @param table Table to update (unchanged on failure).
 * @param error Set on failure (missing file, parse error, bad entry).
 * @return true on success.
 */
[[nodiscard]] bool loadThresholdConfig(const std::string& path, ThresholdTable& table,
                                       std::string& error) noexcept;

} // namespace threshold

} // namespace gpuprobe

#endif // GPUPROBE_THRESHOLD_OVERRIDES_HPP
