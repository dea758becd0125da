#ifndef GPUPROBE_SENSOR_CLASSIFIER_HPP
#define GPUPROBE_SENSOR_CLASSIFIER_HPP
/**
 * @file SensorClassifier.hpp
 * @brief Splits a device snapshot into performance data and discrete sensors.
 *
 * Continuous sensors are numeric leaves; they form the Performance Record that
 * is graphed by the monitoring system and compared against range thresholds.
 * Everything else (enum text, error text, "N/A") is status-only.
 */

#include <cstdint>     // std::int64_t
#include <map>         // std::map
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <variant>     // std::variant
#include <vector>      // std::vector

#include "src/sensor/inc/SensorValue.hpp"

namespace gpuprobe {

namespace sensor {

/* ----------------------------- PerfRecord ----------------------------- */

/// Numeric reading: integers kept exactly, floating values rounded to 2 dp.
using PerfValue = std::variant<std::int64_t, double>;

/// Flat name -> value view of one snapshot.
using PerfRecord = std::map<std::string, PerfValue>;

/// @brief Numeric value as double for comparisons.
[[nodiscard]] double toDouble(const PerfValue& value) noexcept;

/// @brief "42" for integers, "42.50" for floating values.
[[nodiscard]] std::string toString(const PerfValue& value);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check Exclusion Set membership.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] bool isExcluded(std::string_view name) noexcept;

/**
 * @brief Numeric view of a leaf value.
 *
 * Integers and floating values map directly. Text matching an integer pattern
 * becomes an integer; text matching a decimal pattern is rounded to 2 dp.
 *
 * @return Value, or std::nullopt for non-numeric text, unavailable, or nested.
 */
[[nodiscard]] std::optional<PerfValue> numericValue(const SensorValue& value) noexcept;

/**
 * @brief Flatten a snapshot into a Performance Record.
 *
 * When filter is non-empty, only top-level keys named in it are visited.
 * Nested maps reached from a visited key are walked unfiltered. Excluded keys
 * are skipped at every depth.
 *
 * @param snapshot Device snapshot.
 * @param filter   Optional top-level sensor names.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] PerfRecord buildPerfRecord(const SensorMap& snapshot,
                                         const std::vector<std::string>& filter = {});

/**
 * @brief Find a sensor by name at any depth (depth-first, insertion order).
 * @return Pointer into snapshot, or nullptr if absent.
 */
[[nodiscard]] const SensorValue* findSensor(const SensorMap& snapshot,
                                            std::string_view name) noexcept;

/**
 * @brief Visit every non-nested sensor at any depth, skipping excluded keys.
 * @tparam Fn Callable as fn(const std::string& name, const SensorValue& value).
 */
template <typename Fn> void forEachLeaf(const SensorMap& snapshot, Fn&& fn) {
  for (const auto& ENTRY : snapshot) {
    if (isExcluded(ENTRY.name)) {
      continue;
    }
    if (const SensorMap* nested = std::get_if<SensorMap>(&ENTRY.value)) {
      forEachLeaf(*nested, fn);
    } else {
      fn(ENTRY.name, ENTRY.value);
    }
  }
}

} // namespace sensor

} // namespace gpuprobe

#endif // GPUPROBE_SENSOR_CLASSIFIER_HPP
