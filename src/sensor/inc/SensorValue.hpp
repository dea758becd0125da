#ifndef GPUPROBE_SENSOR_VALUE_HPP
#define GPUPROBE_SENSOR_VALUE_HPP
/**
 * @file SensorValue.hpp
 * @brief Device snapshot model: tagged sensor values and nested sensor maps.
 * @note Snapshots are built once per run and read-only during evaluation.
 */

#include <cstddef>     // std::size_t
#include <cstdint>     // std::int64_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::forward
#include <variant>     // std::variant
#include <vector>      // std::vector

namespace gpuprobe {

namespace sensor {

/// Display text for a sensor the hardware does not support.
inline constexpr std::string_view NOT_AVAILABLE = "N/A";

/* ----------------------------- Unavailable ----------------------------- */

/**
 * @brief Marker for a reading the device reported as unsupported.
 */
struct Unavailable {
  bool operator==(const Unavailable&) const noexcept = default;
};

/* ----------------------------- SensorMap ----------------------------- */

struct SensorEntry;

/**
 * @brief Insertion-ordered mapping from sensor name to value.
 *
 * Names are unique: set() replaces an existing entry in place.
 */
class SensorMap {
public:
  using const_iterator = std::vector<SensorEntry>::const_iterator;

  SensorMap();
  SensorMap(const SensorMap&);
  SensorMap(SensorMap&&) noexcept;
  SensorMap& operator=(const SensorMap&);
  SensorMap& operator=(SensorMap&&) noexcept;
  ~SensorMap();

  /// @brief Insert or replace a named value.
  template <typename T> void set(std::string_view name, T&& value);

  /// @brief Look up a direct child; nullptr if absent.
  [[nodiscard]] const SensorEntry* find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
  }
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;

  bool operator==(const SensorMap& other) const;

private:
  SensorEntry& slot(std::string_view name);

  std::vector<SensorEntry> entries_;
};

/* ----------------------------- SensorValue ----------------------------- */

/**
 * @brief One reading: integer, floating, text (enum value or error text),
 *        unavailable, or a nested group of readings.
 */
using SensorValue = std::variant<std::int64_t, double, std::string, Unavailable, SensorMap>;

/**
 * @brief Named sensor value.
 */
struct SensorEntry {
  std::string name;  ///< Sensor name (snapshot key)
  SensorValue value; ///< Reading

  bool operator==(const SensorEntry&) const = default;
};

/// Device snapshot: top-level sensor map for one GPU.
using DeviceSnapshot = SensorMap;

template <typename T> void SensorMap::set(std::string_view name, T&& value) {
  slot(name).value = SensorValue(std::forward<T>(value));
}

/* ----------------------------- Queries ----------------------------- */

/// @brief True if the value is the unavailable marker.
[[nodiscard]] bool isUnavailable(const SensorValue& value) noexcept;

/// @brief True if the value is a nested sensor map.
[[nodiscard]] bool isNested(const SensorValue& value) noexcept;

/// @brief Text alternative, or nullptr.
[[nodiscard]] const std::string* asText(const SensorValue& value) noexcept;

/**
 * @brief True if every leaf under value is unavailable.
 * @note A leaf is any non-nested value. An empty map has no available leaf.
 */
[[nodiscard]] bool allLeavesUnavailable(const SensorValue& value) noexcept;

/**
 * @brief Human-readable value for reports.
 *
 * Integers print exactly, floating values with two decimals, unavailable as
 * "N/A", nested maps as "name=value" pairs joined by ", ".
 *
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] std::string toString(const SensorValue& value);

} // namespace sensor

} // namespace gpuprobe

#endif // GPUPROBE_SENSOR_VALUE_HPP
