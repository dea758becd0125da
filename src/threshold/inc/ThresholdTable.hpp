#ifndef GPUPROBE_THRESHOLD_TABLE_HPP
#define GPUPROBE_THRESHOLD_TABLE_HPP
/**
 * @file ThresholdTable.hpp
 * @brief Per-sensor warning/critical levels and equality expectations.
 *
 * Range sensors are flagged when the reading reaches a level. Equality sensors
 * (PCIe link generation/width) are flagged when the reading differs from the
 * expected value; they carry a single value instead of a level pair.
 */

#include <cstddef>     // std::size_t
#include <functional>  // std::less
#include <map>         // std::map
#include <string>      // std::string
#include <string_view> // std::string_view
#include <variant>     // std::variant

namespace gpuprobe {

namespace threshold {

/* ----------------------------- Threshold ----------------------------- */

/**
 * @brief Range levels: reading >= warning is Warning, >= critical is Critical.
 */
struct RangeThreshold {
  double warning{0.0};  ///< Warning level (inclusive)
  double critical{0.0}; ///< Critical level (inclusive)

  bool operator==(const RangeThreshold&) const noexcept = default;
};

/**
 * @brief Exact expected value: any other reading is Critical.
 */
struct EqualityThreshold {
  double expected{0.0}; ///< Required reading

  bool operator==(const EqualityThreshold&) const noexcept = default;
};

/// Comparison rule for one sensor.
using Threshold = std::variant<RangeThreshold, EqualityThreshold>;

/**
 * @brief Threshold value as printed in perfdata and messages ("85", "0.5", "1234567").
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] std::string formatLevel(double value);

/**
 * @brief Perfdata threshold suffix: ";warn;crit;" for ranges, ";;expected;" for equality.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] std::string perfSuffix(const Threshold& threshold);

/* ----------------------------- ThresholdTable ----------------------------- */

/**
 * @brief Mapping from sensor name to its comparison rule.
 *
 * Sensors absent from the table are reported as performance data but never
 * evaluated against a threshold.
 */
class ThresholdTable {
public:
  using Entries = std::map<std::string, Threshold, std::less<>>;

  /// @brief Built-in defaults (temperature, memory, fan, ECC, power, PCIe).
  [[nodiscard]] static ThresholdTable defaults();

  /// @brief Insert or replace a range threshold.
  void setRange(std::string_view name, double warning, double critical);

  /// @brief Insert or replace an equality threshold.
  void setEquality(std::string_view name, double expected);

  /**
   * @brief Replace the warning level of a range, or create {value, value}.
   * @return false if name holds an equality threshold (left unchanged).
   */
  bool setWarning(std::string_view name, double value);

  /**
   * @brief Replace the critical level of a range, or the expected value of an
   *        equality threshold. Creates {value, value} if absent.
   */
  void setCritical(std::string_view name, double value);

  [[nodiscard]] const Threshold* find(std::string_view name) const noexcept;
  [[nodiscard]] const RangeThreshold* findRange(std::string_view name) const noexcept;
  [[nodiscard]] const EqualityThreshold* findEquality(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
  }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] const Entries& entries() const noexcept { return entries_; }

  bool operator==(const ThresholdTable&) const = default;

private:
  Entries entries_;
};

} // namespace threshold

} // namespace gpuprobe

#endif // GPUPROBE_THRESHOLD_TABLE_HPP
