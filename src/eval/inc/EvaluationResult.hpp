#ifndef GPUPROBE_EVAL_EVALUATION_RESULT_HPP
#define GPUPROBE_EVAL_EVALUATION_RESULT_HPP
/**
 * @file EvaluationResult.hpp
 * @brief Aggregate severity and the sensors responsible for it.
 */

#include <cstdint>     // std::uint8_t
#include <map>         // std::map
#include <string>      // std::string
#include <string_view> // std::string_view

namespace gpuprobe {

namespace eval {

/* ----------------------------- Severity ----------------------------- */

/**
 * @brief Plugin status, ordered OK < Warning < Critical.
 *
 * Unknown is never produced by evaluation; it reports usage and collection
 * errors and maps to exit code 3.
 */
enum class Severity : std::uint8_t {
  Ok = 0,       ///< All sensors nominal
  Warning = 1,  ///< At least one sensor at warning level
  Critical = 2, ///< At least one sensor at critical level
  Unknown = 3   ///< Probe could not evaluate
};

/**
 * @brief Status word used in the report ("OK", "Warning", "Critical", "Unknown").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(Severity severity) noexcept;

/**
 * @brief Process exit code for a severity (0, 1, 2, 3).
 */
[[nodiscard]] constexpr int exitCode(Severity severity) noexcept {
  return static_cast<int>(severity);
}

/* ----------------------------- EvaluationResult ----------------------------- */

/**
 * @brief Mutable result of one evaluation pass.
 *
 * Severity is only raised, never lowered. A sensor appears in at most one of
 * warnings/criticals; marking it critical removes it from warnings, and a
 * critical sensor is never added to warnings.
 */
struct EvaluationResult {
  /// Sensor name -> value shown in the report.
  using SensorSet = std::map<std::string, std::string>;

  Severity severity{Severity::Ok}; ///< Highest severity reached
  SensorSet warnings;              ///< Sensors at warning level
  SensorSet criticals;             ///< Sensors at critical level

  /// @brief Raise severity to at least level.
  void raise(Severity level) noexcept {
    if (level > severity) {
      severity = level;
    }
  }

  /// @brief Flag a sensor as Warning unless it is already Critical.
  void markWarning(std::string_view name, std::string value);

  /// @brief Flag a sensor as Critical, removing any Warning mark.
  void markCritical(std::string_view name, std::string value);

  [[nodiscard]] bool isWarning(std::string_view name) const;
  [[nodiscard]] bool isCritical(std::string_view name) const;

  bool operator==(const EvaluationResult&) const = default;
};

} // namespace eval

} // namespace gpuprobe

#endif // GPUPROBE_EVAL_EVALUATION_RESULT_HPP
