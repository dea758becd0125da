#ifndef GPUPROBE_REPORT_REPORT_HPP
#define GPUPROBE_REPORT_REPORT_HPP
/**
 * @file Report.hpp
 * @brief Plugin output: status summary, performance data, and detail dump.
 *
 * Output grammar (one run):
 *   <Severity> - <product> [name = Critical (value)] ... [name = Warning (value)] ...|<perfdata>
 *   - sensor: value            (verbosity >= 2)
 *   - group:
 *       - child: value
 *
 * Verbosity 3 wraps the detail dump in a debug block carrying driver and
 * library versions.
 *
 * @note NOT RT-safe: All functions allocate.
 */

#include <cstddef>     // std::size_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include "src/eval/inc/EvaluationResult.hpp"
#include "src/sensor/inc/SensorClassifier.hpp"
#include "src/sensor/inc/SensorValue.hpp"
#include "src/threshold/inc/ThresholdTable.hpp"

namespace gpuprobe {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Highest supported verbosity (-vvv).
inline constexpr int MAX_VERBOSITY = 3;

inline constexpr std::string_view DEBUG_BEGIN =
    "------------- begin of debug output (-vvv is set): ------------";
inline constexpr std::string_view DEBUG_END = "------------- end of debug output ------------";

/// Spaces per nesting level in the detail dump.
inline constexpr std::size_t INDENT_WIDTH = 4;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief System information shown in the debug block.
 */
struct DebugInfo {
  std::string driverVersion; ///< Kernel driver version
  std::string nvmlVersion;   ///< Management library version
  unsigned int deviceCount{0};
};

/**
 * @brief Rendering controls.
 */
struct ReportOptions {
  int verbosity{0};            ///< 0..MAX_VERBOSITY
  bool showUnavailable{false};  ///< List "N/A" sensors in the detail dump
};

/**
 * @brief Everything needed to render one report. Non-owning.
 */
struct ReportInput {
  std::string_view productName;
  const sensor::SensorMap& snapshot;
  const sensor::PerfRecord& record;
  const threshold::ThresholdTable& table;
  const eval::EvaluationResult& result;
  DebugInfo debug{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Status summary up to (not including) the '|' separator.
 *
 * "<Severity> - <product> " followed by "[name = Critical (value)] " for each
 * critical sensor, then the same for warnings. Values appear only when
 * verbosity >= 1.
 */
[[nodiscard]] std::string formatSummary(std::string_view productName,
                                        const eval::EvaluationResult& result, int verbosity);

/**
 * @brief Performance data block: "name=value[;warn;crit;]" entries.
 *
 * Entries are sorted case-insensitively and separated by a single space.
 * Equality thresholds render as ";;expected;".
 */
[[nodiscard]] std::string formatPerfData(const sensor::PerfRecord& record,
                                         const threshold::ThresholdTable& table);

/**
 * @brief Detail dump of displayable snapshot keys, one line per sensor.
 *
 * Keys are sorted case-insensitively at every level. Unavailable sensors,
 * and groups holding only unavailable sensors, are listed as "N/A" when
 * showUnavailable is set and omitted otherwise.
 *
 * @return Lines, each terminated by '\n'. Empty if nothing is displayed.
 */
[[nodiscard]] std::string formatDetails(const sensor::SensorMap& snapshot, bool showUnavailable);

/// @brief Debug block header: begin marker and system information lines.
[[nodiscard]] std::string formatDebugHeader(const DebugInfo& debug, std::string_view productName);

/**
 * @brief Complete report for stdout, terminated by '\n'.
 */
[[nodiscard]] std::string formatReport(const ReportInput& input, const ReportOptions& options);

} // namespace report

} // namespace gpuprobe

#endif // GPUPROBE_REPORT_REPORT_HPP
