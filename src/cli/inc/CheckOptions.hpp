#ifndef GPUPROBE_CLI_CHECK_OPTIONS_HPP
#define GPUPROBE_CLI_CHECK_OPTIONS_HPP
/**
 * @file CheckOptions.hpp
 * @brief Command-line flags of check_gpu_sensor and their translation to options.
 *
 * Threshold sources apply in a fixed order: built-in defaults, every -w list,
 * every -c list, then the config file. Later sources win for the same sensor.
 */

#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include "src/gpu/inc/DeviceCollector.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/report/inc/Report.hpp"
#include "src/threshold/inc/ThresholdTable.hpp"

namespace gpuprobe {

namespace cli {

/* ----------------------------- Flags ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_DEVICE_BUS = 2,
  ARG_DEVICE_ID = 3,
  ARG_WARNING = 4,
  ARG_CRITICAL = 5,
  ARG_CONFIG = 6,
  ARG_SENSORS = 7,
  ARG_VERBOSE = 8,
  ARG_VERBOSE_2 = 9,
  ARG_VERBOSE_3 = 10,
  ARG_SHOW_NA = 11,
};

/// @brief Flag definitions for check_gpu_sensor.
[[nodiscard]] helpers::args::ArgMap buildArgMap();

/* ----------------------------- Options ----------------------------- */

/**
 * @brief Everything a check run needs from the command line.
 */
struct CheckOptions {
  gpu::DeviceSelector selector;
  threshold::ThresholdTable thresholds;
  std::vector<std::string> sensorFilter; ///< Empty means every sensor.
  report::ReportOptions output;
};

/**
 * @brief Output verbosity: -v counts 1, -vv 2, -vvv 3, summed and capped.
 * @return 0 to report::MAX_VERBOSITY.
 */
[[nodiscard]] int verbosityOf(const helpers::args::ParsedArgs& pargs) noexcept;

/**
 * @brief Turn parsed flags into check options.
 *
 * -s values are split on commas; empty names are dropped. The config file is
 * read from disk when -cf is given.
 *
 * @param pargs Parsed flags (from buildArgMap()).
 * @param opts  Filled on success.
 * @param error Set on a configuration error.
 * @return true on success.
 * @note NOT RT-safe: Allocates, may read the config file.
 */
[[nodiscard]] bool buildOptions(const helpers::args::ParsedArgs& pargs, CheckOptions& opts,
                                std::string& error);

} // namespace cli

} // namespace gpuprobe

#endif // GPUPROBE_CLI_CHECK_OPTIONS_HPP
