/**
 * @file CheckOptions.cpp
 * @brief Flag map and option assembly for check_gpu_sensor.
 */

#include "src/cli/inc/CheckOptions.hpp"

#include <algorithm> // std::min
#include <cstddef>   // std::size_t
#include <optional>  // std::optional
#include <utility>   // std::move

#include "src/helpers/inc/Strings.hpp"
#include "src/threshold/inc/ThresholdOverrides.hpp"

namespace gpuprobe {

namespace cli {

namespace {

namespace args = helpers::args;

/// Values of a flag, or an empty list.
const std::vector<std::string_view>& valuesOf(const args::ParsedArgs& pargs, ArgKey key) {
  static const std::vector<std::string_view> NONE;
  const auto IT = pargs.find(key);
  return IT == pargs.end() ? NONE : IT->second;
}

/// Last value of a flag, if given.
std::optional<std::string_view> lastOf(const args::ParsedArgs& pargs, ArgKey key) {
  const auto& values = valuesOf(pargs, key);
  if (values.empty()) {
    return std::nullopt;
  }
  return values.back();
}

bool applyLists(const args::ParsedArgs& pargs, ArgKey key, threshold::ListKind kind,
                threshold::ThresholdTable& table, std::string& error) {
  for (const std::string_view LIST : valuesOf(pargs, key)) {
    if (!threshold::applyThresholdList(LIST, kind, table, error)) {
      return false;
    }
  }
  return true;
}

} // namespace

/* ----------------------------- Flags ----------------------------- */

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"-h", "--help", 0, false, "Show this help message"};
  map[ARG_VERSION] = {"-V", "--version", 0, false, "Show version"};
  map[ARG_DEVICE_BUS] = {"-db", "--device-bus", 1, false, "PCI bus id of the GPU"};
  map[ARG_DEVICE_ID] = {"-di", "--device-id", 1, false, "NVML index of the GPU"};
  map[ARG_WARNING] = {"-w", "--warning", 1, false, "Warning threshold list"};
  map[ARG_CRITICAL] = {"-c", "--critical", 1, false, "Critical threshold list"};
  map[ARG_CONFIG] = {"-cf", "--config", 1, false, "YAML threshold file"};
  map[ARG_SENSORS] = {"-s", "--sensors", 1, false, "Only report these sensors (comma list)"};
  map[ARG_VERBOSE] = {"-v", "--verbose", 0, false, "Increase verbosity (up to -vvv)"};
  map[ARG_VERBOSE_2] = {"-vv", "", 0, false};
  map[ARG_VERBOSE_3] = {"-vvv", "", 0, false};
  map[ARG_SHOW_NA] = {"-sa", "--show-na", 0, false, "Show unavailable sensors (-vv)"};
  return map;
}

/* ----------------------------- Options ----------------------------- */

int verbosityOf(const args::ParsedArgs& pargs) noexcept {
  const std::size_t LEVEL = valuesOf(pargs, ARG_VERBOSE).size() +
                            2 * valuesOf(pargs, ARG_VERBOSE_2).size() +
                            3 * valuesOf(pargs, ARG_VERBOSE_3).size();
  return static_cast<int>(
      std::min<std::size_t>(LEVEL, static_cast<std::size_t>(report::MAX_VERBOSITY)));
}

bool buildOptions(const args::ParsedArgs& pargs, CheckOptions& opts, std::string& error) {
  if (!gpu::makeDeviceSelector(lastOf(pargs, ARG_DEVICE_BUS), lastOf(pargs, ARG_DEVICE_ID),
                               opts.selector, error)) {
    return false;
  }

  opts.thresholds = threshold::ThresholdTable::defaults();
  if (!applyLists(pargs, ARG_WARNING, threshold::ListKind::Warning, opts.thresholds, error) ||
      !applyLists(pargs, ARG_CRITICAL, threshold::ListKind::Critical, opts.thresholds, error)) {
    return false;
  }
  if (const auto PATH = lastOf(pargs, ARG_CONFIG)) {
    if (!threshold::loadThresholdConfig(std::string(*PATH), opts.thresholds, error)) {
      return false;
    }
  }

  opts.sensorFilter.clear();
  for (const std::string_view LIST : valuesOf(pargs, ARG_SENSORS)) {
    for (std::string& name : helpers::strings::splitList(LIST, ',')) {
      if (!name.empty()) {
        opts.sensorFilter.push_back(std::move(name));
      }
    }
  }

  opts.output.verbosity = verbosityOf(pargs);
  opts.output.showUnavailable = !valuesOf(pargs, ARG_SHOW_NA).empty();
  return true;
}

} // namespace cli

} // namespace gpuprobe
