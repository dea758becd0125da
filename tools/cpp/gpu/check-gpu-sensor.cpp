/**
 * @file check-gpu-sensor.cpp
 * @brief Monitoring plugin: GPU sensor threshold check.
 *
 * Queries one GPU through NVML, compares its sensors against warning and
 * critical thresholds, and prints a plugin status line with performance data.
 *
 * Exit codes: 0 OK, 1 Warning, 2 Critical, 3 Unknown.
 */

#include "src/cli/inc/CheckOptions.hpp"
#include "src/eval/inc/Evaluator.hpp"
#include "src/gpu/inc/DeviceCollector.hpp"
#include "src/gpu/inc/NvmlSession.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/report/inc/Report.hpp"
#include "src/sensor/inc/SensorClassifier.hpp"
#include "src/sensor/inc/SensorNames.hpp"

#include <cstddef>     // std::size_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace args = gpuprobe::helpers::args;
namespace cli = gpuprobe::cli;
namespace eval = gpuprobe::eval;
namespace gpu = gpuprobe::gpu;
namespace report = gpuprobe::report;
namespace sensor = gpuprobe::sensor;

namespace {

constexpr std::string_view VERSION = "1.0.0";

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Check GPU sensors (temperature, memory, fan, ECC, power, PCIe link, throttling)\n"
    "against warning and critical thresholds.\n\n"
    "Threshold lists are comma-separated and positional; 'd' keeps the default.\n"
    "  -w: GPUTemperature,usedMemory,fanSpeed,ECCMemAggSgl,ECCL1AggSgl,ECCL2AggSgl,\n"
    "      ECCRegAggSgl,ECCTexAggSgl,PWRUsage\n"
    "  -c: the same nine, then PCIeLinkGen,PCIeLinkWidth (expected values)\n\n"
    "The config file is YAML, 'sensor: [warning, critical]' per line; it is applied\n"
    "after -w/-c.\n\n"
    "Exit codes: 0 OK, 1 Warning, 2 Critical, 3 Unknown.";

/// Report a fatal condition the plugin way.
int unknown(std::string_view message) {
  spdlog::debug("fatal: {}", message);
  fmt::print("{} - {}\n", eval::toString(eval::Severity::Unknown), message);
  return eval::exitCode(eval::Severity::Unknown);
}

std::string productNameOf(const sensor::SensorMap& snapshot) {
  const sensor::SensorEntry* entry = snapshot.find(sensor::PRODUCT_NAME);
  if (entry == nullptr) {
    return std::string(sensor::NOT_AVAILABLE);
  }
  return sensor::toString(entry->value);
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = cli::buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print("{} - {}\n\n", eval::toString(eval::Severity::Unknown), error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return eval::exitCode(eval::Severity::Unknown);
  }

  if (pargs.count(cli::ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }
  if (pargs.count(cli::ARG_VERSION) != 0) {
    fmt::print("check_gpu_sensor {}\n", VERSION);
    return 0;
  }

  gpuprobe::helpers::log::initLogging(cli::verbosityOf(pargs));

  cli::CheckOptions opts;
  if (!cli::buildOptions(pargs, opts, error)) {
    return unknown(error);
  }

  gpu::NvmlSession session;
  if (!session.valid()) {
    return unknown(session.error());
  }

  sensor::SensorMap snapshot;
  if (!gpu::collectDeviceSnapshot(session, opts.selector, snapshot, error)) {
    std::string shutdownError;
    if (!session.shutdown(shutdownError)) {
      spdlog::error("{}", shutdownError);
    }
    return unknown(error);
  }

  report::DebugInfo debug;
  if (opts.output.verbosity >= report::MAX_VERBOSITY) {
    const gpu::SystemInfo INFO = gpu::collectSystemInfo(session);
    debug = report::DebugInfo{INFO.driverVersion, INFO.nvmlVersion, INFO.deviceCount};
  }

  if (!session.shutdown(error)) {
    return unknown(error);
  }

  const sensor::PerfRecord RECORD = sensor::buildPerfRecord(snapshot, opts.sensorFilter);
  const eval::EvaluationResult RESULT = eval::evaluate(snapshot, RECORD, opts.thresholds);
  const std::string PRODUCT = productNameOf(snapshot);

  const report::ReportInput INPUT{PRODUCT, snapshot, RECORD, opts.thresholds, RESULT, debug};
  fmt::print("{}", report::formatReport(INPUT, opts.output));

  return eval::exitCode(RESULT.severity);
}
