/**
 * @file Evaluator.cpp
 * @brief Merges continuous and discrete evaluation into one result.
 */

#include "src/eval/inc/Evaluator.hpp"

#include <spdlog/spdlog.h>

namespace gpuprobe {

namespace eval {

EvaluationResult evaluate(const sensor::SensorMap& snapshot, const sensor::PerfRecord& record,
                          const threshold::ThresholdTable& table) {
  EvaluationResult result;
  evaluatePerf(record, table, result);
  evaluateDiscrete(snapshot, table, result);

  spdlog::debug("evaluation: {} ({} critical, {} warning)", toString(result.severity),
                result.criticals.size(), result.warnings.size());
  return result;
}

} // namespace eval

} // namespace gpuprobe
