/**
 * @file PerfEvaluator.cpp
 * @brief Range threshold evaluation of the Performance Record.
 */

#include "src/eval/inc/Evaluator.hpp"

namespace gpuprobe {

namespace eval {

void evaluatePerf(const sensor::PerfRecord& record, const threshold::ThresholdTable& table,
                  EvaluationResult& result) {
  for (const auto& [NAME, VALUE] : record) {
    const threshold::RangeThreshold* range = table.findRange(NAME);
    if (range == nullptr) {
      continue;
    }

    const double CURRENT = sensor::toDouble(VALUE);
    if (CURRENT >= range->warning) {
      result.markWarning(NAME, sensor::toString(VALUE));
    }
    // Runs after the warning check so a critical reading is promoted.
    if (CURRENT >= range->critical) {
      result.markCritical(NAME, sensor::toString(VALUE));
    }
  }
}

} // namespace eval

} // namespace gpuprobe
