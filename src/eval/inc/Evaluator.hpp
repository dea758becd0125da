#ifndef GPUPROBE_EVAL_EVALUATOR_HPP
#define GPUPROBE_EVAL_EVALUATOR_HPP
/**
 * @file Evaluator.hpp
 * @brief Threshold evaluation of continuous sensors and policy checks of discrete sensors.
 *
 * Every stage mutates one EvaluationResult in place and can only raise its
 * severity. evaluate() runs the continuous stage, then the discrete stage.
 * @note Thread-safe: Stateless; results are caller-owned.
 */

#include <string_view> // std::string_view

#include "src/eval/inc/EvaluationResult.hpp"
#include "src/sensor/inc/SensorClassifier.hpp"
#include "src/sensor/inc/SensorValue.hpp"
#include "src/threshold/inc/ThresholdTable.hpp"

namespace gpuprobe {

namespace eval {

/* ----------------------------- Continuous ----------------------------- */

/**
 * @brief Compare each performance value against its range threshold.
 *
 * value >= warning marks Warning; value >= critical then promotes to Critical.
 * Sensors without a range threshold (absent, or equality) are not evaluated.
 */
void evaluatePerf(const sensor::PerfRecord& record, const threshold::ThresholdTable& table,
                  EvaluationResult& result);

/* ----------------------------- Discrete ----------------------------- */

/// @brief Any double-bit ECC counter above zero is Critical.
void checkDoubleBitEcc(const sensor::SensorMap& snapshot, EvaluationResult& result);

/// @brief Persistence mode other than "enabled" is (at least) Warning.
void checkPersistenceMode(const sensor::SensorMap& snapshot, EvaluationResult& result);

/// @brief Inforom other than "valid" is Critical.
void checkInforom(const sensor::SensorMap& snapshot, EvaluationResult& result);

/// @brief Active hardware-slowdown or unknown throttle reason is Critical.
void checkThrottleReasons(const sensor::SensorMap& snapshot, EvaluationResult& result);

/**
 * @brief PCIe link reading that differs from its equality threshold is Critical.
 * @param name PCIeLinkGen or PCIeLinkWidth.
 * @note A non-numeric reading (error text) counts as a mismatch.
 */
void checkPcieLink(const sensor::SensorMap& snapshot, const threshold::ThresholdTable& table,
                   std::string_view name, EvaluationResult& result);

/**
 * @brief Run all discrete checks. Unavailable sensors are skipped.
 */
void evaluateDiscrete(const sensor::SensorMap& snapshot, const threshold::ThresholdTable& table,
                      EvaluationResult& result);

/* ----------------------------- Aggregate ----------------------------- */

/**
 * @brief Full evaluation pass over one device.
 * @param snapshot Device snapshot (discrete sensors).
 * @param record   Performance record built from the snapshot.
 * @param table    Threshold table.
 * @return Fresh result: max severity across both stages, disjoint sets.
 */
[[nodiscard]] EvaluationResult evaluate(const sensor::SensorMap& snapshot,
                                        const sensor::PerfRecord& record,
                                        const threshold::ThresholdTable& table);

} // namespace eval

} // namespace gpuprobe

#endif // GPUPROBE_EVAL_EVALUATOR_HPP
