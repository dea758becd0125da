/**
 * @file DiscreteEvaluator.cpp
 * @brief Fixed policy checks for status-only sensors.
 */

#include "src/eval/inc/Evaluator.hpp"

#include <initializer_list> // std::initializer_list
#include <string>           // std::string
#include <vector>           // std::vector

#include <spdlog/spdlog.h>

#include "src/helpers/inc/Strings.hpp"
#include "src/sensor/inc/SensorNames.hpp"

namespace gpuprobe {

namespace eval {

namespace {

using helpers::strings::endsWith;
using helpers::strings::startsWith;

/// Sensor value if present and supported, else nullptr.
const sensor::SensorValue* findAvailable(const sensor::SensorMap& snapshot,
                                         std::string_view name) noexcept {
  const sensor::SensorValue* value = sensor::findSensor(snapshot, name);
  if (value == nullptr || sensor::isUnavailable(*value)) {
    return nullptr;
  }
  return value;
}

/// True if value is text equal to expected.
bool textEquals(const sensor::SensorValue& value, std::string_view expected) noexcept {
  const std::string* text = sensor::asText(value);
  return text != nullptr && *text == expected;
}

bool isDoubleBitCounter(std::string_view name) noexcept {
  return startsWith(name, sensor::ECC_PREFIX) && endsWith(name, sensor::DOUBLE_BIT_SUFFIX);
}

} // namespace

/* ----------------------------- Checks ----------------------------- */

void checkDoubleBitEcc(const sensor::SensorMap& snapshot, EvaluationResult& result) {
  sensor::forEachLeaf(snapshot, [&](const std::string& name, const sensor::SensorValue& value) {
    if (!isDoubleBitCounter(name) || sensor::isUnavailable(value)) {
      return;
    }
    const auto COUNT = sensor::numericValue(value);
    if (COUNT && sensor::toDouble(*COUNT) > 0) {
      result.markCritical(name, sensor::toString(*COUNT));
    }
  });
}

void checkPersistenceMode(const sensor::SensorMap& snapshot, EvaluationResult& result) {
  const sensor::SensorValue* value = findAvailable(snapshot, sensor::PERSISTENCE_MODE);
  if (value == nullptr) {
    return;
  }
  if (!textEquals(*value, sensor::ENABLED)) {
    result.markWarning(sensor::PERSISTENCE_MODE, sensor::toString(*value));
  }
}

void checkInforom(const sensor::SensorMap& snapshot, EvaluationResult& result) {
  const sensor::SensorValue* value = findAvailable(snapshot, sensor::INFOROM_VALID);
  if (value == nullptr) {
    return;
  }
  if (!textEquals(*value, sensor::VALID)) {
    result.markCritical(sensor::INFOROM_VALID, sensor::toString(*value));
  }
}

void checkThrottleReasons(const sensor::SensorMap& snapshot, EvaluationResult& result) {
  const sensor::SensorValue* value = findAvailable(snapshot, sensor::THROTTLE_REASONS);
  if (value == nullptr) {
    return;
  }
  const sensor::SensorMap* reasons = std::get_if<sensor::SensorMap>(value);
  if (reasons == nullptr) {
    spdlog::debug("{} not decoded: {}", sensor::THROTTLE_REASONS, sensor::toString(*value));
    return;
  }

  std::vector<std::string> offending;
  for (const std::string_view REASON : {sensor::REASON_HW_SLOWDOWN, sensor::REASON_UNKNOWN}) {
    const sensor::SensorEntry* flag = reasons->find(REASON);
    if (flag != nullptr && textEquals(flag->value, sensor::ACTIVE)) {
      offending.emplace_back(REASON);
    }
  }
  if (!offending.empty()) {
    result.markCritical(sensor::THROTTLE_REASONS, helpers::strings::join(offending, ","));
  }
}

void checkPcieLink(const sensor::SensorMap& snapshot, const threshold::ThresholdTable& table,
                   std::string_view name, EvaluationResult& result) {
  const sensor::SensorValue* value = findAvailable(snapshot, name);
  if (value == nullptr) {
    return;
  }
  const threshold::EqualityThreshold* expected = table.findEquality(name);
  if (expected == nullptr) {
    return;
  }

  const auto CURRENT = sensor::numericValue(*value);
  if (!CURRENT || sensor::toDouble(*CURRENT) != expected->expected) {
    result.markCritical(name, sensor::toString(*value));
  }
}

void evaluateDiscrete(const sensor::SensorMap& snapshot, const threshold::ThresholdTable& table,
                      EvaluationResult& result) {
  checkDoubleBitEcc(snapshot, result);
  checkPersistenceMode(snapshot, result);
  checkInforom(snapshot, result);
  checkThrottleReasons(snapshot, result);
  checkPcieLink(snapshot, table, sensor::PCIE_LINK_GEN, result);
  checkPcieLink(snapshot, table, sensor::PCIE_LINK_WIDTH, result);
}

} // namespace eval

} // namespace gpuprobe
