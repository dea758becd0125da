/**
 * @file EvaluationResult.cpp
 * @brief Severity names and warning/critical set maintenance.
 */

#include "src/eval/inc/EvaluationResult.hpp"

#include <utility> // std::move

namespace gpuprobe {

namespace eval {

/* ----------------------------- Severity ----------------------------- */

const char* toString(Severity severity) noexcept {
  switch (severity) {
  case Severity::Ok:
    return "OK";
  case Severity::Warning:
    return "Warning";
  case Severity::Critical:
    return "Critical";
  case Severity::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

/* ----------------------------- EvaluationResult ----------------------------- */

void EvaluationResult::markWarning(std::string_view name, std::string value) {
  raise(Severity::Warning);
  if (isCritical(name)) {
    return;
  }
  warnings.insert_or_assign(std::string(name), std::move(value));
}

void EvaluationResult::markCritical(std::string_view name, std::string value) {
  raise(Severity::Critical);
  warnings.erase(std::string(name));
  criticals.insert_or_assign(std::string(name), std::move(value));
}

bool EvaluationResult::isWarning(std::string_view name) const {
  return warnings.count(std::string(name)) != 0;
}

bool EvaluationResult::isCritical(std::string_view name) const {
  return criticals.count(std::string(name)) != 0;
}

} // namespace eval

} // namespace gpuprobe
