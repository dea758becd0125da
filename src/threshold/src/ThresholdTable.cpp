/**
 * @file ThresholdTable.cpp
 * @brief Threshold table defaults and mutation.
 */

#include "src/threshold/inc/ThresholdTable.hpp"

#include <cmath>   // std::trunc, std::fabs
#include <cstdint> // std::int64_t

#include <fmt/core.h>

#include "src/sensor/inc/SensorNames.hpp"

namespace gpuprobe {

namespace threshold {

namespace names = sensor;

/* ----------------------------- Formatting ----------------------------- */

/// Largest magnitude printed through the integer path.
constexpr double MAX_EXACT_INTEGER = 9.0e18;

std::string formatLevel(double value) {
  if (std::trunc(value) == value && std::fabs(value) < MAX_EXACT_INTEGER) {
    return fmt::format("{}", static_cast<std::int64_t>(value));
  }
  // Fixed notation only; perfdata levels may not carry an exponent.
  std::string out = fmt::format("{:f}", value);
  while (out.back() == '0') {
    out.pop_back();
  }
  if (out.back() == '.') {
    out.pop_back();
  }
  return out;
}

std::string perfSuffix(const Threshold& threshold) {
  if (const RangeThreshold* range = std::get_if<RangeThreshold>(&threshold)) {
    return fmt::format(";{};{};", formatLevel(range->warning), formatLevel(range->critical));
  }
  return fmt::format(";;{};", formatLevel(std::get<EqualityThreshold>(threshold).expected));
}

/* ----------------------------- ThresholdTable ----------------------------- */

ThresholdTable ThresholdTable::defaults() {
  ThresholdTable table;
  table.setRange(names::GPU_TEMPERATURE, 85, 100);
  table.setRange(names::USED_MEMORY, 95, 99);
  table.setRange(names::FAN_SPEED, 80, 95);
  table.setRange(names::ECC_MEM_AGG_SGL, 1, 2);
  table.setRange(names::ECC_L1_AGG_SGL, 1, 2);
  table.setRange(names::ECC_L2_AGG_SGL, 1, 2);
  table.setRange(names::ECC_REG_AGG_SGL, 1, 2);
  table.setRange(names::ECC_TEX_AGG_SGL, 1, 2);
  table.setRange(names::PWR_USAGE, 150, 200);
  table.setEquality(names::PCIE_LINK_GEN, 2);
  table.setEquality(names::PCIE_LINK_WIDTH, 16);
  return table;
}

void ThresholdTable::setRange(std::string_view name, double warning, double critical) {
  entries_.insert_or_assign(std::string(name), RangeThreshold{warning, critical});
}

void ThresholdTable::setEquality(std::string_view name, double expected) {
  entries_.insert_or_assign(std::string(name), EqualityThreshold{expected});
}

bool ThresholdTable::setWarning(std::string_view name, double value) {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    setRange(name, value, value);
    return true;
  }
  RangeThreshold* range = std::get_if<RangeThreshold>(&it->second);
  if (range == nullptr) {
    return false;
  }
  range->warning = value;
  return true;
}

void ThresholdTable::setCritical(std::string_view name, double value) {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    setRange(name, value, value);
    return;
  }
  if (RangeThreshold* range = std::get_if<RangeThreshold>(&it->second)) {
    range->critical = value;
  } else {
    std::get<EqualityThreshold>(it->second).expected = value;
  }
}

const Threshold* ThresholdTable::find(std::string_view name) const noexcept {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

const RangeThreshold* ThresholdTable::findRange(std::string_view name) const noexcept {
  const Threshold* t = find(name);
  return t == nullptr ? nullptr : std::get_if<RangeThreshold>(t);
}

const EqualityThreshold* ThresholdTable::findEquality(std::string_view name) const noexcept {
  const Threshold* t = find(name);
  return t == nullptr ? nullptr : std::get_if<EqualityThreshold>(t);
}

} // namespace threshold

} // namespace gpuprobe
