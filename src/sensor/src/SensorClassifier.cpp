/**
 * @file SensorClassifier.cpp
 * @brief Performance Record extraction and sensor lookup.
 */

#include "src/sensor/inc/SensorClassifier.hpp"

#include <algorithm>    // std::find
#include <charconv>     // std::from_chars
#include <cstdlib>      // std::strtod
#include <system_error> // std::errc

#include <fmt/core.h>

#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/sensor/inc/SensorNames.hpp"

namespace gpuprobe {

namespace sensor {

namespace {

using helpers::format::round2;

/// Integer text that fits int64 stays exact; wider magnitudes fall back to a rounded double.
PerfValue integerTextValue(const std::string& text) noexcept {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (first != last && *first == '+') {
    ++first;
  }
  std::int64_t parsed = 0;
  const auto RESULT = std::from_chars(first, last, parsed);
  if (RESULT.ec == std::errc{} && RESULT.ptr == last) {
    return PerfValue{parsed};
  }
  return PerfValue{round2(std::strtod(text.c_str(), nullptr))};
}

void flattenInto(const SensorMap& map, const std::vector<std::string>* filter, PerfRecord& out) {
  for (const auto& ENTRY : map) {
    if (filter != nullptr &&
        std::find(filter->begin(), filter->end(), ENTRY.name) == filter->end()) {
      continue;
    }
    if (isExcluded(ENTRY.name)) {
      continue;
    }

    if (const SensorMap* nested = std::get_if<SensorMap>(&ENTRY.value)) {
      flattenInto(*nested, nullptr, out);
      continue;
    }

    const std::optional<PerfValue> NUM = numericValue(ENTRY.value);
    if (NUM) {
      out[ENTRY.name] = *NUM;
    }
  }
}

} // namespace

/* ----------------------------- PerfValue ----------------------------- */

double toDouble(const PerfValue& value) noexcept {
  if (const std::int64_t* i = std::get_if<std::int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  return std::get<double>(value);
}

std::string toString(const PerfValue& value) {
  if (const std::int64_t* i = std::get_if<std::int64_t>(&value)) {
    return fmt::format("{}", *i);
  }
  return helpers::format::fixed2(std::get<double>(value));
}

/* ----------------------------- API ----------------------------- */

bool isExcluded(std::string_view name) noexcept {
  for (const std::string_view KEY : EXCLUDED_KEYS) {
    if (KEY == name) {
      return true;
    }
  }
  return false;
}

std::optional<PerfValue> numericValue(const SensorValue& value) noexcept {
  if (const std::int64_t* i = std::get_if<std::int64_t>(&value)) {
    return PerfValue{*i};
  }
  if (const double* d = std::get_if<double>(&value)) {
    return PerfValue{round2(*d)};
  }
  if (const std::string* text = std::get_if<std::string>(&value)) {
    if (helpers::strings::isIntegerText(*text)) {
      return integerTextValue(*text);
    }
    if (helpers::strings::isDecimalText(*text)) {
      return PerfValue{round2(std::strtod(text->c_str(), nullptr))};
    }
  }
  return std::nullopt;
}

PerfRecord buildPerfRecord(const SensorMap& snapshot, const std::vector<std::string>& filter) {
  PerfRecord record;
  flattenInto(snapshot, filter.empty() ? nullptr : &filter, record);
  return record;
}

const SensorValue* findSensor(const SensorMap& snapshot, std::string_view name) noexcept {
  for (const auto& ENTRY : snapshot) {
    if (ENTRY.name == name) {
      return &ENTRY.value;
    }
    if (const SensorMap* nested = std::get_if<SensorMap>(&ENTRY.value)) {
      if (const SensorValue* found = findSensor(*nested, name)) {
        return found;
      }
    }
  }
  return nullptr;
}

} // namespace sensor

} // namespace gpuprobe
