/**
 * @file SensorValue.cpp
 * @brief Device snapshot model implementation.
 */

#include "src/sensor/inc/SensorValue.hpp"

#include <algorithm> // std::find_if

#include <fmt/core.h>

#include "src/helpers/inc/Format.hpp"

namespace gpuprobe {

namespace sensor {

/* ----------------------------- SensorMap ----------------------------- */

SensorMap::SensorMap() = default;
SensorMap::SensorMap(const SensorMap&) = default;
SensorMap::SensorMap(SensorMap&&) noexcept = default;
SensorMap& SensorMap::operator=(const SensorMap&) = default;
SensorMap& SensorMap::operator=(SensorMap&&) noexcept = default;
SensorMap::~SensorMap() = default;

SensorEntry& SensorMap::slot(std::string_view name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [name](const SensorEntry& e) { return e.name == name; });
  if (it != entries_.end()) {
    return *it;
  }
  entries_.push_back(SensorEntry{std::string(name), Unavailable{}});
  return entries_.back();
}

const SensorEntry* SensorMap::find(std::string_view name) const noexcept {
  for (const auto& ENTRY : entries_) {
    if (ENTRY.name == name) {
      return &ENTRY;
    }
  }
  return nullptr;
}

std::size_t SensorMap::size() const noexcept { return entries_.size(); }

bool SensorMap::empty() const noexcept { return entries_.empty(); }

SensorMap::const_iterator SensorMap::begin() const noexcept { return entries_.begin(); }

SensorMap::const_iterator SensorMap::end() const noexcept { return entries_.end(); }

bool SensorMap::operator==(const SensorMap& other) const { return entries_ == other.entries_; }

/* ----------------------------- Queries ----------------------------- */

bool isUnavailable(const SensorValue& value) noexcept {
  return std::holds_alternative<Unavailable>(value);
}

bool isNested(const SensorValue& value) noexcept {
  return std::holds_alternative<SensorMap>(value);
}

const std::string* asText(const SensorValue& value) noexcept {
  return std::get_if<std::string>(&value);
}

bool allLeavesUnavailable(const SensorValue& value) noexcept {
  const SensorMap* nested = std::get_if<SensorMap>(&value);
  if (nested == nullptr) {
    return isUnavailable(value);
  }
  for (const auto& CHILD : *nested) {
    if (!allLeavesUnavailable(CHILD.value)) {
      return false;
    }
  }
  return true;
}

std::string toString(const SensorValue& value) {
  struct Visitor {
    std::string operator()(std::int64_t v) const { return fmt::format("{}", v); }
    std::string operator()(double v) const { return helpers::format::fixed2(v); }
    std::string operator()(const std::string& v) const { return v; }
    std::string operator()(const Unavailable&) const { return std::string(NOT_AVAILABLE); }
    std::string operator()(const SensorMap& v) const {
      std::string out;
      for (const auto& CHILD : v) {
        if (!out.empty()) {
          out += ", ";
        }
        out += fmt::format("{}={}", CHILD.name, toString(CHILD.value));
      }
      return out;
    }
  };
  return std::visit(Visitor{}, value);
}

} // namespace sensor

} // namespace gpuprobe
