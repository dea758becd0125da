/**
 * @file ThresholdOverrides.cpp
 * @brief Positional list parsing and YAML config loading for thresholds.
 */

#include "src/threshold/inc/ThresholdOverrides.hpp"

#include <cstdlib>   // std::strtod
#include <exception> // std::exception
#include <span>      // std::span
#include <utility>   // std::move, std::pair
#include <vector>    // std::vector

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace gpuprobe {

namespace threshold {

namespace {

using helpers::strings::isDecimalText;
using helpers::strings::isIntegerText;

bool parseLevel(const std::string& field, double& out) noexcept {
  if (!isIntegerText(field) && !isDecimalText(field)) {
    return false;
  }
  out = std::strtod(field.c_str(), nullptr);
  return true;
}

/// Apply one named config entry; throws YAML::Exception on bad scalars.
bool applyConfigEntry(const std::string& name, const YAML::Node& node, ThresholdTable& table,
                      std::string& error) {
  if (table.findEquality(name) != nullptr) {
    if (node.IsScalar()) {
      table.setEquality(name, node.as<double>());
      return true;
    }
    // [expected] or [warning, critical]; the critical slot is the expected value.
    if (node.IsSequence() && (node.size() == 1 || node.size() == 2)) {
      table.setEquality(name, node[node.size() - 1].as<double>());
      return true;
    }
    error = fmt::format("Config entry '{}': expected a value or [warning, critical]", name);
    return false;
  }

  if (!node.IsSequence() || node.size() != 2) {
    error = fmt::format("Config entry '{}': expected [warning, critical]", name);
    return false;
  }
  table.setRange(name, node[0].as<double>(), node[1].as<double>());
  return true;
}

/// Apply a whole document; the table is replaced only if every entry applies.
bool applyConfigRoot(const YAML::Node& root, ThresholdTable& table, std::string& error) {
  if (root.IsNull()) {
    return true;
  }
  if (!root.IsMap()) {
    error = "Threshold config must be a mapping of sensor name to thresholds";
    return false;
  }

  ThresholdTable updated = table;
  for (const auto& KV : root) {
    const std::string NAME = KV.first.as<std::string>();
    if (!applyConfigEntry(NAME, KV.second, updated, error)) {
      return false;
    }
    spdlog::debug("config threshold for {}: {}", NAME, perfSuffix(*updated.find(NAME)));
  }
  table = std::move(updated);
  return true;
}

} // namespace

/* ----------------------------- ListKind ----------------------------- */

const char* toString(ListKind kind) noexcept {
  switch (kind) {
  case ListKind::Warning:
    return "warning";
  case ListKind::Critical:
    return "critical";
  }
  return "unknown";
}

/* ----------------------------- API ----------------------------- */

bool applyThresholdList(std::string_view list, ListKind kind, ThresholdTable& table,
                        std::string& error) noexcept {
  const std::span<const std::string_view> SLOTS =
      (kind == ListKind::Warning) ? std::span<const std::string_view>(WARNING_SLOTS)
                                  : std::span<const std::string_view>(CRITICAL_SLOTS);

  const std::vector<std::string> FIELDS = helpers::strings::splitList(list);
  if (FIELDS.size() > SLOTS.size()) {
    error = fmt::format("Too many {} thresholds: got {}, expected at most {}", toString(kind),
                        FIELDS.size(), SLOTS.size());
    return false;
  }

  std::vector<std::pair<std::string_view, double>> updates;
  updates.reserve(FIELDS.size());
  for (std::size_t i = 0; i < FIELDS.size(); ++i) {
    if (FIELDS[i] == KEEP_DEFAULT) {
      continue;
    }
    double level = 0.0;
    if (!parseLevel(FIELDS[i], level)) {
      error = fmt::format("Invalid {} threshold '{}' at position {} ({})", toString(kind),
                          FIELDS[i], i + 1, SLOTS[i]);
      return false;
    }
    updates.emplace_back(SLOTS[i], level);
  }

  ThresholdTable updated = table;
  for (const auto& [NAME, LEVEL] : updates) {
    if (kind == ListKind::Warning) {
      if (!updated.setWarning(NAME, LEVEL)) {
        error = fmt::format("Sensor '{}' has no warning level", NAME);
        return false;
      }
    } else {
      updated.setCritical(NAME, LEVEL);
    }
    spdlog::debug("{} threshold for {} set to {}", toString(kind), NAME, formatLevel(LEVEL));
  }
  table = std::move(updated);
  return true;
}

bool applyThresholdConfig(const std::string& yamlText, ThresholdTable& table,
                          std::string& error) noexcept {
  try {
    return applyConfigRoot(YAML::Load(yamlText), table, error);
  } catch (const YAML::Exception& e) {
    error = fmt::format("Invalid threshold config: {}", e.what());
    return false;
  } catch (const std::exception& e) {
    error = fmt::format("Failed to apply threshold config: {}", e.what());
    return false;
  }
}

bool loadThresholdConfig(const std::string& path, ThresholdTable& table,
                         std::string& error) noexcept {
  if (!helpers::files::isRegularFile(path.c_str()) || !helpers::files::isReadable(path.c_str())) {
    error = fmt::format("Config file '{}' does not exist or is not readable", path);
    return false;
  }

  try {
    return applyConfigRoot(YAML::LoadFile(path), table, error);
  } catch (const YAML::Exception& e) {
    error = fmt::format("Invalid threshold config '{}': {}", path, e.what());
    return false;
  } catch (const std::exception& e) {
    error = fmt::format("Failed to read threshold config '{}': {}", path, e.what());
    return false;
  }
}

} // namespace threshold

} // namespace gpuprobe
