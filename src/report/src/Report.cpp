/**
 * @file Report.cpp
 * @brief Plugin output rendering.
 */

#include "src/report/inc/Report.hpp"

#include <algorithm> // std::sort
#include <vector>    // std::vector

#include <fmt/core.h>

#include "src/helpers/inc/Strings.hpp"

namespace gpuprobe {

namespace report {

namespace {

using helpers::strings::CaseInsensitiveLess;

/// Entries of a map sorted case-insensitively, excluded keys removed.
std::vector<const sensor::SensorEntry*> sortedDisplayable(const sensor::SensorMap& map) {
  std::vector<const sensor::SensorEntry*> out;
  out.reserve(map.size());
  for (const auto& ENTRY : map) {
    if (!sensor::isExcluded(ENTRY.name)) {
      out.push_back(&ENTRY);
    }
  }
  std::sort(out.begin(), out.end(), [](const sensor::SensorEntry* a, const sensor::SensorEntry* b) {
    return CaseInsensitiveLess{}(a->name, b->name);
  });
  return out;
}

/// True if no displayable leaf under map is available.
bool nothingAvailable(const sensor::SensorMap& map) noexcept {
  for (const auto& ENTRY : map) {
    if (!sensor::isExcluded(ENTRY.name) && !sensor::allLeavesUnavailable(ENTRY.value)) {
      return false;
    }
  }
  return true;
}

void appendDetails(std::string& out, const sensor::SensorMap& map, std::size_t depth,
                   bool showUnavailable) {
  const std::string PAD(depth * INDENT_WIDTH, ' ');
  for (const sensor::SensorEntry* entry : sortedDisplayable(map)) {
    if (sensor::allLeavesUnavailable(entry->value)) {
      if (showUnavailable) {
        out += fmt::format("{}- {}: {}\n", PAD, entry->name, sensor::NOT_AVAILABLE);
      }
      continue;
    }
    if (const sensor::SensorMap* nested = std::get_if<sensor::SensorMap>(&entry->value)) {
      out += fmt::format("{}- {}:\n", PAD, entry->name);
      appendDetails(out, *nested, depth + 1, showUnavailable);
      continue;
    }
    out += fmt::format("{}- {}: {}\n", PAD, entry->name, sensor::toString(entry->value));
  }
}

void appendMarks(std::string& out, const eval::EvaluationResult::SensorSet& marks,
                 eval::Severity level, int verbosity) {
  for (const auto& [NAME, VALUE] : marks) {
    if (verbosity >= 1) {
      out += fmt::format("[{} = {} ({})] ", NAME, eval::toString(level), VALUE);
    } else {
      out += fmt::format("[{} = {}] ", NAME, eval::toString(level));
    }
  }
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::string formatSummary(std::string_view productName, const eval::EvaluationResult& result,
                          int verbosity) {
  std::string out = fmt::format("{} - {} ", eval::toString(result.severity), productName);
  appendMarks(out, result.criticals, eval::Severity::Critical, verbosity);
  appendMarks(out, result.warnings, eval::Severity::Warning, verbosity);
  return out;
}

std::string formatPerfData(const sensor::PerfRecord& record,
                           const threshold::ThresholdTable& table) {
  std::vector<const sensor::PerfRecord::value_type*> entries;
  entries.reserve(record.size());
  for (const auto& ENTRY : record) {
    entries.push_back(&ENTRY);
  }
  std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) {
    return CaseInsensitiveLess{}(a->first, b->first);
  });

  std::string out;
  for (const auto* entry : entries) {
    if (!out.empty()) {
      out += ' ';
    }
    out += fmt::format("{}={}", entry->first, sensor::toString(entry->second));
    if (const threshold::Threshold* level = table.find(entry->first)) {
      out += threshold::perfSuffix(*level);
    }
  }
  return out;
}

std::string formatDetails(const sensor::SensorMap& snapshot, bool showUnavailable) {
  std::string out;
  if (nothingAvailable(snapshot)) {
    if (showUnavailable) {
      out = fmt::format("{}\n", sensor::NOT_AVAILABLE);
    }
    return out;
  }
  appendDetails(out, snapshot, 0, showUnavailable);
  return out;
}

std::string formatDebugHeader(const DebugInfo& debug, std::string_view productName) {
  return fmt::format("{}\nDriver version: {}\nNVML version: {}\nDevice count: {}\n"
                     "Device name: {}\n",
                     DEBUG_BEGIN, debug.driverVersion, debug.nvmlVersion, debug.deviceCount,
                     productName);
}

std::string formatReport(const ReportInput& input, const ReportOptions& options) {
  std::string out = formatSummary(input.productName, input.result, options.verbosity);
  out += '|';
  out += formatPerfData(input.record, input.table);
  out += '\n';

  if (options.verbosity >= MAX_VERBOSITY) {
    out += formatDebugHeader(input.debug, input.productName);
  }
  if (options.verbosity >= 2) {
    out += formatDetails(input.snapshot, options.showUnavailable);
  }
  if (options.verbosity >= MAX_VERBOSITY) {
    out += fmt::format("{}\n", DEBUG_END);
  }
  return out;
}

} // namespace report

} // namespace gpuprobe
