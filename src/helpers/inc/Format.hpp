#ifndef GPUPROBE_HELPERS_FORMAT_HPP
#define GPUPROBE_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Numeric formatting and unit helpers shared by collector and report.
 *
 * Uses fmt library for string formatting.
 *
 * @note NOT RT-SAFE: String-returning functions allocate.
 */

#include <cmath>   // std::round
#include <cstdint> // std::uint64_t
#include <string>  // std::string

#include <fmt/core.h>
#include <fmt/format.h>

namespace gpuprobe {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Round to two decimal places (half away from zero).
 * @param value Input value.
 * @return Rounded value.
 */
[[nodiscard]] inline double round2(double value) noexcept {
  return std::round(value * 100.0) / 100.0;
}

/**
 * @brief Format with exactly two decimals (e.g., 12.3 -> "12.30").
 */
[[nodiscard]] inline std::string fixed2(double value) { return fmt::format("{:.2f}", value); }

/**
 * @brief Convert a byte count to whole mebibytes (truncating).
 */
[[nodiscard]] inline std::uint64_t bytesToMiB(std::uint64_t bytes) noexcept {
  return bytes / (1024ULL * 1024ULL);
}

/**
 * @brief Percentage of used over total, 0 when total is 0.
 */
[[nodiscard]] inline double percentOf(std::uint64_t used, std::uint64_t total) noexcept {
  if (total == 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(used) / static_cast<double>(total);
}

} // namespace format
} // namespace helpers
} // namespace gpuprobe

#endif // GPUPROBE_HELPERS_FORMAT_HPP
