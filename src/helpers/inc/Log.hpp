#ifndef GPUPROBE_HELPERS_LOG_HPP
#define GPUPROBE_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Diagnostics logging setup.
 *
 * stdout carries the plugin report only, so the default spdlog logger is
 * replaced with a stderr sink.
 */

#include <memory> // std::shared_ptr

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gpuprobe {
namespace helpers {
namespace log {

/// Logger name used for all diagnostics.
inline constexpr const char* LOGGER_NAME = "gpuprobe";

/**
 * @brief Install the stderr logger and set its level from plugin verbosity.
 * @param verbosity Plugin verbosity (0-3). Level 3 enables debug output.
 * @note Idempotent: reuses an already registered logger.
 */
inline void initLogging(int verbosity) {
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_st(LOGGER_NAME);
  }
  logger->set_pattern("[%n] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbosity >= 3 ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace log
} // namespace helpers
} // namespace gpuprobe

#endif // GPUPROBE_HELPERS_LOG_HPP
