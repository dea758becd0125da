/**
 * @file NvmlSession.cpp
 * @brief Scoped NVML initialization.
 */

#include "src/gpu/inc/NvmlSession.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "src/gpu/inc/compat_nvml_detect.hpp"

namespace gpuprobe {

namespace gpu {

#if COMPAT_NVML_AVAILABLE

NvmlSession::NvmlSession() noexcept {
  const nvmlReturn_t RET = nvmlInit_v2();
  initialized_ = (RET == NVML_SUCCESS);
  if (!initialized_) {
    error_ = fmt::format("NVML initialization failed: {}", nvmlErrorString(RET));
  }
}

NvmlSession::~NvmlSession() {
  if (initialized_) {
    const nvmlReturn_t RET = nvmlShutdown();
    if (RET != NVML_SUCCESS) {
      spdlog::error("NVML shutdown failed: {}", nvmlErrorString(RET));
    }
  }
}

bool NvmlSession::shutdown(std::string& error) noexcept {
  if (!initialized_) {
    return true;
  }
  initialized_ = false;
  const nvmlReturn_t RET = nvmlShutdown();
  if (RET != NVML_SUCCESS) {
    error = fmt::format("NVML shutdown failed: {}", nvmlErrorString(RET));
    return false;
  }
  return true;
}

#else

NvmlSession::NvmlSession() noexcept : error_("NVML support not available in this build") {}

NvmlSession::~NvmlSession() = default;

bool NvmlSession::shutdown(std::string& /*error*/) noexcept { return true; }

#endif // COMPAT_NVML_AVAILABLE

} // namespace gpu

} // namespace gpuprobe
