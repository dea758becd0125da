#ifndef GPUPROBE_GPU_NVML_SESSION_HPP
#define GPUPROBE_GPU_NVML_SESSION_HPP
/**
 * @file NvmlSession.hpp
 * @brief Scoped NVML initialization.
 *
 * One session per process. The library is initialized in the constructor and
 * released either by an explicit shutdown(), which reports failures, or by the
 * destructor on early-exit paths. No device may be queried after release.
 */

#include <string> // std::string

namespace gpuprobe {

namespace gpu {

/**
 * @brief RAII owner of the NVML library state.
 */
class NvmlSession {
public:
  /// @brief Initialize NVML. Check valid() before querying.
  NvmlSession() noexcept;
  ~NvmlSession();

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

  /// @brief True while NVML is initialized and not yet shut down.
  [[nodiscard]] bool valid() const noexcept { return initialized_; }

  /// @brief Initialization failure text; empty when initialization succeeded.
  [[nodiscard]] const std::string& error() const noexcept { return error_; }

  /**
   * @brief Release NVML now.
   * @param error Set to the NVML error text on failure.
   * @return true if released (or nothing to release); false on shutdown failure.
   * @note Idempotent. The destructor does nothing after a call.
   */
  [[nodiscard]] bool shutdown(std::string& error) noexcept;

private:
  bool initialized_{false};
  std::string error_;
};

} // namespace gpu

} // namespace gpuprobe

#endif // GPUPROBE_GPU_NVML_SESSION_HPP
