#ifndef GPUPROBE_HELPERS_FILES_HPP
#define GPUPROBE_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Path checks used before handing files to parsers.
 *
 * @note RT-SAFE: stat()/access() syscalls only, no allocation.
 */

#include <sys/stat.h> // stat, S_ISREG
#include <unistd.h>   // access, R_OK

namespace gpuprobe {
namespace helpers {
namespace files {

/**
 * @brief Check if path is a regular file.
 * @param path Path to check.
 * @return true if path exists and is a regular file.
 */
[[nodiscard]] inline bool isRegularFile(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode);
}

/**
 * @brief Check if path is readable by the current process.
 */
[[nodiscard]] inline bool isReadable(const char* path) noexcept {
  return path != nullptr && ::access(path, R_OK) == 0;
}

} // namespace files
} // namespace helpers
} // namespace gpuprobe

#endif // GPUPROBE_HELPERS_FILES_HPP
