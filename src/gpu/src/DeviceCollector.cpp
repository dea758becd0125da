/**
 * @file DeviceCollector.cpp
 * @brief Device selection and snapshot harvest via NVML.
 */

#include "src/gpu/inc/DeviceCollector.hpp"

#include <array>        // std::array
#include <charconv>     // std::from_chars
#include <cstdint>      // std::int64_t
#include <system_error> // std::errc
#include <utility>      // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "src/gpu/inc/ThrottleReasons.hpp"
#include "src/gpu/inc/compat_nvml_detect.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/sensor/inc/SensorNames.hpp"

namespace gpuprobe {

namespace gpu {

namespace names = sensor;

namespace {

#if COMPAT_NVML_AVAILABLE

/// Unavailable for "not supported", error text for any other failure.
sensor::SensorValue failedReading(std::string_view attribute, nvmlReturn_t ret) {
  if (ret == NVML_ERROR_NOT_SUPPORTED) {
    return sensor::Unavailable{};
  }
  spdlog::debug("{} query failed: {}", attribute, nvmlErrorString(ret));
  return std::string(nvmlErrorString(ret));
}

/// Reading for an unsigned integer query.
sensor::SensorValue uintReading(std::string_view attribute, nvmlReturn_t ret, unsigned long long v) {
  if (ret != NVML_SUCCESS) {
    return failedReading(attribute, ret);
  }
  return static_cast<std::int64_t>(v);
}

sensor::SensorValue enableReading(std::string_view attribute, nvmlReturn_t ret,
                                  nvmlEnableState_t state) {
  if (ret != NVML_SUCCESS) {
    return failedReading(attribute, ret);
  }
  return std::string(state == NVML_FEATURE_ENABLED ? names::ENABLED : names::DISABLED);
}

const char* computeModeName(nvmlComputeMode_t mode) noexcept {
  switch (mode) {
  case NVML_COMPUTEMODE_DEFAULT:
    return "Default";
  case NVML_COMPUTEMODE_EXCLUSIVE_THREAD:
    return "ExclusiveThread";
  case NVML_COMPUTEMODE_PROHIBITED:
    return "Prohibited";
  case NVML_COMPUTEMODE_EXCLUSIVE_PROCESS:
    return "ExclusiveProcess";
  default:
    return "Unknown";
  }
}

/* ----------------------------- Attribute Groups ----------------------------- */

void collectIdentity(nvmlDevice_t device, sensor::SensorMap& snap) {
  std::array<char, NVML_DEVICE_NAME_BUFFER_SIZE> name{};
  const nvmlReturn_t NAME_RET =
      nvmlDeviceGetName(device, name.data(), static_cast<unsigned int>(name.size()));
  if (NAME_RET == NVML_SUCCESS) {
    snap.set(names::PRODUCT_NAME, std::string(name.data()));
  } else {
    snap.set(names::PRODUCT_NAME, failedReading(names::PRODUCT_NAME, NAME_RET));
  }

  nvmlPciInfo_t pci{};
  const nvmlReturn_t PCI_RET = nvmlDeviceGetPciInfo_v3(device, &pci);
  if (PCI_RET == NVML_SUCCESS) {
    snap.set(names::PCI_BUS_ID, std::string(pci.busId));
  } else {
    snap.set(names::PCI_BUS_ID, failedReading(names::PCI_BUS_ID, PCI_RET));
  }

  unsigned int index = 0;
  snap.set(names::DEVICE_INDEX,
           uintReading(names::DEVICE_INDEX, nvmlDeviceGetIndex(device, &index), index));

  nvmlComputeMode_t mode{};
  const nvmlReturn_t MODE_RET = nvmlDeviceGetComputeMode(device, &mode);
  if (MODE_RET == NVML_SUCCESS) {
    snap.set(names::COMPUTE_MODE, std::string(computeModeName(mode)));
  } else {
    snap.set(names::COMPUTE_MODE, failedReading(names::COMPUTE_MODE, MODE_RET));
  }
}

void collectThermal(nvmlDevice_t device, sensor::SensorMap& snap) {
#if COMPAT_NVML_API_VERSION >= 13
  nvmlTemperature_t tempQuery{};
  tempQuery.version = nvmlTemperature_v1;
  tempQuery.sensorType = NVML_TEMPERATURE_GPU;
  const nvmlReturn_t TEMP_RET = nvmlDeviceGetTemperatureV(device, &tempQuery);
  if (TEMP_RET == NVML_SUCCESS) {
    snap.set(names::GPU_TEMPERATURE, static_cast<std::int64_t>(tempQuery.temperature));
  } else {
    snap.set(names::GPU_TEMPERATURE, failedReading(names::GPU_TEMPERATURE, TEMP_RET));
  }
#else
  unsigned int temp = 0;
  snap.set(names::GPU_TEMPERATURE,
           uintReading(names::GPU_TEMPERATURE,
                       nvmlDeviceGetTemperature(device, NVML_TEMPERATURE_GPU, &temp), temp));
#endif

  unsigned int fan = 0;
  snap.set(names::FAN_SPEED,
           uintReading(names::FAN_SPEED, nvmlDeviceGetFanSpeed(device, &fan), fan));
}

void collectMemory(nvmlDevice_t device, sensor::SensorMap& snap) {
  nvmlMemory_t mem{};
  const nvmlReturn_t RET = nvmlDeviceGetMemoryInfo(device, &mem);
  if (RET != NVML_SUCCESS) {
    const sensor::SensorValue FAILED = failedReading("memoryInfo", RET);
    snap.set(names::MEMORY_TOTAL, FAILED);
    snap.set(names::MEMORY_USED, FAILED);
    snap.set(names::USED_MEMORY, FAILED);
    return;
  }
  snap.set(names::MEMORY_TOTAL, static_cast<std::int64_t>(helpers::format::bytesToMiB(mem.total)));
  snap.set(names::MEMORY_USED, static_cast<std::int64_t>(helpers::format::bytesToMiB(mem.used)));
  snap.set(names::USED_MEMORY,
           helpers::format::round2(helpers::format::percentOf(mem.used, mem.total)));
}

void collectClocks(nvmlDevice_t device, sensor::SensorMap& snap) {
  struct ClockQuery {
    std::string_view name;
    nvmlClockType_t type;
  };
  static constexpr std::array<ClockQuery, 4> QUERIES{{
      {names::GRAPHICS_CLOCK, NVML_CLOCK_GRAPHICS},
      {names::SM_CLOCK, NVML_CLOCK_SM},
      {names::MEM_CLOCK, NVML_CLOCK_MEM},
      {names::VIDEO_CLOCK, NVML_CLOCK_VIDEO},
  }};

  sensor::SensorMap clocks;
  for (const auto& Q : QUERIES) {
    unsigned int mhz = 0;
    clocks.set(Q.name, uintReading(Q.name, nvmlDeviceGetClockInfo(device, Q.type, &mhz), mhz));
  }
  snap.set(names::CLOCKS, std::move(clocks));
}

void collectEcc(nvmlDevice_t device, sensor::SensorMap& snap) {
  struct EccLocation {
    std::string_view single;
    std::string_view dbl;
    nvmlMemoryLocation_t location;
  };
  static constexpr std::array<EccLocation, 5> LOCATIONS{{
      {names::ECC_MEM_AGG_SGL, names::ECC_MEM_AGG_DBL, NVML_MEMORY_LOCATION_DEVICE_MEMORY},
      {names::ECC_L1_AGG_SGL, names::ECC_L1_AGG_DBL, NVML_MEMORY_LOCATION_L1_CACHE},
      {names::ECC_L2_AGG_SGL, names::ECC_L2_AGG_DBL, NVML_MEMORY_LOCATION_L2_CACHE},
      {names::ECC_REG_AGG_SGL, names::ECC_REG_AGG_DBL, NVML_MEMORY_LOCATION_REGISTER_FILE},
      {names::ECC_TEX_AGG_SGL, names::ECC_TEX_AGG_DBL, NVML_MEMORY_LOCATION_TEXTURE_MEMORY},
  }};

  sensor::SensorMap ecc;
  for (const auto& L : LOCATIONS) {
    unsigned long long count = 0;
    nvmlReturn_t ret = nvmlDeviceGetMemoryErrorCounter(device, NVML_MEMORY_ERROR_TYPE_CORRECTED,
                                                       NVML_AGGREGATE_ECC, L.location, &count);
    ecc.set(L.single, uintReading(L.single, ret, count));

    count = 0;
    ret = nvmlDeviceGetMemoryErrorCounter(device, NVML_MEMORY_ERROR_TYPE_UNCORRECTED,
                                          NVML_AGGREGATE_ECC, L.location, &count);
    ecc.set(L.dbl, uintReading(L.dbl, ret, count));
  }
  snap.set(names::ECC_ERRORS, std::move(ecc));
}

void collectPower(nvmlDevice_t device, sensor::SensorMap& snap) {
  nvmlEnableState_t state{};
  snap.set(names::POWER_MANAGEMENT,
           enableReading(names::POWER_MANAGEMENT,
                         nvmlDeviceGetPowerManagementMode(device, &state), state));

  unsigned int milliwatts = 0;
  const nvmlReturn_t RET = nvmlDeviceGetPowerUsage(device, &milliwatts);
  if (RET == NVML_SUCCESS) {
    snap.set(names::PWR_USAGE, helpers::format::round2(static_cast<double>(milliwatts) / 1000.0));
  } else {
    snap.set(names::PWR_USAGE, failedReading(names::PWR_USAGE, RET));
  }
}

void collectHealth(nvmlDevice_t device, sensor::SensorMap& snap) {
  nvmlEnableState_t persistence{};
  snap.set(names::PERSISTENCE_MODE,
           enableReading(names::PERSISTENCE_MODE,
                         nvmlDeviceGetPersistenceMode(device, &persistence), persistence));

  const nvmlReturn_t INFOROM = nvmlDeviceValidateInforom(device);
  if (INFOROM == NVML_SUCCESS) {
    snap.set(names::INFOROM_VALID, std::string(names::VALID));
  } else if (INFOROM == NVML_ERROR_CORRUPTED_INFOROM) {
    snap.set(names::INFOROM_VALID, std::string(names::INVALID));
  } else {
    snap.set(names::INFOROM_VALID, failedReading(names::INFOROM_VALID, INFOROM));
  }

  unsigned long long reasons = 0;
  const nvmlReturn_t RET = nvmlDeviceGetCurrentClocksEventReasons(device, &reasons);
  if (RET == NVML_SUCCESS) {
    snap.set(names::THROTTLE_REASONS, decodeThrottleReasons(reasons));
  } else {
    snap.set(names::THROTTLE_REASONS, failedReading(names::THROTTLE_REASONS, RET));
  }
}

void collectPcie(nvmlDevice_t device, sensor::SensorMap& snap) {
  sensor::SensorMap link;
  unsigned int v = 0;
  link.set(names::PCIE_LINK_GEN,
           uintReading(names::PCIE_LINK_GEN, nvmlDeviceGetCurrPcieLinkGeneration(device, &v), v));
  link.set(names::PCIE_LINK_WIDTH,
           uintReading(names::PCIE_LINK_WIDTH, nvmlDeviceGetCurrPcieLinkWidth(device, &v), v));
  link.set(names::PCIE_LINK_GEN_MAX, uintReading(names::PCIE_LINK_GEN_MAX,
                                                 nvmlDeviceGetMaxPcieLinkGeneration(device, &v), v));
  link.set(names::PCIE_LINK_WIDTH_MAX,
           uintReading(names::PCIE_LINK_WIDTH_MAX, nvmlDeviceGetMaxPcieLinkWidth(device, &v), v));
  snap.set(names::PCIE_LINK, std::move(link));
}

/// Resolve the selector to a handle; fatal errors go to error.
bool resolveDevice(const DeviceSelector& selector, nvmlDevice_t& device, std::string& error) {
  unsigned int count = 0;
  const nvmlReturn_t COUNT_RET = nvmlDeviceGetCount_v2(&count);
  if (COUNT_RET != NVML_SUCCESS) {
    error = fmt::format("Unable to count GPUs: {}", nvmlErrorString(COUNT_RET));
    return false;
  }
  if (count == 0) {
    error = "No NVIDIA GPU found";
    return false;
  }

  const nvmlReturn_t RET =
      selector.index ? nvmlDeviceGetHandleByIndex_v2(*selector.index, &device)
                     : nvmlDeviceGetHandleByPciBusId_v2(selector.busId.c_str(), &device);
  if (RET != NVML_SUCCESS) {
    error = fmt::format("Device {} not found: {}", selector.toString(), nvmlErrorString(RET));
    return false;
  }
  return true;
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

/* ----------------------------- DeviceSelector ----------------------------- */

std::string DeviceSelector::toString() const {
  if (index) {
    return fmt::format("index {}", *index);
  }
  return fmt::format("bus id {}", busId);
}

bool makeDeviceSelector(std::optional<std::string_view> busId,
                        std::optional<std::string_view> index, DeviceSelector& out,
                        std::string& error) noexcept {
  if (busId && index) {
    error = "Specify either a device bus id or a device index, not both";
    return false;
  }
  if (!busId && !index) {
    error = "A device bus id (-db) or device index (-di) is required";
    return false;
  }

  DeviceSelector selector;
  if (busId) {
    if (busId->empty()) {
      error = "Device bus id must not be empty";
      return false;
    }
    selector.busId = std::string(*busId);
  } else {
    unsigned int value = 0;
    const char* first = index->data();
    const char* last = first + index->size();
    const auto [PTR, EC] = std::from_chars(first, last, value);
    if (index->empty() || EC != std::errc{} || PTR != last) {
      error = fmt::format("Invalid device index '{}'", *index);
      return false;
    }
    selector.index = value;
  }
  out = std::move(selector);
  return true;
}

/* ----------------------------- API ----------------------------- */

SystemInfo collectSystemInfo(const NvmlSession& session) noexcept {
  SystemInfo info{};

#if COMPAT_NVML_AVAILABLE
  if (!session.valid()) {
    return info;
  }

  std::array<char, NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE> version{};
  if (nvmlSystemGetDriverVersion(version.data(), static_cast<unsigned int>(version.size())) ==
      NVML_SUCCESS) {
    info.driverVersion = version.data();
  }
  if (nvmlSystemGetNVMLVersion(version.data(), static_cast<unsigned int>(version.size())) ==
      NVML_SUCCESS) {
    info.nvmlVersion = version.data();
  }
  unsigned int count = 0;
  if (nvmlDeviceGetCount_v2(&count) == NVML_SUCCESS) {
    info.deviceCount = count;
  }
#else
  (void)session;
#endif

  return info;
}

bool collectDeviceSnapshot(const NvmlSession& session, const DeviceSelector& selector,
                           sensor::SensorMap& snapshot, std::string& error) noexcept {
  if (!session.valid()) {
    error = session.error().empty() ? std::string("NVML session is not initialized")
                                    : session.error();
    return false;
  }

#if COMPAT_NVML_AVAILABLE
  nvmlDevice_t device{};
  if (!resolveDevice(selector, device, error)) {
    return false;
  }

  sensor::SensorMap snap;
  collectIdentity(device, snap);
  collectThermal(device, snap);
  collectMemory(device, snap);
  collectClocks(device, snap);
  collectEcc(device, snap);
  collectPower(device, snap);
  collectHealth(device, snap);
  collectPcie(device, snap);

  spdlog::debug("Collected {} top-level sensors from device {}", snap.size(),
                selector.toString());
  snapshot = std::move(snap);
  return true;
#else
  (void)selector;
  (void)snapshot;
  error = "NVML support not available in this build";
  return false;
#endif
}

} // namespace gpu

} // namespace gpuprobe
