#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace tuxmood::sensors {

// Aggregate CPU utilisation from the first line of /proc/stat.
class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Busy percentage since the previous call; 0 on the first successful read.
  std::optional<float> sample() noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::uint64_t prev_total_{0};
  std::uint64_t prev_idle_{0};
  bool has_prev_{false};
};

}  // namespace tuxmood::sensors
