#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace tuxmood::sensors {

// Used RAM percentage, (MemTotal - MemAvailable) / MemTotal from /proc/meminfo.
class MemorySensor {
 public:
  struct RawFields {
    std::uint64_t mem_total_kb{0};
    std::uint64_t mem_available_kb{0};
  };

  MemorySensor();
  explicit MemorySensor(std::FILE* meminfo, bool owns_file = false);
  ~MemorySensor();

  MemorySensor(const MemorySensor&) = delete;
  MemorySensor& operator=(const MemorySensor&) = delete;

  std::optional<float> sample() noexcept;
  const RawFields& raw() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  bool parse_meminfo() noexcept;

  std::FILE* meminfo_{nullptr};
  bool owns_file_{true};
  RawFields raw_{};
};

}  // namespace tuxmood::sensors
