#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace tuxmood::sensors {

// Combined rx+tx throughput in KB/s over all non-loopback interfaces.
class NetworkSensor {
 public:
  struct RawFields {
    std::uint64_t rx_bytes{0};
    std::uint64_t tx_bytes{0};
    std::size_t interfaces{0};
  };

  explicit NetworkSensor(const std::string& sys_class_net = "/sys/class/net");
  ~NetworkSensor();

  NetworkSensor(const NetworkSensor&) = delete;
  NetworkSensor& operator=(const NetworkSensor&) = delete;
  NetworkSensor(NetworkSensor&&) = delete;
  NetworkSensor& operator=(NetworkSensor&&) = delete;

  // First successful call establishes the baseline and reports 0.
  std::optional<float> sample(std::uint64_t monotonic_ns) noexcept;
  const RawFields& raw() const noexcept;

 private:
  struct InterfaceSource {
    std::FILE* rx_bytes_file{nullptr};
    std::FILE* tx_bytes_file{nullptr};
  };

  static bool read_u64_file(std::FILE* file, std::uint64_t& value) noexcept;

  std::vector<InterfaceSource> interfaces_{};
  RawFields raw_{};
  std::uint64_t prev_total_bytes_{0};
  std::uint64_t prev_timestamp_ns_{0};
  bool has_prev_{false};
};

}  // namespace tuxmood::sensors
