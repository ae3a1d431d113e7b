#include "sensors/network.hpp"

#include <filesystem>
#include <memory>

namespace tuxmood::sensors {

NetworkSensor::NetworkSensor(const std::string& sys_class_net) {
  try {
    if (!std::filesystem::exists(sys_class_net)) {
      return;
    }

    for (const auto& entry : std::filesystem::directory_iterator(sys_class_net)) {
      if (!entry.is_directory()) {
        continue;
      }

      const std::string iface = entry.path().filename().string();
      if (iface == "lo") {
        continue;
      }

      const std::string base = sys_class_net + "/" + iface + "/statistics/";

      auto file_closer = [](std::FILE* file) {
        if (file != nullptr) {
          std::fclose(file);
        }
      };
      using file_ptr = std::unique_ptr<std::FILE, decltype(file_closer)>;

      file_ptr rx_bytes_file(std::fopen((base + "rx_bytes").c_str(), "r"), file_closer);
      file_ptr tx_bytes_file(std::fopen((base + "tx_bytes").c_str(), "r"), file_closer);
      if (rx_bytes_file == nullptr || tx_bytes_file == nullptr) {
        continue;
      }

      interfaces_.push_back(InterfaceSource{rx_bytes_file.get(), tx_bytes_file.get()});
      rx_bytes_file.release();
      tx_bytes_file.release();
    }
  } catch (const std::filesystem::filesystem_error&) {
    for (InterfaceSource& iface : interfaces_) {
      std::fclose(iface.rx_bytes_file);
      std::fclose(iface.tx_bytes_file);
    }
    interfaces_.clear();
  }
}

NetworkSensor::~NetworkSensor() {
  for (InterfaceSource& iface : interfaces_) {
    if (iface.rx_bytes_file != nullptr) {
      std::fclose(iface.rx_bytes_file);
      iface.rx_bytes_file = nullptr;
    }
    if (iface.tx_bytes_file != nullptr) {
      std::fclose(iface.tx_bytes_file);
      iface.tx_bytes_file = nullptr;
    }
  }
}

std::optional<float> NetworkSensor::sample(const std::uint64_t monotonic_ns) noexcept {
  raw_ = {};
  raw_.interfaces = interfaces_.size();

  bool all_reads_ok = true;
  for (const InterfaceSource& iface : interfaces_) {
    std::uint64_t value = 0;
    all_reads_ok = read_u64_file(iface.rx_bytes_file, value) && all_reads_ok;
    raw_.rx_bytes += value;
    all_reads_ok = read_u64_file(iface.tx_bytes_file, value) && all_reads_ok;
    raw_.tx_bytes += value;
  }

  if (!all_reads_ok) {
    // Keep the baseline; a partial total would show up as a bogus delta.
    return std::nullopt;
  }

  const std::uint64_t total_bytes = raw_.rx_bytes + raw_.tx_bytes;

  if (!has_prev_ || monotonic_ns <= prev_timestamp_ns_) {
    prev_total_bytes_ = total_bytes;
    prev_timestamp_ns_ = monotonic_ns;
    has_prev_ = true;
    return 0.0F;
  }

  const std::uint64_t delta_bytes = total_bytes >= prev_total_bytes_ ? (total_bytes - prev_total_bytes_) : 0;
  const double elapsed_s = static_cast<double>(monotonic_ns - prev_timestamp_ns_) / 1e9;
  prev_total_bytes_ = total_bytes;
  prev_timestamp_ns_ = monotonic_ns;

  return static_cast<float>((static_cast<double>(delta_bytes) / 1024.0) / elapsed_s);
}

const NetworkSensor::RawFields& NetworkSensor::raw() const noexcept { return raw_; }

bool NetworkSensor::read_u64_file(std::FILE* file, std::uint64_t& value) noexcept {
  if (file == nullptr) {
    value = 0;
    return false;
  }

  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    value = 0;
    return false;
  }

  unsigned long long parsed = 0;
  if (std::fscanf(file, "%llu", &parsed) != 1) {
    std::clearerr(file);
    value = 0;
    return false;
  }

  value = static_cast<std::uint64_t>(parsed);
  return true;
}

}  // namespace tuxmood::sensors
