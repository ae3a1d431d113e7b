#include "sensors/memory.hpp"

#include <cstring>

namespace tuxmood::sensors {

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

std::optional<float> MemorySensor::sample() noexcept {
  if (!parse_meminfo()) {
    return std::nullopt;
  }

  const std::uint64_t available =
      raw_.mem_available_kb > raw_.mem_total_kb ? raw_.mem_total_kb : raw_.mem_available_kb;
  const std::uint64_t used = raw_.mem_total_kb - available;
  return (static_cast<float>(used) / static_cast<float>(raw_.mem_total_kb)) * 100.0F;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

bool MemorySensor::parse_meminfo() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};
  bool has_available = false;

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu kB", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
      has_available = true;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }
  std::clearerr(meminfo_);

  return raw_.mem_total_kb != 0 && has_available;
}

}  // namespace tuxmood::sensors
