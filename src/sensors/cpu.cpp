#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstdlib>

namespace tuxmood::sensors {

CpuSensor::CpuSensor() : file_(std::fopen("/proc/stat", "r")), owns_file_(true) {}

CpuSensor::CpuSensor(std::FILE* file, const bool owns_file) : file_(file), owns_file_(owns_file) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

std::optional<float> CpuSensor::sample() noexcept {
  if (file_ == nullptr) {
    return std::nullopt;
  }

  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    return std::nullopt;
  }

  char buffer[kReadBufferSize]{};
  if (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file_) == nullptr) {
    std::clearerr(file_);
    return std::nullopt;
  }

  const char* cursor = buffer;
  if (cursor[0] != 'c' || cursor[1] != 'p' || cursor[2] != 'u' || cursor[3] != ' ') {
    return std::nullopt;
  }
  cursor += 4;

  std::uint64_t values[10]{};
  std::size_t parsed_fields = 0;
  for (std::size_t i = 0; i < 10; ++i) {
    while (*cursor == ' ') {
      ++cursor;
    }
    if (*cursor == '\0' || *cursor == '\n') {
      break;
    }

    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(cursor, &end, 10);
    if (errno != 0 || end == cursor) {
      return std::nullopt;
    }
    values[i] = parsed;
    cursor = end;
    ++parsed_fields;
  }

  if (parsed_fields < 4) {
    return std::nullopt;
  }

  const std::uint64_t idle = values[3] + values[4];
  const std::uint64_t non_idle = values[0] + values[1] + values[2] + values[5] + values[6] + values[7];
  const std::uint64_t total = idle + non_idle;

  if (!has_prev_) {
    has_prev_ = true;
    prev_total_ = total;
    prev_idle_ = idle;
    return 0.0F;
  }

  const std::uint64_t total_delta = total >= prev_total_ ? (total - prev_total_) : 0;
  const std::uint64_t idle_delta = idle >= prev_idle_ ? (idle - prev_idle_) : 0;

  prev_total_ = total;
  prev_idle_ = idle;

  if (total_delta == 0) {
    return 0.0F;
  }

  const std::uint64_t busy_ticks = total_delta >= idle_delta ? (total_delta - idle_delta) : 0;
  return (static_cast<float>(busy_ticks) / static_cast<float>(total_delta)) * 100.0F;
}

}  // namespace tuxmood::sensors
