#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>

namespace tuxmood::model {

enum class metric_field : std::uint8_t {
    CPU = 0,
    RAM = 1,
    NETWORK = 2,
};

inline constexpr std::uint8_t field_bit(const metric_field field) noexcept {
    return static_cast<std::uint8_t>(1U << static_cast<std::uint8_t>(field));
}

// What a metric source produced for one poll. An empty field means the
// underlying counter could not be read this time.
struct raw_metrics {
    std::optional<float> cpu_pct;
    std::optional<float> ram_pct;
    std::optional<float> net_kbps;
    std::uint64_t timestamp_ns{0};
};

// Sanitized sample consumed by the classifier, one per poll.
struct metric_sample {
    float cpu_pct;
    float ram_pct;
    float net_kbps;
    std::uint64_t timestamp_ns;

    // Bitmask of field_bit() values that were substituted.
    std::uint8_t substituted;
    bool degraded;
};

static_assert(std::is_trivial_v<metric_sample>, "metric_sample must be trivial");

} // namespace tuxmood::model
