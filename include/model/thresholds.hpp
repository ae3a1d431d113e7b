#pragma once

#include <cstdint>

namespace tuxmood::model {

// Boundaries for one metric. Ordering max <= busy <= high <= critical is
// enforced by core::validate_thresholds, never by the classifier.
struct metric_thresholds {
    float max;       // calm ceiling
    float busy;      // single resource busy
    float high;      // counts towards the multi-resource stressed rule
    float critical;  // hard cap, overloaded
};

// Single-metric focus ladder, inclusive: below `idle` is Calm, from `idle`
// up to `walk` is Busy, `walk` and above is Stressed.
struct focus_thresholds {
    float idle;
    float walk;
};

struct threshold_config {
    metric_thresholds cpu{20.0F, 60.0F, 70.0F, 90.0F};
    metric_thresholds ram{30.0F, 60.0F, 75.0F, 90.0F};
    metric_thresholds network{50.0F, 600.0F, 800.0F, 2000.0F};
    std::uint32_t multiple_resources_threshold{2};
    focus_thresholds cpu_focus{30.0F, 80.0F};
    focus_thresholds ram_focus{40.0F, 85.0F};
    focus_thresholds network_focus{100.0F, 1000.0F};
};

} // namespace tuxmood::model
