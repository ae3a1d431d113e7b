#pragma once

#include <memory>

#include "model/metric_sample.hpp"

namespace tuxmood::sensors {

// Feed of raw readings. A field that cannot be read is left empty; a source
// never throws for an unreadable counter.
class MetricSource {
 public:
  virtual model::raw_metrics sample() = 0;
  virtual ~MetricSource() = default;
};

std::unique_ptr<MetricSource> make_proc_source();

}  // namespace tuxmood::sensors
