#include "sensors/metric_source.hpp"

#include "core/timestamp.hpp"
#include "sensors/cpu.hpp"
#include "sensors/memory.hpp"
#include "sensors/network.hpp"

namespace tuxmood::sensors {

namespace {

class ProcMetricSource final : public MetricSource {
 public:
  model::raw_metrics sample() override {
    const std::uint64_t now_ns = core::monotonic_timestamp_now_ns();
    return model::raw_metrics{
        .cpu_pct = cpu_.sample(),
        .ram_pct = memory_.sample(),
        .net_kbps = network_.sample(now_ns),
        .timestamp_ns = now_ns,
    };
  }

 private:
  CpuSensor cpu_{};
  MemorySensor memory_{};
  NetworkSensor network_{};
};

}  // namespace

std::unique_ptr<MetricSource> make_proc_source() { return std::make_unique<ProcMetricSource>(); }

}  // namespace tuxmood::sensors
