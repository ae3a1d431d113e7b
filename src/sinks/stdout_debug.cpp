#include "sinks/stdout_debug.hpp"

#include <cstdio>

#include "model/metric_sample.hpp"

namespace tuxmood::sinks {
namespace {

std::string stressor_list(const std::uint8_t stressors) {
  std::string out;
  const auto append = [&out, stressors](const model::metric_field field, const char* name) {
    if ((stressors & model::field_bit(field)) == 0) {
      return;
    }
    if (!out.empty()) {
      out += ',';
    }
    out += name;
  };
  append(model::metric_field::CPU, "cpu");
  append(model::metric_field::RAM, "ram");
  append(model::metric_field::NETWORK, "network");
  return out.empty() ? "none" : out;
}

}  // namespace

void StdoutDebugSink::publish(const model::mood_frame& frame) const {
  // Names come from string literals, so data() is null-terminated.
  std::printf("[mood] cpu=%.2f ram=%.2f network_kbps=%.2f degraded=%d mode=%s raw=%s state=%s "
              "score=%.2f trend=%.2f stressors=%s\n",
              frame.cpu, frame.ram, frame.network, frame.degraded ? 1 : 0, model::to_string(frame.mode).data(),
              model::to_string(frame.raw_state).data(), model::to_string(frame.state).data(), frame.stress_score,
              frame.stress_trend, stressor_list(frame.stressors).c_str());
  std::printf("[health] poll_time_ms=%.3f redis_latency_ms=%.3f redis_errors=%u degraded_samples=%u "
              "render_failures=%u missed_polls=%u\n",
              frame.agent.poll_time_ms, frame.agent.redis_latency_ms, frame.agent.redis_errors,
              frame.agent.degraded_samples, frame.agent.render_failures, frame.agent.missed_polls);
}

void StdoutDebugSink::render(const model::frame_handle frame, const std::string& asset,
                             const std::string& tooltip) const {
  std::printf("[render] frame=%u asset=%s tooltip=\"%s\"\n", frame, asset.empty() ? "<placeholder>" : asset.c_str(),
              tooltip.c_str());
}

}  // namespace tuxmood::sinks
