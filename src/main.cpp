#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "animation/skin_loader.hpp"
#include "core/config.hpp"
#include "core/orchestrator.hpp"
#include "sensors/metric_source.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const tuxmood::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | poll_interval_ms=" << config.poll_interval.count()
         << " | animation_interval_ms=" << config.animation_interval.count()
         << " | dwell_cycles=" << config.dwell_cycles
         << " | max_playback_multiplier=" << config.max_playback_multiplier
         << " | mode=" << tuxmood::model::to_string(config.mode)
         << " | skin_dir=" << config.skin_dir
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | render_stdout=" << (config.render_stdout ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  output << " | redis_db=" << config.redis.db << " | redis_key_prefix=" << config.redis.key_prefix;
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/tuxmood.yaml";

  tuxmood::core::AgentConfig config{};
  try {
    config = tuxmood::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  tuxmood::animation::Skin skin = tuxmood::animation::load_skin(config.skin_dir);

  tuxmood::core::RenderCallback render{};
  if (config.render_stdout) {
    render = [&skin, sink = tuxmood::sinks::StdoutDebugSink{}](const tuxmood::model::frame_handle frame,
                                                              const std::string& tooltip) {
      const auto asset = skin.asset_path(frame);
      sink.render(frame, asset.has_value() ? asset->string() : std::string{}, tooltip);
    };
  }

  tuxmood::core::Orchestrator orchestrator{std::move(config), tuxmood::sensors::make_proc_source(), skin.animations,
                                           std::move(render)};
  orchestrator.start();

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";
  orchestrator.stop();

  return 0;
}
