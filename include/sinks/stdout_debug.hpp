#pragma once

#include <string>

#include "model/animation.hpp"
#include "model/mood_frame.hpp"

namespace tuxmood::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::mood_frame& frame) const;

  // Stand-in renderer for headless runs: one line per displayed frame.
  void render(model::frame_handle frame, const std::string& asset, const std::string& tooltip) const;
};

}  // namespace tuxmood::sinks
