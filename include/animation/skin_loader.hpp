#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "model/animation.hpp"

namespace tuxmood::animation {

struct Skin {
  std::string name;
  model::animation_set animations;
  // Handle h (h >= 1) refers to assets[h - 1].
  std::vector<std::filesystem::path> assets;

  [[nodiscard]] std::optional<std::filesystem::path> asset_path(model::frame_handle handle) const;
};

// Loads <skin_dir>/skin.json (optional) and the *.png frames of every state
// directory. Missing directories produce empty sequences, not errors.
Skin load_skin(const std::filesystem::path& skin_dir);

}  // namespace tuxmood::animation
