#include "animation/skin_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace tuxmood::animation {
namespace {

constexpr const char* kManifestName = "skin.json";
constexpr double kDefaultFps = 24.0;
constexpr double kMinFps = 1.0;
constexpr double kMaxFps = 1000.0;

struct SequenceSettings {
  std::string dir;
  double fps{kDefaultFps};
};

bool is_png(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".png";
}

std::chrono::milliseconds frame_duration(const double fps) {
  if (!std::isfinite(fps) || fps <= 0.0) {
    return model::kDefaultFrameDuration;
  }
  const double clamped = std::clamp(fps, kMinFps, kMaxFps);
  return std::chrono::milliseconds(static_cast<long long>(1000.0 / clamped));
}

nlohmann::json read_manifest(const std::filesystem::path& skin_dir) {
  const auto manifest_path = skin_dir / kManifestName;
  std::error_code ec;
  if (!std::filesystem::exists(manifest_path, ec)) {
    return nlohmann::json::object();
  }

  std::ifstream input(manifest_path);
  if (!input.is_open()) {
    std::cerr << "[skin] unable to open " << manifest_path.string() << "; using defaults\n";
    return nlohmann::json::object();
  }

  try {
    auto manifest = nlohmann::json::parse(input);
    if (!manifest.is_object()) {
      std::cerr << "[skin] " << manifest_path.string() << " is not a JSON object; using defaults\n";
      return nlohmann::json::object();
    }
    return manifest;
  } catch (const nlohmann::json::exception& ex) {
    std::cerr << "[skin] failed to parse " << manifest_path.string() << ": " << ex.what() << "; using defaults\n";
    return nlohmann::json::object();
  }
}

SequenceSettings settings_for(const nlohmann::json& manifest, const model::emotion_state state) {
  SequenceSettings settings{};
  settings.dir = std::string(model::to_string(state));

  const auto animations_it = manifest.find("animations");
  if (animations_it == manifest.end() || !animations_it->is_object()) {
    return settings;
  }

  const auto entry_it = animations_it->find(settings.dir);
  if (entry_it == animations_it->end() || !entry_it->is_object()) {
    return settings;
  }

  const auto fps_it = entry_it->find("fps");
  if (fps_it != entry_it->end() && fps_it->is_number()) {
    settings.fps = fps_it->get<double>();
  }

  const auto dir_it = entry_it->find("dir");
  if (dir_it != entry_it->end() && dir_it->is_string()) {
    settings.dir = dir_it->get<std::string>();
  }

  return settings;
}

std::vector<std::filesystem::path> list_frames(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> frames;
  try {
    if (!std::filesystem::is_directory(dir)) {
      return frames;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      if (entry.is_regular_file() && is_png(entry.path())) {
        frames.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error& ex) {
    std::cerr << "[skin] failed to list " << dir.string() << ": " << ex.what() << '\n';
    frames.clear();
  }

  std::sort(frames.begin(), frames.end());
  return frames;
}

}  // namespace

std::optional<std::filesystem::path> Skin::asset_path(const model::frame_handle handle) const {
  if (handle == model::kPlaceholderFrame || handle > assets.size()) {
    return std::nullopt;
  }
  return assets[handle - 1];
}

Skin load_skin(const std::filesystem::path& skin_dir) {
  Skin skin{};
  skin.name = skin_dir.filename().string();

  const nlohmann::json manifest = read_manifest(skin_dir);
  const auto name_it = manifest.find("name");
  if (name_it != manifest.end() && name_it->is_string()) {
    skin.name = name_it->get<std::string>();
  }

  std::size_t loaded_states = 0;
  for (const auto state : model::kAllEmotionStates) {
    const SequenceSettings settings = settings_for(manifest, state);
    const auto frames = list_frames(skin_dir / settings.dir);
    if (frames.empty()) {
      continue;
    }

    auto& sequence = skin.animations.at(state);
    sequence.reserve(frames.size());
    for (const auto& path : frames) {
      skin.assets.push_back(path);
      sequence.push_back(model::frame{static_cast<model::frame_handle>(skin.assets.size()), frame_duration(settings.fps)});
    }
    ++loaded_states;
  }

  std::cerr << "[skin] loaded '" << skin.name << "' with " << skin.assets.size() << " frames across " << loaded_states
            << " states\n";
  return skin;
}

}  // namespace tuxmood::animation
