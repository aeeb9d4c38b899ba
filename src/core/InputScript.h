#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <toml++/toml.h>

#include "input/InputSnapshot.h"

// Held inputs for both players, keyed by frame. Values persist until a later keyframe changes
// them; edges are derived downstream by the aggregator.
class InputScript {
 public:
  static constexpr std::size_t kPlayers = 2;
  using Frame = std::array<DeviceState, kPlayers>;

  bool loadFromToml(const char* path);
  bool loadFromString(std::string_view text);
  void reset();
  Frame sample(uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] uint64_t lastKeyframe() const;
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }

 private:
  enum MaskBits : uint32_t {
    kLeft = 1U << 0U,
    kRight = 1U << 1U,
    kUp = 1U << 2U,
    kDown = 1U << 3U,
    kButtonShift = 4U,  // buttons occupy bits 4..9
  };

  struct Keyframe {
    uint64_t frame = 0;
    std::size_t player = 0;
    uint32_t mask = 0;
    DeviceState values{};
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);
  void appendTable(const toml::table& tbl, const char* path);
  void finish();

  std::vector<Keyframe> keyframes_;
  Frame held_{};
  std::size_t nextIndex_ = 0;
  uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
