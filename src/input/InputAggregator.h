#pragma once

#include <array>
#include <cstdint>

#include "input/InputSnapshot.h"

enum class SocdPolicy : std::uint8_t { Neutral, Last };

// Merges the per-device raw state of one player into a single InputSnapshot per tick.
class InputAggregator {
 public:
  using Devices = std::array<DeviceState, kDeviceCount>;

  static constexpr int64_t kNever = -1;

  explicit InputAggregator(SocdPolicy policy = SocdPolicy::Neutral);

  InputSnapshot update(const Devices& devices, uint64_t tick);
  void reset();

  void setSocdPolicy(SocdPolicy policy) { policy_ = policy; }
  [[nodiscard]] SocdPolicy socdPolicy() const { return policy_; }

  [[nodiscard]] uint64_t totalInputs() const { return totalInputs_; }
  [[nodiscard]] int64_t lastPressTick(Button b) const;
  [[nodiscard]] int64_t lastReleaseTick(Button b) const;

  // True when `b` was released within `windowFrames` ticks of `tick` and is not held.
  [[nodiscard]] bool negativeEdge(Button b, uint64_t tick, int windowFrames) const;

  [[nodiscard]] const InputSnapshot& last() const { return prev_; }

 private:
  enum Axis : std::uint8_t { kLeft, kRight, kUp, kDown };

  void resolveAxis(bool negHeld, bool posHeld, Axis neg, Axis pos, bool& negOut, bool& posOut)
      const;

  SocdPolicy policy_ = SocdPolicy::Neutral;
  DeviceState raw_{};
  InputSnapshot prev_{};
  std::array<int64_t, 4> dirPressTick_{};
  std::array<int64_t, kButtonCount> pressTick_{};
  std::array<int64_t, kButtonCount> releaseTick_{};
  uint64_t totalInputs_ = 0;
};

const char* socdPolicyName(SocdPolicy policy);
bool parseSocdPolicy(const char* s, SocdPolicy& out);
