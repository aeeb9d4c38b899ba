#pragma once

#include <cstdint>

struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};

// Convert milliseconds to whole frames at a fixed tick rate, rounding to nearest.
constexpr int msToFrames(int ms, int frameRate) {
  if (ms <= 0 || frameRate <= 0) {
    return 0;
  }
  return (ms * frameRate + 500) / 1000;  // +500 for rounding
}
