#pragma once

#include <cstdint>

#include "core/Time.h"

// Turns variable real-time deltas into whole simulation ticks.
class FixedStep {
 public:
  static constexpr float kMaxFrameDt = 0.25F;
  static constexpr int kMaxStepsPerFrame = 8;

  explicit FixedStep(int frameRate = 60);

  // Returns how many ticks to run for this real-time delta.
  int advance(float realDt);
  // Consumes one tick and returns its step.
  TimeStep next();
  void reset();

  [[nodiscard]] float stepSeconds() const { return step_; }
  [[nodiscard]] float alpha() const { return accumulator_ / step_; }
  [[nodiscard]] uint64_t frame() const { return frame_; }

 private:
  float step_ = 1.0F / 60.0F;
  float accumulator_ = 0.0F;
  uint64_t frame_ = 0;
};
