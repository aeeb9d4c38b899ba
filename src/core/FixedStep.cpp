#include "core/FixedStep.h"

#include <algorithm>

FixedStep::FixedStep(int frameRate) : step_(1.0F / static_cast<float>(std::max(1, frameRate))) {}

int FixedStep::advance(float realDt) {
  if (realDt > kMaxFrameDt) {
    realDt = kMaxFrameDt;
  }
  if (realDt > 0.0F) {
    accumulator_ += realDt;
  }

  int steps = 0;
  while (accumulator_ >= step_ && steps < kMaxStepsPerFrame) {
    accumulator_ -= step_;
    ++steps;
  }
  // Drop what we could not catch up on instead of spiraling.
  if (steps == kMaxStepsPerFrame) {
    accumulator_ = std::min(accumulator_, step_);
  }
  return steps;
}

TimeStep FixedStep::next() {
  return TimeStep{step_, frame_++};
}

void FixedStep::reset() {
  accumulator_ = 0.0F;
  frame_ = 0;
}
