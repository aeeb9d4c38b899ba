#include "input/MotionHistory.h"

#include <algorithm>

MotionHistory::MotionHistory(int retentionFrames) : retention_(std::max(1, retentionFrames)) {}

void MotionHistory::setRetentionFrames(int frames) {
  retention_ = std::max(1, frames);
  if (!frames_.empty()) {
    prune(frames_.back().tick);
  }
}

void MotionHistory::push(uint64_t tick, const InputSnapshot& snapshot) {
  if (!frames_.empty() && tick <= frames_.back().tick) {
    frames_.clear();
  }
  frames_.push_back(InputHistoryFrame{tick, snapshot});
  prune(tick);
}

void MotionHistory::prune(uint64_t now) {
  const auto window = static_cast<uint64_t>(retention_);
  while (!frames_.empty() && now - frames_.front().tick >= window) {
    frames_.pop_front();
  }
}
