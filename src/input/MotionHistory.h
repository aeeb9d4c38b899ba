#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

#include "input/InputSnapshot.h"

struct InputHistoryFrame {
  uint64_t tick = 0;
  InputSnapshot snapshot{};
};

// Time-ordered log of recent snapshots, oldest at the front.
class MotionHistory {
 public:
  static constexpr int kDefaultRetentionFrames = 90;

  using const_iterator = std::deque<InputHistoryFrame>::const_iterator;
  using const_reverse_iterator = std::deque<InputHistoryFrame>::const_reverse_iterator;

  explicit MotionHistory(int retentionFrames = kDefaultRetentionFrames);

  // Appends a frame and drops frames that fell out of the retention window.
  // A tick that does not advance past the newest frame restarts the log.
  void push(uint64_t tick, const InputSnapshot& snapshot);
  void clear() { frames_.clear(); }

  void setRetentionFrames(int frames);
  [[nodiscard]] int retentionFrames() const { return retention_; }

  [[nodiscard]] bool empty() const { return frames_.empty(); }
  [[nodiscard]] std::size_t size() const { return frames_.size(); }
  [[nodiscard]] const InputHistoryFrame& newest() const { return frames_.back(); }
  [[nodiscard]] const InputHistoryFrame& oldest() const { return frames_.front(); }

  // oldest -> newest
  [[nodiscard]] const_iterator begin() const { return frames_.begin(); }
  [[nodiscard]] const_iterator end() const { return frames_.end(); }
  // newest -> oldest
  [[nodiscard]] const_reverse_iterator rbegin() const { return frames_.rbegin(); }
  [[nodiscard]] const_reverse_iterator rend() const { return frames_.rend(); }

 private:
  void prune(uint64_t now);

  std::deque<InputHistoryFrame> frames_;
  int retention_ = kDefaultRetentionFrames;
};
