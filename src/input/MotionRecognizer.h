#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "input/InputSnapshot.h"
#include "input/MotionHistory.h"

enum class Motion : std::uint8_t { QCF, QCB, DP, QCF2, ChargeBF, ChargeDU };

inline constexpr std::size_t kMotionCount = 6;

// Dominant stick direction relative to facing.
enum class Dir : std::uint8_t {
  Neutral,
  Up,
  Down,
  Forward,
  Back,
  DownForward,
  DownBack,
  UpForward,
  UpBack,
};

const char* motionName(Motion motion);
bool parseMotion(std::string_view s, Motion& out);
const char* dirName(Dir dir);

// facingX > 0 means forward is +x (right).
Dir dominantDirection(const InputSnapshot& in, int facingX);

// Leniency windows in frames.
struct MotionWindows {
  int qcf = 15;
  int qcb = 15;
  int dp = 13;
  int qcf2 = 24;
  int chargeFrames = 45;
  int chargeRelease = 15;
  int negativeEdge = 4;
};

struct MotionMatch {
  Motion motion = Motion::QCF;
  Button button = Button::LP;
  uint64_t tick = 0;
  bool negativeEdge = false;
};

class MotionRecognizer {
 public:
  explicit MotionRecognizer(const MotionWindows& windows = {});

  void setWindows(const MotionWindows& windows) { windows_ = windows; }
  [[nodiscard]] const MotionWindows& windows() const { return windows_; }

  // Looks for `motion` plus a button of `cls` in the frames not yet consumed.
  bool find(const MotionHistory& history,
            Motion motion,
            ButtonClass cls,
            uint64_t now,
            int facingX,
            MotionMatch& out) const;

  // Marks every frame up to `now` as used for all motions, so one physical input
  // fires at most one special.
  void consume(uint64_t now);

  // find() followed by consume() on success.
  bool recognize(const MotionHistory& history,
                 Motion motion,
                 ButtonClass cls,
                 uint64_t now,
                 int facingX,
                 MotionMatch& out);

  void reset();

  [[nodiscard]] int windowFrames(Motion motion) const;
  // History length needed to evaluate every motion.
  [[nodiscard]] int retentionFrames() const;

 private:
  bool matchSequence(const MotionHistory& history,
                     Motion motion,
                     ButtonClass cls,
                     uint64_t now,
                     int facingX,
                     MotionMatch& out) const;
  bool matchCharge(const MotionHistory& history,
                   Motion motion,
                   ButtonClass cls,
                   uint64_t now,
                   int facingX,
                   MotionMatch& out) const;
  bool buttonInFrame(const InputHistoryFrame& frame, ButtonClass cls, uint64_t now,
                     MotionMatch& out) const;
  [[nodiscard]] bool usable(uint64_t tick) const;

  MotionWindows windows_{};
  int64_t consumedThrough_ = -1;
};
