#include "input/MotionRecognizer.h"

#include <algorithm>
#include <initializer_list>

namespace {

constexpr std::array<Dir, 3> kQcf = {Dir::Down, Dir::DownForward, Dir::Forward};
constexpr std::array<Dir, 3> kQcb = {Dir::Down, Dir::DownBack, Dir::Back};
constexpr std::array<Dir, 3> kDp = {Dir::Forward, Dir::Down, Dir::DownForward};
constexpr std::array<Dir, 6> kQcf2 = {Dir::Down, Dir::DownForward, Dir::Forward,
                                      Dir::Down, Dir::DownForward, Dir::Forward};

bool dirIn(Dir d, std::initializer_list<Dir> set) {
  return std::ranges::find(set, d) != set.end();
}

bool isChargeDir(Motion motion, Dir d) {
  if (motion == Motion::ChargeBF)
    return dirIn(d, {Dir::Back, Dir::DownBack, Dir::UpBack});
  return dirIn(d, {Dir::Down, Dir::DownBack, Dir::DownForward});
}

bool isReleaseDir(Motion motion, Dir d) {
  if (motion == Motion::ChargeBF)
    return dirIn(d, {Dir::Forward, Dir::DownForward, Dir::UpForward});
  return dirIn(d, {Dir::Up, Dir::UpForward, Dir::UpBack});
}

// Strongest button of the class in a mask.
bool strongest(std::uint8_t mask, ButtonClass cls, Button& out) {
  constexpr std::array<Button, 3> kPunches = {Button::HP, Button::MP, Button::LP};
  constexpr std::array<Button, 3> kKicks = {Button::HK, Button::MK, Button::LK};
  const std::array<Button, 3>& order = cls == ButtonClass::Punch ? kPunches : kKicks;
  for (Button b : order) {
    if ((mask & buttonBit(b)) != 0) {
      out = b;
      return true;
    }
  }
  return false;
}

}  // namespace

const char* motionName(Motion motion) {
  switch (motion) {
    case Motion::QCF:
      return "qcf";
    case Motion::QCB:
      return "qcb";
    case Motion::DP:
      return "dp";
    case Motion::QCF2:
      return "qcf2";
    case Motion::ChargeBF:
      return "charge_bf";
    case Motion::ChargeDU:
      return "charge_du";
  }
  return "?";
}

bool parseMotion(std::string_view s, Motion& out) {
  for (std::size_t i = 0; i < kMotionCount; ++i) {
    auto m = static_cast<Motion>(i);
    if (s == motionName(m)) {
      out = m;
      return true;
    }
  }
  // numpad aliases
  if (s == "236") {
    out = Motion::QCF;
    return true;
  }
  if (s == "214") {
    out = Motion::QCB;
    return true;
  }
  if (s == "623") {
    out = Motion::DP;
    return true;
  }
  if (s == "236236") {
    out = Motion::QCF2;
    return true;
  }
  return false;
}

const char* dirName(Dir dir) {
  switch (dir) {
    case Dir::Neutral:
      return "5";
    case Dir::Up:
      return "8";
    case Dir::Down:
      return "2";
    case Dir::Forward:
      return "6";
    case Dir::Back:
      return "4";
    case Dir::DownForward:
      return "3";
    case Dir::DownBack:
      return "1";
    case Dir::UpForward:
      return "9";
    case Dir::UpBack:
      return "7";
  }
  return "5";
}

Dir dominantDirection(const InputSnapshot& in, int facingX) {
  const bool fwd = facingX >= 0 ? in.right : in.left;
  const bool back = facingX >= 0 ? in.left : in.right;
  if (in.down && fwd)
    return Dir::DownForward;
  if (in.down && back)
    return Dir::DownBack;
  if (in.up && fwd)
    return Dir::UpForward;
  if (in.up && back)
    return Dir::UpBack;
  if (fwd)
    return Dir::Forward;
  if (in.down)
    return Dir::Down;
  if (in.up)
    return Dir::Up;
  if (back)
    return Dir::Back;
  return Dir::Neutral;
}

MotionRecognizer::MotionRecognizer(const MotionWindows& windows) : windows_(windows) {
  reset();
}

void MotionRecognizer::reset() {
  consumedThrough_ = -1;
}

int MotionRecognizer::windowFrames(Motion motion) const {
  switch (motion) {
    case Motion::QCF:
      return windows_.qcf;
    case Motion::QCB:
      return windows_.qcb;
    case Motion::DP:
      return windows_.dp;
    case Motion::QCF2:
      return windows_.qcf2;
    case Motion::ChargeBF:
    case Motion::ChargeDU:
      return windows_.chargeFrames + (2 * windows_.chargeRelease);
  }
  return windows_.qcf;
}

int MotionRecognizer::retentionFrames() const {
  int frames = 0;
  for (std::size_t i = 0; i < kMotionCount; ++i) {
    frames = std::max(frames, windowFrames(static_cast<Motion>(i)));
  }
  return frames + 1;
}

bool MotionRecognizer::usable(uint64_t tick) const {
  return static_cast<int64_t>(tick) > consumedThrough_;
}

bool MotionRecognizer::buttonInFrame(const InputHistoryFrame& frame,
                                     ButtonClass cls,
                                     uint64_t now,
                                     MotionMatch& out) const {
  const std::uint8_t mask = classMask(cls);
  if (strongest(static_cast<std::uint8_t>(frame.snapshot.pressed & mask), cls, out.button)) {
    out.negativeEdge = false;
    return true;
  }
  if (now - frame.tick <= static_cast<uint64_t>(windows_.negativeEdge) &&
      strongest(static_cast<std::uint8_t>(frame.snapshot.released & mask), cls, out.button)) {
    out.negativeEdge = true;
    return true;
  }
  return false;
}

bool MotionRecognizer::find(const MotionHistory& history,
                            Motion motion,
                            ButtonClass cls,
                            uint64_t now,
                            int facingX,
                            MotionMatch& out) const {
  if (history.empty()) {
    return false;
  }

  MotionMatch match{};
  match.motion = motion;
  match.tick = now;
  const bool charge = motion == Motion::ChargeBF || motion == Motion::ChargeDU;
  const bool ok = charge ? matchCharge(history, motion, cls, now, facingX, match)
                         : matchSequence(history, motion, cls, now, facingX, match);
  if (!ok) {
    return false;
  }
  out = match;
  return true;
}

void MotionRecognizer::consume(uint64_t now) {
  consumedThrough_ = std::max(consumedThrough_, static_cast<int64_t>(now));
}

bool MotionRecognizer::recognize(const MotionHistory& history,
                                 Motion motion,
                                 ButtonClass cls,
                                 uint64_t now,
                                 int facingX,
                                 MotionMatch& out) {
  if (!find(history, motion, cls, now, facingX, out)) {
    return false;
  }
  consume(now);
  return true;
}

bool MotionRecognizer::matchSequence(const MotionHistory& history,
                                     Motion motion,
                                     ButtonClass cls,
                                     uint64_t now,
                                     int facingX,
                                     MotionMatch& out) const {
  const Dir* pattern = nullptr;
  int len = 0;
  switch (motion) {
    case Motion::QCF:
      pattern = kQcf.data();
      len = static_cast<int>(kQcf.size());
      break;
    case Motion::QCB:
      pattern = kQcb.data();
      len = static_cast<int>(kQcb.size());
      break;
    case Motion::DP:
      pattern = kDp.data();
      len = static_cast<int>(kDp.size());
      break;
    case Motion::QCF2:
      pattern = kQcf2.data();
      len = static_cast<int>(kQcf2.size());
      break;
    case Motion::ChargeBF:
    case Motion::ChargeDU:
      return false;
  }

  const auto window = static_cast<uint64_t>(windowFrames(motion));
  int idx = len - 1;
  bool haveButton = false;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (now - it->tick >= window || !usable(it->tick)) {
      break;
    }
    if (idx >= 0 && dominantDirection(it->snapshot, facingX) == pattern[idx]) {
      --idx;
    }
    if (!haveButton) {
      haveButton = buttonInFrame(*it, cls, now, out);
    }
    if (idx < 0 && haveButton) {
      return true;
    }
  }
  return false;
}

bool MotionRecognizer::matchCharge(const MotionHistory& history,
                                   Motion motion,
                                   ButtonClass cls,
                                   uint64_t now,
                                   int facingX,
                                   MotionMatch& out) const {
  enum class Phase : std::uint8_t { Release, Gap, Charge };
  Phase phase = Phase::Release;
  uint64_t releaseTick = 0;
  int charged = 0;
  bool haveButton = false;
  const auto release = static_cast<uint64_t>(windows_.chargeRelease);

  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (!usable(it->tick)) {
      break;
    }
    if (!haveButton && now - it->tick < release) {
      haveButton = buttonInFrame(*it, cls, now, out);
    }

    const Dir d = dominantDirection(it->snapshot, facingX);
    switch (phase) {
      case Phase::Release:
        if (now - it->tick >= release) {
          return false;
        }
        if (isReleaseDir(motion, d)) {
          releaseTick = it->tick;
          phase = Phase::Gap;
        }
        break;
      case Phase::Gap:
        if (isChargeDir(motion, d)) {
          phase = Phase::Charge;
          charged = 1;
        } else if (releaseTick - it->tick >= release) {
          return false;
        }
        break;
      case Phase::Charge:
        if (!isChargeDir(motion, d)) {
          return false;
        }
        ++charged;
        break;
    }

    if (phase == Phase::Charge && charged >= windows_.chargeFrames) {
      return haveButton;
    }
  }
  return false;
}
