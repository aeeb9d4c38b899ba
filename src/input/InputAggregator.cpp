#include "input/InputAggregator.h"

#include <cstring>

InputAggregator::InputAggregator(SocdPolicy policy) : policy_(policy) {
  reset();
}

void InputAggregator::reset() {
  raw_ = DeviceState{};
  prev_ = InputSnapshot{};
  dirPressTick_.fill(kNever);
  pressTick_.fill(kNever);
  releaseTick_.fill(kNever);
  totalInputs_ = 0;
}

void InputAggregator::resolveAxis(bool negHeld,
                                  bool posHeld,
                                  Axis neg,
                                  Axis pos,
                                  bool& negOut,
                                  bool& posOut) const {
  negOut = negHeld;
  posOut = posHeld;
  if (!(negHeld && posHeld)) {
    return;
  }

  negOut = false;
  posOut = false;
  if (policy_ == SocdPolicy::Neutral) {
    return;
  }

  // Last input wins; a simultaneous press stays neutral.
  const int64_t negTick = dirPressTick_[neg];
  const int64_t posTick = dirPressTick_[pos];
  if (negTick > posTick) {
    negOut = true;
  } else if (posTick > negTick) {
    posOut = true;
  }
}

InputSnapshot InputAggregator::update(const Devices& devices, uint64_t tick) {
  DeviceState merged{};
  for (const DeviceState& d : devices) {
    merged.left = merged.left || d.left;
    merged.right = merged.right || d.right;
    merged.up = merged.up || d.up;
    merged.down = merged.down || d.down;
    for (std::size_t i = 0; i < kButtonCount; ++i) {
      merged.buttons[i] = merged.buttons[i] || d.buttons[i];
    }
  }

  const auto now = static_cast<int64_t>(tick);
  auto trackDir = [&](bool held, bool wasHeld, Axis axis) {
    if (held && !wasHeld) {
      dirPressTick_[axis] = now;
      ++totalInputs_;
    }
  };
  trackDir(merged.left, raw_.left, kLeft);
  trackDir(merged.right, raw_.right, kRight);
  trackDir(merged.up, raw_.up, kUp);
  trackDir(merged.down, raw_.down, kDown);

  InputSnapshot out{};
  resolveAxis(merged.left, merged.right, kLeft, kRight, out.left, out.right);
  resolveAxis(merged.down, merged.up, kDown, kUp, out.down, out.up);

  for (std::size_t i = 0; i < kButtonCount; ++i) {
    const auto bit = static_cast<std::uint8_t>(1U << i);
    const bool held = merged.buttons[i];
    const bool wasHeld = raw_.buttons[i];
    if (held) {
      out.held |= bit;
    }
    if (held && !wasHeld) {
      out.pressed |= bit;
      pressTick_[i] = now;
      ++totalInputs_;
    }
    if (!held && wasHeld) {
      out.released |= bit;
      releaseTick_[i] = now;
    }
  }

  if (out.left && !prev_.left)
    out.dirPressed |= kDirLeft;
  if (out.right && !prev_.right)
    out.dirPressed |= kDirRight;
  if (out.up && !prev_.up)
    out.dirPressed |= kDirUp;
  if (out.down && !prev_.down)
    out.dirPressed |= kDirDown;

  // Chords: both held, at least one of them new this tick.
  auto chord = [&out](Button a, Button b) {
    return out.isHeld(a) && out.isHeld(b) && (out.isPressed(a) || out.isPressed(b));
  };
  out.throwPressed = chord(Button::LP, Button::LK);
  out.techPressed = chord(Button::MP, Button::MK);

  raw_ = merged;
  prev_ = out;
  return out;
}

int64_t InputAggregator::lastPressTick(Button b) const {
  return pressTick_[static_cast<std::size_t>(b)];
}

int64_t InputAggregator::lastReleaseTick(Button b) const {
  return releaseTick_[static_cast<std::size_t>(b)];
}

bool InputAggregator::negativeEdge(Button b, uint64_t tick, int windowFrames) const {
  const int64_t rel = lastReleaseTick(b);
  if (rel == kNever || raw_.buttons[static_cast<std::size_t>(b)]) {
    return false;
  }
  return static_cast<int64_t>(tick) - rel <= windowFrames;
}

const char* socdPolicyName(SocdPolicy policy) {
  switch (policy) {
    case SocdPolicy::Neutral:
      return "neutral";
    case SocdPolicy::Last:
      return "last";
  }
  return "neutral";
}

bool parseSocdPolicy(const char* s, SocdPolicy& out) {
  if (s == nullptr)
    return false;
  if (std::strcmp(s, "neutral") == 0) {
    out = SocdPolicy::Neutral;
    return true;
  }
  if (std::strcmp(s, "last") == 0) {
    out = SocdPolicy::Last;
    return true;
  }
  return false;
}
