#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

enum class Button : std::uint8_t { LP, MP, HP, LK, MK, HK };

inline constexpr std::size_t kButtonCount = 6;

enum class ButtonClass : std::uint8_t { Punch, Kick };

inline constexpr std::uint8_t buttonBit(Button b) {
  return static_cast<std::uint8_t>(1U << static_cast<unsigned>(b));
}

inline constexpr std::uint8_t kPunchMask =
    buttonBit(Button::LP) | buttonBit(Button::MP) | buttonBit(Button::HP);
inline constexpr std::uint8_t kKickMask =
    buttonBit(Button::LK) | buttonBit(Button::MK) | buttonBit(Button::HK);

inline constexpr std::uint8_t classMask(ButtonClass c) {
  return c == ButtonClass::Punch ? kPunchMask : kKickMask;
}

inline constexpr ButtonClass buttonClass(Button b) {
  return (buttonBit(b) & kPunchMask) != 0 ? ButtonClass::Punch : ButtonClass::Kick;
}

inline constexpr std::string_view buttonName(Button b) {
  constexpr std::array<std::string_view, kButtonCount> kNames = {"lp", "mp", "hp",
                                                                  "lk", "mk", "hk"};
  return kNames[static_cast<std::size_t>(b)];
}

inline bool parseButton(std::string_view s, Button& out) {
  for (std::size_t i = 0; i < kButtonCount; ++i) {
    auto b = static_cast<Button>(i);
    if (s == buttonName(b)) {
      out = b;
      return true;
    }
  }
  return false;
}

enum class Device : std::uint8_t { Keyboard, Pad, Touch };

inline constexpr std::size_t kDeviceCount = 3;

// Raw held state reported by one input device for one tick.
struct DeviceState {
  bool left = false;
  bool right = false;
  bool up = false;
  bool down = false;
  std::array<bool, kButtonCount> buttons{};
};

enum DirBits : std::uint8_t {
  kDirLeft = 1U << 0U,
  kDirRight = 1U << 1U,
  kDirUp = 1U << 2U,
  kDirDown = 1U << 3U,
};

// Per-tick logical input after device merging and SOCD cleaning.
// Directions are absolute (screen-space); facing is applied by consumers.
struct InputSnapshot {
  bool left = false;
  bool right = false;
  bool up = false;
  bool down = false;

  std::uint8_t held = 0;
  std::uint8_t pressed = 0;
  std::uint8_t released = 0;

  std::uint8_t dirPressed = 0;  // DirBits press edges, post-SOCD

  bool throwPressed = false;  // LP+LK chord edge
  bool techPressed = false;   // MP+MK chord edge

  [[nodiscard]] bool isHeld(Button b) const { return (held & buttonBit(b)) != 0; }
  [[nodiscard]] bool isPressed(Button b) const { return (pressed & buttonBit(b)) != 0; }
  [[nodiscard]] bool isReleased(Button b) const { return (released & buttonBit(b)) != 0; }

  bool operator==(const InputSnapshot&) const = default;
};
