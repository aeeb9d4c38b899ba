#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <cstddef>
#include <memory>
#include <string>

namespace {

struct KeyLayout {
  SDL_Scancode left;
  SDL_Scancode right;
  SDL_Scancode up;
  SDL_Scancode down;
  std::array<SDL_Scancode, kButtonCount> buttons;  // LP MP HP LK MK HK
};

// SDL key mappings live here and are consumed by both input processing and UI legends.
constexpr std::array<KeyLayout, Input::kPlayers> kLayouts = {{
    {SDL_SCANCODE_A,
     SDL_SCANCODE_D,
     SDL_SCANCODE_W,
     SDL_SCANCODE_S,
     {SDL_SCANCODE_U, SDL_SCANCODE_I, SDL_SCANCODE_O, SDL_SCANCODE_J, SDL_SCANCODE_K,
      SDL_SCANCODE_L}},
    {SDL_SCANCODE_LEFT,
     SDL_SCANCODE_RIGHT,
     SDL_SCANCODE_UP,
     SDL_SCANCODE_DOWN,
     {SDL_SCANCODE_KP_4, SDL_SCANCODE_KP_5, SDL_SCANCODE_KP_6, SDL_SCANCODE_KP_1,
      SDL_SCANCODE_KP_2, SDL_SCANCODE_KP_3}},
}};

constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kResetRoundKey = SDL_SCANCODE_F5;
constexpr SDL_Scancode kToggleBoxesKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kTogglePanelsKey = SDL_SCANCODE_F2;
constexpr SDL_Scancode kPauseKey = SDL_SCANCODE_P;
constexpr SDL_Scancode kStepKey = SDL_SCANCODE_PERIOD;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadAxis kMoveAxisY = SDL_GAMEPAD_AXIS_LEFTY;

// Six-button layout: punches on the top row, kicks on the bottom row.
constexpr std::array<SDL_GamepadButton, kButtonCount> kPadButtons = {
    SDL_GAMEPAD_BUTTON_WEST,  SDL_GAMEPAD_BUTTON_NORTH, SDL_GAMEPAD_BUTTON_RIGHT_SHOULDER,
    SDL_GAMEPAD_BUTTON_SOUTH, SDL_GAMEPAD_BUTTON_EAST,  SDL_GAMEPAD_BUTTON_LEFT_SHOULDER,
};

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    case SDL_SCANCODE_UP:
      return "↑";
    case SDL_SCANCODE_DOWN:
      return "↓";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name)
    return "?";
  return name;
}

}  // namespace

Input::Pad* Input::findPad(SDL_JoystickID id) {
  for (Pad& p : pads_) {
    if (p.handle != nullptr && p.id == id)
      return &p;
  }
  return nullptr;
}

void Input::openGamepad(SDL_JoystickID id) {
  if (findPad(id) != nullptr)
    return;
  for (Pad& p : pads_) {
    if (p.handle != nullptr)
      continue;
    SDL_Gamepad* gp = SDL_OpenGamepad(id);
    if (!gp)
      return;
    p = Pad{};
    p.handle = gp;
    p.id = id;
    return;
  }
}

void Input::tryOpenGamepads() {
  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }
  for (int i = 0; i < count; ++i) {
    openGamepad(ids.get()[i]);
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenGamepads();
}

void Input::shutdown() {
  for (Pad& p : pads_) {
    if (p.handle) {
      SDL_CloseGamepad(p.handle);
    }
    p = Pad{};
  }
}

// NOLINTNEXTLINE
void Input::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_GAMEPAD_ADDED) {
    openGamepad(e.gdevice.which);
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_REMOVED) {
    if (Pad* p = findPad(e.gdevice.which)) {
      SDL_CloseGamepad(p->handle);
      *p = Pad{};
      tryOpenGamepads();
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_AXIS_MOTION) {
    if (Pad* p = findPad(e.gaxis.which)) {
      if (e.gaxis.axis == kMoveAxisX)
        p->axisX = static_cast<int>(e.gaxis.value);
      else if (e.gaxis.axis == kMoveAxisY)
        p->axisY = static_cast<int>(e.gaxis.value);
    }
    return;
  }
  if (e.type == SDL_EVENT_GAMEPAD_BUTTON_DOWN || e.type == SDL_EVENT_GAMEPAD_BUTTON_UP) {
    Pad* p = findPad(e.gbutton.which);
    if (!p)
      return;
    const bool down = e.gbutton.down;
    switch (e.gbutton.button) {
      case SDL_GAMEPAD_BUTTON_DPAD_LEFT:
        p->dpadLeft = down;
        return;
      case SDL_GAMEPAD_BUTTON_DPAD_RIGHT:
        p->dpadRight = down;
        return;
      case SDL_GAMEPAD_BUTTON_DPAD_UP:
        p->dpadUp = down;
        return;
      case SDL_GAMEPAD_BUTTON_DPAD_DOWN:
        p->dpadDown = down;
        return;
      default:
        break;
    }
    for (std::size_t i = 0; i < kButtonCount; ++i) {
      if (e.gbutton.button == kPadButtons[i])
        p->buttons[i] = down;
    }
    return;
  }

  if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP)
    return;

  const int sc = static_cast<int>(e.key.scancode);
  if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size()))
    return;

  scancodeDown_[sc] = e.key.down;
  updateCommands();
}

void Input::setGamepadDeadzone(int deadzone) {
  if (deadzone < 0)
    deadzone = 0;
  if (deadzone > 32767)
    deadzone = 32767;
  axisDeadzone_ = deadzone;
}

bool Input::hasGamepad(int slot) const {
  return slot >= 0 && slot < kPlayers && pads_[static_cast<std::size_t>(slot)].handle != nullptr;
}

const char* Input::gamepadName(int slot) const {
  if (!hasGamepad(slot))
    return nullptr;
  const char* name = SDL_GetGamepadName(pads_[static_cast<std::size_t>(slot)].handle);
  if (!name || !*name)
    return nullptr;
  return name;
}

DeviceState Input::keyboardState(int slot) const {
  const KeyLayout& k = kLayouts[static_cast<std::size_t>(slot)];
  DeviceState s{};
  s.left = scancodeDown_[k.left];
  s.right = scancodeDown_[k.right];
  s.up = scancodeDown_[k.up];
  s.down = scancodeDown_[k.down];
  for (std::size_t i = 0; i < kButtonCount; ++i) {
    s.buttons[i] = scancodeDown_[k.buttons[i]];
  }
  return s;
}

DeviceState Input::padState(const Pad& pad) const {
  DeviceState s{};
  if (pad.handle == nullptr)
    return s;
  s.left = pad.dpadLeft || (pad.axisX < -axisDeadzone_);
  s.right = pad.dpadRight || (pad.axisX > axisDeadzone_);
  s.up = pad.dpadUp || (pad.axisY < -axisDeadzone_);
  s.down = pad.dpadDown || (pad.axisY > axisDeadzone_);
  s.buttons = pad.buttons;
  return s;
}

Input::PlayerDevices Input::devices() const {
  PlayerDevices out{};
  for (int slot = 0; slot < kPlayers; ++slot) {
    auto& d = out[static_cast<std::size_t>(slot)];
    d[static_cast<std::size_t>(Device::Keyboard)] = keyboardState(slot);
    d[static_cast<std::size_t>(Device::Pad)] = padState(pads_[static_cast<std::size_t>(slot)]);
  }
  return out;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  for (int slot = 0; slot < kPlayers; ++slot) {
    const KeyLayout& k = kLayouts[static_cast<std::size_t>(slot)];
    std::string line = "P" + std::to_string(slot + 1) + ": move " + prettyScancode(k.left) + "/" +
                       prettyScancode(k.right) + "/" + prettyScancode(k.up) + "/" +
                       prettyScancode(k.down) + "  LP MP HP LK MK HK:";
    for (SDL_Scancode sc : k.buttons) {
      line += " ";
      line += prettyScancode(sc);
    }
    out.push_back(line);
    if (const char* gpName = gamepadName(slot))
      out.push_back("  Gamepad: " + std::string(gpName));
  }
  out.emplace_back("Throw: LP+LK  Tech: MP+MK  Parry: tap forward");
  out.push_back(std::string("Boxes: ") + prettyScancode(kToggleBoxesKey) + "  Panels: " +
                prettyScancode(kTogglePanelsKey) + "  Reset round: " +
                prettyScancode(kResetRoundKey) + "  Pause/step: " + prettyScancode(kPauseKey) +
                "/" + prettyScancode(kStepKey));
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::updateCommands() {
  auto edge = [this](SDL_Scancode sc, bool& held, bool& cmd) {
    const bool now = scancodeDown_[sc];
    if (now && !held)
      cmd = true;
    held = now;
  };
  edge(kQuitKey, escHeld_, commands_.quit);
  edge(kToggleBoxesKey, f1Held_, commands_.toggleBoxes);
  edge(kTogglePanelsKey, f2Held_, commands_.togglePanels);
  edge(kPauseKey, pHeld_, commands_.togglePause);
  edge(kStepKey, periodHeld_, commands_.stepFrame);
  edge(kResetRoundKey, f5Held_, commands_.resetRound);
}
