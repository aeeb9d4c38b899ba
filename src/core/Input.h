#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "input/InputAggregator.h"
#include "input/InputSnapshot.h"

struct AppCommands {
  bool quit = false;
  bool resetRound = false;
  bool toggleBoxes = false;
  bool togglePanels = false;
  bool togglePause = false;
  bool stepFrame = false;
};

// SDL keyboard and gamepads mapped onto per-player device state.
class Input {
 public:
  static constexpr int kPlayers = 2;
  using PlayerDevices = std::array<InputAggregator::Devices, kPlayers>;

  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  // Current held state; edges are derived by each player's aggregator.
  [[nodiscard]] PlayerDevices devices() const;

  [[nodiscard]] bool hasGamepad(int slot) const;
  [[nodiscard]] const char* gamepadName(int slot) const;
  [[nodiscard]] int gamepadDeadzone() const { return axisDeadzone_; }
  void setGamepadDeadzone(int deadzone);
  void appendLegend(std::vector<std::string>& out) const;

  // Consume non-gameplay commands (quit/debug toggles).
  AppCommands consumeCommands();

 private:
  struct Pad {
    SDL_Gamepad* handle = nullptr;
    uint32_t id = 0;
    int axisX = 0;
    int axisY = 0;
    bool dpadLeft = false;
    bool dpadRight = false;
    bool dpadUp = false;
    bool dpadDown = false;
    std::array<bool, kButtonCount> buttons{};
  };

  void updateCommands();
  void openGamepad(SDL_JoystickID id);
  void tryOpenGamepads();
  Pad* findPad(SDL_JoystickID id);
  [[nodiscard]] DeviceState keyboardState(int slot) const;
  [[nodiscard]] DeviceState padState(const Pad& pad) const;

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  std::array<Pad, kPlayers> pads_{};
  AppCommands commands_{};
  int axisDeadzone_ = 8000;

  bool f1Held_ = false;
  bool f2Held_ = false;
  bool pHeld_ = false;
  bool periodHeld_ = false;
  bool escHeld_ = false;
  bool f5Held_ = false;
};
