#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

// ImGui integration is optional and should remain a debug-only layer.
// Builds without ImGui support provide a no-op implementation.

struct DebugUIFighterModel {
  std::string name;
  std::string state;
  std::string move;
  std::string stick;  // numpad notation
  int moveFrame = 0;
  int health = 0;
  int maxHealth = 0;
  float meter = 0.0F;
  float maxMeter = 0.0F;
  int hitstun = 0;
  int blockstun = 0;
  int knockdown = 0;
  int parryWindow = 0;
  int parryRecovery = 0;
  int techWindow = 0;
  int comboCount = 0;
  int comboDamage = 0;
  int advantage = 0;
  int facingX = 1;
  float x = 0.0F;
  bool blocking = false;
  bool crouching = false;
  bool invulnerable = false;
};

struct DebugUIInspectorModel {
  uint64_t tick = 0;
  bool paused = false;
  bool showBoxes = true;
  int socd = 0;  // 0 = neutral, 1 = last
  int freezeFrames = 0;
  bool roundOver = false;
  int winner = -1;
  int hitEvents = 0;
  int blockEvents = 0;
  int parryEvents = 0;
  std::array<DebugUIFighterModel, 2> fighters{};
  const std::deque<std::string>* eventLog = nullptr;
  const std::vector<std::string>* legend = nullptr;
};

struct DebugUIActions {
  bool quit = false;
  bool resetRound = false;
  bool setPaused = false;
  bool paused = false;
  int stepFrames = 0;
  bool setShowBoxes = false;
  bool showBoxes = true;
  bool setSocd = false;
  int socd = 0;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  static bool available();
  bool initialized() const { return initialized_; }

  bool wantCaptureKeyboard() const;

  DebugUIActions drawInspector(const DebugUIInspectorModel& model);

 private:
  bool initialized_ = false;
  std::string iniPath_;
};
