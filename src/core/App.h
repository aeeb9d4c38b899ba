#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <memory>
#include <string>
#include <vector>

#include "core/DebugUI.h"
#include "core/EventLog.h"
#include "core/FixedStep.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/MatchData.h"
#include "core/Prefs.h"
#include "core/Simulation.h"
#include "ecs/Components.h"

struct AppConfig {
  const char* title = "framelock";
  int width = 1280;
  int height = 720;
  int maxFrames = -1;
  const char* combatTomlPath = nullptr;
  const char* p1TomlPath = nullptr;
  const char* p2TomlPath = nullptr;
  const char* inputScriptTomlPath = nullptr;
  const char* socd = nullptr;
  bool noPrefs = false;
  bool logEvents = false;
  const char* argv0 = nullptr;
};

class App {
 public:
  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

 private:
  void handleEvent(const SDL_Event& e);
  void handleCommands(const AppCommands& cmds);
  void applyUiActions(const DebugUIActions& actions);
  void stepSimulation();
  void resetRound();
  void setSocd(SocdPolicy policy);
  void savePrefs() const;

  void render();
  void renderStage(int viewW, int viewH);
  void renderBoxes();
  void renderHud(int viewW);
  void fillBox(const Box& box, SDL_Color color, bool outlineOnly);
  [[nodiscard]] DebugUIInspectorModel inspectorModel() const;

  // Stage units to pixels, y up.
  [[nodiscard]] SDL_FPoint toScreen(float x, float y) const;

  AppConfig cfg_{};
  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool running_ = true;

  Input input_;
  DebugUI debugUi_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;

  std::unique_ptr<MatchData> match_;
  std::unique_ptr<Simulation> sim_;
  std::unique_ptr<EventLog> log_;
  FixedStep clock_;

  SessionPrefs prefs_;
  bool prefsEnabled_ = true;
  bool showBoxes_ = true;
  bool panelsOpen_ = true;
  bool uiCaptureKeyboard_ = false;
  bool simPaused_ = false;
  int pendingSimSteps_ = 0;

  float viewScale_ = 1.0F;
  float viewOffsetX_ = 0.0F;
  float groundY_ = 0.0F;

  std::vector<std::string> legend_;
};
