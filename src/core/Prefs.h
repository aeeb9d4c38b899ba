#pragma once

#include <string>

#include "input/InputAggregator.h"

// Per-user session state kept in SDL's pref path between runs.
struct SessionPrefs {
  std::string combatPath;
  std::string p1Path;
  std::string p2Path;
  SocdPolicy socd = SocdPolicy::Neutral;
  bool hasSocd = false;  // false until a saved policy was read
  int gamepadDeadzone = 8000;
  bool showBoxes = true;
  bool panelsOpen = true;
};

bool loadSessionPrefs(SessionPrefs& out);
bool saveSessionPrefs(const SessionPrefs& prefs);
// Removes the saved session and the inspector layout.
bool deleteSessionPrefs();
