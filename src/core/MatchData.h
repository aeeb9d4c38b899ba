#pragma once

#include <string>

#include "character/CharacterConfig.h"
#include "combat/CombatConfig.h"

struct MatchPaths {
  std::string combat = "data/combat.toml";
  std::string p1 = "data/characters/kaito.toml";
  std::string p2 = "data/characters/rena.toml";
};

// Everything a Simulation borrows. Keep it at a stable address for the simulation's lifetime.
struct MatchData {
  CombatConfig combat;
  CharacterConfig p1;
  CharacterConfig p2;
};

// Loads all three files. A missing combat file falls back to defaults with a warning; a
// character that fails to load is fatal.
bool loadMatchData(const MatchPaths& paths, MatchData& out);
