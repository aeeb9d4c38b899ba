#include "core/MatchData.h"

#include <cstdio>

static bool loadCharacter(const std::string& path, CharacterConfig& out) {
  if (out.loadFromToml(path.c_str())) {
    return true;
  }
  std::printf("Character load failed: %s\n", path.c_str());
  for (const std::string& err : out.errors) {
    std::printf("  %s\n", err.c_str());
  }
  return false;
}

bool loadMatchData(const MatchPaths& paths, MatchData& out) {
  out.combat = CombatConfig{};
  if (!paths.combat.empty() && !out.combat.loadFromToml(paths.combat.c_str())) {
    std::printf("Combat config load failed: %s (using defaults)\n", paths.combat.c_str());
    out.combat = CombatConfig{};
  }

  out.p1 = CharacterConfig{};
  out.p2 = CharacterConfig{};
  if (!loadCharacter(paths.p1, out.p1) || !loadCharacter(paths.p2, out.p2)) {
    return false;
  }
  std::printf("Loaded %s (%zu moves), %s (%zu moves)\n", paths.p1.c_str(), out.p1.moves.size(),
              paths.p2.c_str(), out.p2.moves.size());
  return true;
}
