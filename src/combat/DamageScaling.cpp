#include "combat/DamageScaling.h"

#include <algorithm>
#include <cmath>

int floorScaled(int value, double factor) {
  constexpr double kEpsilon = 1e-4;
  return static_cast<int>(std::floor((static_cast<double>(value) * factor) + kEpsilon));
}

double scalingFactor(int comboCount, const CombatConfig::Scaling& cfg) {
  const int n = comboCount + 1;  // this hit's number within the combo
  if (!cfg.enabled || n < cfg.start) {
    return 1.0;
  }
  const double factor = std::pow(static_cast<double>(cfg.rate), n - cfg.start);
  return std::max(factor, static_cast<double>(cfg.minimum));
}

int scaledDamage(int baseDamage, int comboCount, const CombatConfig::Scaling& cfg) {
  if (baseDamage <= 0) {
    return 0;
  }
  const int scaled = floorScaled(baseDamage, scalingFactor(comboCount, cfg));
  const int minimum = cfg.enabled ? floorScaled(baseDamage, cfg.minimum) : 0;
  return std::max(scaled, minimum);
}

int hitstunFrames(const AttackData& attack, const CombatConfig::Stun& cfg) {
  if (attack.hitstun > 0) {
    return attack.hitstun;
  }
  return floorScaled(cfg.hitstunBase, cfg.hitstunScaling);
}

int blockstunFrames(const AttackData& attack, const CombatConfig::Stun& cfg) {
  if (attack.blockstun > 0) {
    return attack.blockstun;
  }
  return floorScaled(cfg.blockstunBase, cfg.blockstunScaling);
}

int chipDamage(const AttackData& attack, const CombatConfig::Block& cfg) {
  return std::max(0, floorScaled(attack.damage, cfg.chipRatio));
}
