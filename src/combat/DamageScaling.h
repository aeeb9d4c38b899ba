#pragma once

#include "combat/CombatConfig.h"
#include "combat/MoveData.h"

// floor(value * factor), tolerant of float config values like 0.9F.
int floorScaled(int value, double factor);

// Damage of the hit that lands while the attacker's combo already counts `comboCount` hits.
int scaledDamage(int baseDamage, int comboCount, const CombatConfig::Scaling& cfg);

// Scaling factor for that hit; never increases as comboCount grows.
double scalingFactor(int comboCount, const CombatConfig::Scaling& cfg);

int hitstunFrames(const AttackData& attack, const CombatConfig::Stun& cfg);
int blockstunFrames(const AttackData& attack, const CombatConfig::Stun& cfg);
int chipDamage(const AttackData& attack, const CombatConfig::Block& cfg);
