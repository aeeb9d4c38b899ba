#pragma once

#include <cstdint>

#include "combat/CombatComponents.h"
#include "combat/CombatConfig.h"

enum class ParryResult : std::uint8_t { None, Normal, Red };

// Whether the defender may arm a new parry window this tick.
bool canAttemptParry(const PlayerCombatData& defender);

// Evaluated when a hitbox first touches the defender. Red parries only exist during blockstun
// and only in the tail of the window; outside it a blockstun parry fails outright.
ParryResult checkParry(const PlayerCombatData& defender, const CombatConfig::Parry& cfg);
