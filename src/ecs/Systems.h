#pragma once

#include "combat/CombatConfig.h"

class World;

// Per-tick passes over the box entities. Run in this order by CombatEngine::tick.
namespace Systems {

void hurtboxes(World& w);
void hitboxes(World& w);
void projectiles(World& w, const CombatConfig& cfg);
void pushBoxes(World& w, const CombatConfig& cfg);
// Counts down active frames and drops boxes that ran out.
void retireBoxes(World& w);

}  // namespace Systems
