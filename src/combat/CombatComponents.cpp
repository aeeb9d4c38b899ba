#include "combat/CombatComponents.h"

#include <algorithm>

#include "combat/CombatEvents.h"

const char* combatStateName(CombatState state) {
  switch (state) {
    case CombatState::Neutral:
      return "neutral";
    case CombatState::Attacking:
      return "attacking";
    case CombatState::Blocking:
      return "blocking";
    case CombatState::Hitstun:
      return "hitstun";
    case CombatState::Blockstun:
      return "blockstun";
    case CombatState::SpecialMove:
      return "special_move";
    case CombatState::Parrying:
      return "parrying";
    case CombatState::Knockdown:
      return "knockdown";
    case CombatState::KO:
      return "ko";
  }
  return "neutral";
}

bool HitboxData::alreadyHit(EntityId e) const {
  return std::ranges::find(hitTargets, e) != hitTargets.end();
}

const char* parryTypeName(ParryType type) {
  return type == ParryType::Red ? "red" : "normal";
}

const char* damageTypeName(DamageType type) {
  switch (type) {
    case DamageType::Normal:
      return "normal";
    case DamageType::Chip:
      return "chip";
    case DamageType::Counter:
      return "counter";
  }
  return "normal";
}
