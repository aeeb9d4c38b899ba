#include "combat/Parry.h"

bool canAttemptParry(const PlayerCombatData& defender) {
  if (defender.parryRecovery > 0) {
    return false;
  }
  switch (defender.state) {
    case CombatState::Neutral:
    case CombatState::Blocking:
    case CombatState::Blockstun:
    case CombatState::Parrying:
      return true;
    case CombatState::Attacking:
    case CombatState::Hitstun:
    case CombatState::SpecialMove:
    case CombatState::Knockdown:
    case CombatState::KO:
      return false;
  }
  return false;
}

ParryResult checkParry(const PlayerCombatData& defender, const CombatConfig::Parry& cfg) {
  if (!cfg.enabled || defender.parryWindow <= 0) {
    return ParryResult::None;
  }
  if (defender.state == CombatState::Blockstun) {
    if (cfg.redEnabled && defender.parryWindow <= cfg.redWindow) {
      return ParryResult::Red;
    }
    return ParryResult::None;
  }
  const bool open = defender.state == CombatState::Neutral ||
                    defender.state == CombatState::Blocking ||
                    defender.state == CombatState::Parrying;
  return open ? ParryResult::Normal : ParryResult::None;
}
