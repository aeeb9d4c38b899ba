#include <algorithm>
#include <vector>

#include "combat/CombatEngine.h"
#include "combat/DamageScaling.h"
#include "combat/Parry.h"
#include "ecs/World.h"

void CombatEngine::resolveContacts() {
  std::vector<EntityId> toDestroy;

  auto view = world_.registry.view<HitboxData>();
  for (auto entity : view) {
    if (world_.roundOver) {
      break;
    }
    auto& hb = view.get<HitboxData>(entity);
    const int attacker = world_.slotOf(hb.owner);
    if (attacker < 0) {
      toDestroy.push_back(entity);
      continue;
    }
    const int defender = 1 - attacker;
    const EntityId target = world_.fighter(defender);
    const auto* hurt = world_.registry.try_get<HurtboxData>(target);
    if (hurt == nullptr || !hurt->vulnerable || hb.alreadyHit(target)) {
      continue;
    }
    if (!boxesOverlap(hb.box, hurt->box)) {
      continue;
    }

    hb.hitTargets.push_back(target);
    const AttackData& attack = *hb.attack;
    const Vec2 pos = hb.box.center;

    const ParryResult parry = attack.guard == GuardType::Unblockable
                                  ? ParryResult::None
                                  : checkParry(combat(defender), cfg_.parry);
    if (parry != ParryResult::None) {
      applyParry(attacker, defender, parry == ParryResult::Red ? ParryType::Red : ParryType::Normal,
                 pos);
    } else if (canBlock(combat(defender), attack)) {
      applyBlock(attacker, defender, attack, pos);
    } else {
      applyHit(attacker, defender, attack, pos);
    }
    toDestroy.push_back(entity);
  }

  for (auto e : toDestroy) {
    if (world_.registry.valid(e)) {
      world_.destroy(e);
    }
  }
}

void CombatEngine::resolveThrows() {
  std::vector<EntityId> toDestroy;

  auto view = world_.registry.view<ThrowboxData>();
  for (auto entity : view) {
    const auto& tb = view.get<ThrowboxData>(entity);
    const int attacker = world_.slotOf(tb.owner);
    if (attacker < 0) {
      toDestroy.push_back(entity);
      continue;
    }
    const int defender = 1 - attacker;
    const auto* hurt = world_.registry.try_get<HurtboxData>(world_.fighter(defender));
    if (hurt == nullptr || !hurt->vulnerable || !boxesOverlap(tb.box, hurt->box)) {
      continue;
    }

    PlayerCombatData& def = combat(defender);
    // Stunned fighters cannot be thrown.
    if (def.state == CombatState::Hitstun || def.state == CombatState::Blockstun ||
        def.state == CombatState::Knockdown || def.state == CombatState::KO) {
      continue;
    }

    const Vec2 pos = tb.box.center;
    toDestroy.push_back(entity);
    if (def.techWindow > 0) {
      def.techWindow = 0;
      world_.events.enqueue(TechEvent{defender, attacker, pos});
      continue;
    }
    applyHit(attacker, defender, *tb.attack, pos);
  }

  for (auto e : toDestroy) {
    world_.destroy(e);
  }
}

bool CombatEngine::canBlock(const PlayerCombatData& defender, const AttackData& attack) const {
  if (!defender.blocking) {
    return false;
  }
  switch (attack.guard) {
    case GuardType::Mid:
      return true;
    case GuardType::High:
      return !defender.crouching;
    case GuardType::Low:
      return defender.crouching;
    case GuardType::Unblockable:
      return false;
  }
  return false;
}

void CombatEngine::applyParry(int attacker, int defender, ParryType type, Vec2 pos) {
  PlayerCombatData& att = combat(attacker);
  PlayerCombatData& def = combat(defender);

  const int adv = type == ParryType::Red ? cfg_.parry.redAdvantage : cfg_.parry.advantage;
  def.hitstun = 0;
  def.blockstun = 0;
  def.parryWindow = 0;
  def.parryRecovery = cfg_.parry.recovery;
  def.advantage = adv;
  att.advantage = -adv;
  addMeter(defender, cfg_.parry.meterGain);

  Fighter& f = fighter(defender);
  f.health = std::min(f.maxHealth, f.health + cfg_.parry.healthGain);

  enterState(defender, CombatState::Neutral);
  ++world_.parryEvents;
  world_.events.enqueue(ParryEvent{defender, attacker, type, pos});
}

void CombatEngine::applyBlock(int attacker, int defender, const AttackData& attack, Vec2 pos) {
  PlayerCombatData& att = combat(attacker);
  PlayerCombatData& def = combat(defender);

  def.hitstun = 0;
  def.blockstun = blockstunFrames(attack, cfg_.stun);
  def.advantage = -attack.blockAdvantage;
  att.advantage = attack.blockAdvantage;
  enterState(defender, CombatState::Blockstun);

  int chip = chipDamage(attack, cfg_.block);
  if (!cfg_.block.chipKo) {
    chip = std::min(chip, std::max(0, fighter(defender).health - 1));
  }

  ++world_.blockEvents;
  world_.events.enqueue(BlockEvent{defender, attacker, chip, pos});
  if (chip > 0) {
    dealDamage(defender, chip, DamageType::Chip);
  }
}

void CombatEngine::applyHit(int attacker, int defender, const AttackData& attack, Vec2 pos) {
  PlayerCombatData& att = combat(attacker);
  PlayerCombatData& def = combat(defender);

  // Hit during the defender's own startup.
  const bool counter = def.activeMove != nullptr &&
                       (def.state == CombatState::Attacking ||
                        def.state == CombatState::SpecialMove) &&
                       def.moveFrame <= def.activeMove->attack.startup;

  int damage = scaledDamage(attack.damage, att.comboCount, cfg_.scaling);
  if (counter) {
    damage = floorScaled(damage, cfg_.hit.counterMultiplier);
  }

  ++world_.hitEvents;
  world_.events.enqueue(HitEvent{attacker, defender, damage, pos, &attack});

  att.comboCount = std::min(att.comboCount + 1, cfg_.combo.maxLength);
  att.comboDamage += damage;
  att.comboDecayTimer = cfg_.combo.decayFrames;
  lastComboHitFrame_[static_cast<std::size_t>(attacker)] = frame_;
  world_.events.enqueue(ComboEvent{attacker, att.comboCount, att.comboDamage});
  addMeter(attacker, static_cast<float>(attack.meterGain));

  interrupt(defender);
  def.hitstun = hitstunFrames(attack, cfg_.stun);
  def.blockstun = 0;
  def.advantage = -attack.hitAdvantage;
  att.advantage = attack.hitAdvantage;
  if (attack.knockdown) {
    def.knockdown = cfg_.stun.knockdownFrames;
    enterState(defender, CombatState::Knockdown);
  } else {
    enterState(defender, CombatState::Hitstun);
  }

  dealDamage(defender, damage, counter ? DamageType::Counter : DamageType::Normal);
}
